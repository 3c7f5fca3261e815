#include "folder_resolver.hpp"
#include "../common/log.hpp"
#include "../core/errors.hpp"
#include "media_scanner.hpp"

#include <algorithm>

namespace cue {

FolderResolution FolderResolver::resolve(const std::string &folder_path) const {
  FolderResolution resolution;
  resolution.folder = normalize_path(folder_path);
  resolution.entries = list_playable_entries(
      resolution.folder, settings.extensions, settings.recursive);

  if (resolution.entries.empty()) {
    throw CueError(ErrorCode::NoPlayableEntries,
                   resolution.folder + " has no playable files");
  }

  auto record_for = [this, &resolution](const std::string &entry) {
    return store.lookup(MediaIdentity{MediaIdentity::Kind::FolderEntry, entry,
                                      resolution.folder});
  };
  auto choose = [&resolution](size_t index, std::optional<ResumeRecord> record) {
    resolution.index = index;
    resolution.entry = resolution.entries[index];
    resolution.record = std::move(record);
  };

  // 1. The entry the user was last watching, if still there and unfinished.
  if (auto folder_record = store.lookup_folder(resolution.folder)) {
    auto it = std::find(resolution.entries.begin(), resolution.entries.end(),
                        folder_record->selected_entry);
    if (it != resolution.entries.end()) {
      auto record = record_for(*it);
      if (!record || !record->finished) {
        choose(static_cast<size_t>(it - resolution.entries.begin()), record);
        log::debug("Resolver", "{}: continuing selected entry {}",
                   resolution.folder, resolution.entry);
        return resolution;
      }
    } else {
      log::info("Resolver", "{}: {} is gone, picking the next unfinished entry",
                resolution.folder, folder_record->selected_entry);
    }
  }

  // 2. First entry never played or not finished.
  for (size_t i = 0; i < resolution.entries.size(); ++i) {
    auto record = record_for(resolution.entries[i]);
    if (!record || !record->finished) {
      choose(i, record);
      return resolution;
    }
  }

  // 3. Everything watched: hand back the first entry and let the caller
  // decide whether to restart.
  choose(0, record_for(resolution.entries[0]));
  log::info("Resolver", "{}: every entry is finished", resolution.folder);
  return resolution;
}

} // namespace cue
