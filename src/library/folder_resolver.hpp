#pragma once

#include "../core/config/settings.hpp"
#include "../core/media.hpp"
#include "../storage/position_store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cue {

struct FolderResolution {
  std::string folder; // normalized
  std::string entry;  // normalized
  std::optional<ResumeRecord> record;
  size_t index = 0; // position of `entry` in `entries`
  std::vector<std::string> entries;
};

// Decides where playback of a folder continues. Read only: it never writes
// to the store.
class FolderResolver {
public:
  FolderResolver(const PositionStore &store, Settings settings)
      : store(store), settings(std::move(settings)) {}

  // Throws CueError(NoPlayableEntries | InvalidIdentity).
  FolderResolution resolve(const std::string &folder_path) const;

private:
  const PositionStore &store;
  Settings settings;
};

} // namespace cue
