#pragma once

#include "../core/media.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cue {

// Durable map from media identity to resume state. Implementations are
// thread-safe: commits are serialized and a reader only ever sees whole
// records. A commit that throws CueError(StoreWriteFailed) leaves the
// previous state visible.
class PositionStore {
public:
  virtual ~PositionStore() = default;

  virtual std::optional<ResumeRecord> lookup(const MediaIdentity &identity) const = 0;
  virtual void commit(const ResumeRecord &record) = 0;

  // Newest first.
  virtual std::vector<ResumeRecord> list_all() const = 0;
  virtual std::vector<ResumeRecord> list_finished() const;

  virtual std::optional<FolderRecord> lookup_folder(const std::string &folder) const = 0;
  virtual void commit_folder(const FolderRecord &record) = 0;

  virtual std::optional<MediaMetadata> lookup_metadata(const MediaIdentity &identity) const = 0;
  virtual void commit_metadata(const MediaIdentity &identity,
                               const MediaMetadata &metadata) = 0;

  // Explicit user action only. Drops the record, its metadata and a folder
  // record keyed by the same path. Returns false if nothing was stored.
  virtual bool remove(const std::string &normalized_path) = 0;
};

inline std::vector<ResumeRecord> PositionStore::list_finished() const {
  std::vector<ResumeRecord> finished;
  for (auto &record : list_all()) {
    if (record.finished) {
      finished.push_back(std::move(record));
    }
  }
  return finished;
}

} // namespace cue
