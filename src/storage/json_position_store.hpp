#pragma once

#include "position_store.hpp"
#include <map>
#include <shared_mutex>
#include <string>

namespace cue {

// Store backed by one JSON document on disk. Every mutation rewrites the
// file through a temporary sibling, fsync and rename; the in-memory image
// is updated only after the rename succeeded.
class JsonPositionStore : public PositionStore {
public:
  // Loads `storage_file` if present. An unparsable file is moved aside to
  // "<file>.corrupt" and the store starts empty.
  explicit JsonPositionStore(std::string storage_file);

  std::optional<ResumeRecord> lookup(const MediaIdentity &identity) const override;
  void commit(const ResumeRecord &record) override;
  std::vector<ResumeRecord> list_all() const override;

  std::optional<FolderRecord> lookup_folder(const std::string &folder) const override;
  void commit_folder(const FolderRecord &record) override;

  std::optional<MediaMetadata> lookup_metadata(const MediaIdentity &identity) const override;
  void commit_metadata(const MediaIdentity &identity,
                       const MediaMetadata &metadata) override;

  bool remove(const std::string &normalized_path) override;

  const std::string &path() const { return storage_file; }

private:
  struct Image {
    std::map<std::string, ResumeRecord> records;
    std::map<std::string, FolderRecord> folders;
    std::map<std::string, MediaMetadata> metadata;
  };

  void load_from_file();
  // Throws CueError(StoreWriteFailed).
  void save_to_file(const Image &image) const;

  std::string storage_file;
  mutable std::shared_mutex store_mutex;
  Image image;
};

} // namespace cue
