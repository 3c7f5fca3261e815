#pragma once

#include "position_store.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>

namespace cue {

// Non-durable store, used by `cue serve --ephemeral` and by tests.
class MemoryPositionStore : public PositionStore {
private:
  mutable std::shared_mutex store_mutex;
  std::map<std::string, ResumeRecord> records;
  std::map<std::string, FolderRecord> folders;
  std::map<std::string, MediaMetadata> metadata;

public:
  std::optional<ResumeRecord> lookup(const MediaIdentity &identity) const override {
    std::shared_lock<std::shared_mutex> lock(store_mutex);
    auto it = records.find(identity.key());
    if (it == records.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void commit(const ResumeRecord &record) override {
    std::unique_lock<std::shared_mutex> lock(store_mutex);
    records[record.identity.key()] = record;
  }

  std::vector<ResumeRecord> list_all() const override {
    std::vector<ResumeRecord> result;
    {
      std::shared_lock<std::shared_mutex> lock(store_mutex);
      for (const auto &[key, record] : records) {
        result.push_back(record);
      }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const ResumeRecord &a, const ResumeRecord &b) {
                       return a.updated_at > b.updated_at;
                     });
    return result;
  }

  std::optional<FolderRecord> lookup_folder(const std::string &folder) const override {
    std::shared_lock<std::shared_mutex> lock(store_mutex);
    auto it = folders.find(folder);
    if (it == folders.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void commit_folder(const FolderRecord &record) override {
    std::unique_lock<std::shared_mutex> lock(store_mutex);
    folders[record.folder] = record;
  }

  std::optional<MediaMetadata> lookup_metadata(const MediaIdentity &identity) const override {
    std::shared_lock<std::shared_mutex> lock(store_mutex);
    auto it = metadata.find(identity.key());
    if (it == metadata.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void commit_metadata(const MediaIdentity &identity,
                       const MediaMetadata &value) override {
    std::unique_lock<std::shared_mutex> lock(store_mutex);
    metadata[identity.key()] = value;
  }

  bool remove(const std::string &normalized_path) override {
    std::unique_lock<std::shared_mutex> lock(store_mutex);
    size_t erased = records.erase(normalized_path);
    erased += folders.erase(normalized_path);
    erased += metadata.erase(normalized_path);
    return erased > 0;
  }
};

} // namespace cue
