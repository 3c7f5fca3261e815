#include "json_position_store.hpp"
#include "../common/log.hpp"
#include "../common/paths.hpp"
#include "../core/errors.hpp"
#include "rapidjson/document.h"
#include "rapidjson/filereadstream.h"
#include "rapidjson/filewritestream.h"
#include "rapidjson/prettywriter.h"
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <mutex>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace cue {

namespace {

constexpr int kStoreVersion = 1;

double number_or_zero(const rapidjson::Value &obj, const char *key) {
  if (obj.HasMember(key) && obj[key].IsNumber()) {
    double value = obj[key].GetDouble();
    return value > 0 ? value : 0.0;
  }
  return 0.0;
}

std::string string_or_empty(const rapidjson::Value &obj, const char *key) {
  if (obj.HasMember(key) && obj[key].IsString()) {
    return obj[key].GetString();
  }
  return "";
}

rapidjson::Value make_string(const std::string &text,
                             rapidjson::Document::AllocatorType &allocator) {
  return rapidjson::Value(text.c_str(),
                          static_cast<rapidjson::SizeType>(text.size()),
                          allocator);
}

long long to_epoch_ms(Clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

Clock::time_point from_epoch_ms(long long ms) {
  return Clock::time_point(std::chrono::milliseconds(ms));
}

#ifndef _WIN32
void sync_directory(const std::string &dir) {
  int fd = ::open(dir.c_str(), O_RDONLY);
  if (fd < 0) {
    return;
  }
  ::fsync(fd);
  ::close(fd);
}
#endif

} // namespace

JsonPositionStore::JsonPositionStore(std::string storage_file)
    : storage_file(std::move(storage_file)) {
  load_from_file();
}

void JsonPositionStore::load_from_file() {
  std::error_code ec;
  if (!fs::exists(storage_file, ec)) {
    return;
  }

  FILE *inFile = fopen(storage_file.c_str(), "rb");
  if (!inFile) {
    log::error("Store", "cannot open {}: {}", storage_file, strerror(errno));
    return;
  }

  char readBuffer[65536];
  rapidjson::FileReadStream is(inFile, readBuffer, sizeof(readBuffer));
  rapidjson::Document doc;
  doc.ParseStream(is);
  fclose(inFile);

  if (doc.HasParseError() || !doc.IsObject()) {
    std::string aside = storage_file + ".corrupt";
    fs::rename(storage_file, aside, ec);
    log::error("Store", "{} is not a valid store, moved to {}", storage_file,
               aside);
    return;
  }

  if (doc.HasMember("records") && doc["records"].IsObject()) {
    for (const auto &member : doc["records"].GetObject()) {
      const auto &data = member.value;
      if (!data.IsObject()) {
        continue;
      }
      ResumeRecord record;
      record.identity.path = member.name.GetString();
      record.identity.folder = string_or_empty(data, "folder");
      record.identity.kind = string_or_empty(data, "kind") == "folder_entry"
                                 ? MediaIdentity::Kind::FolderEntry
                                 : MediaIdentity::Kind::File;
      record.position_seconds = number_or_zero(data, "position");
      record.duration_seconds = number_or_zero(data, "duration");
      record.finished = data.HasMember("finished") && data["finished"].IsBool() &&
                        data["finished"].GetBool();
      if (data.HasMember("updated_at") && data["updated_at"].IsInt64()) {
        record.updated_at = from_epoch_ms(data["updated_at"].GetInt64());
      }
      image.records[record.identity.key()] = record;
    }
  }

  if (doc.HasMember("folders") && doc["folders"].IsObject()) {
    for (const auto &member : doc["folders"].GetObject()) {
      if (!member.value.IsObject()) {
        continue;
      }
      FolderRecord folder;
      folder.folder = member.name.GetString();
      folder.selected_entry = string_or_empty(member.value, "selected");
      if (!folder.selected_entry.empty()) {
        image.folders[folder.folder] = folder;
      }
    }
  }

  if (doc.HasMember("metadata") && doc["metadata"].IsObject()) {
    for (const auto &member : doc["metadata"].GetObject()) {
      const auto &data = member.value;
      if (!data.IsObject()) {
        continue;
      }
      MediaMetadata meta;
      meta.clean_title = string_or_empty(data, "title");
      if (data.HasMember("season") && data["season"].IsInt()) {
        meta.season_number = data["season"].GetInt();
      }
      meta.user_locked_title = data.HasMember("locked") &&
                               data["locked"].IsBool() &&
                               data["locked"].GetBool();
      image.metadata[member.name.GetString()] = meta;
    }
  }

  log::debug("Store", "loaded {} records from {}", image.records.size(),
             storage_file);
}

void JsonPositionStore::save_to_file(const Image &snapshot) const {
  rapidjson::Document data;
  data.SetObject();
  auto &allocator = data.GetAllocator();
  data.AddMember("version", kStoreVersion, allocator);

  rapidjson::Value records(rapidjson::kObjectType);
  for (const auto &[key, record] : snapshot.records) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("kind",
                  rapidjson::StringRef(record.identity.kind ==
                                               MediaIdentity::Kind::FolderEntry
                                           ? "folder_entry"
                                           : "file"),
                  allocator);
    if (!record.identity.folder.empty()) {
      obj.AddMember("folder", make_string(record.identity.folder, allocator),
                    allocator);
    }
    obj.AddMember("position", record.position_seconds, allocator);
    obj.AddMember("duration", record.duration_seconds, allocator);
    obj.AddMember("finished", record.finished, allocator);
    obj.AddMember("updated_at",
                  static_cast<int64_t>(to_epoch_ms(record.updated_at)),
                  allocator);
    records.AddMember(make_string(key, allocator), obj, allocator);
  }
  data.AddMember("records", records, allocator);

  rapidjson::Value folders(rapidjson::kObjectType);
  for (const auto &[key, folder] : snapshot.folders) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("selected", make_string(folder.selected_entry, allocator),
                  allocator);
    folders.AddMember(make_string(key, allocator), obj, allocator);
  }
  data.AddMember("folders", folders, allocator);

  rapidjson::Value metadata(rapidjson::kObjectType);
  for (const auto &[key, meta] : snapshot.metadata) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("title", make_string(meta.clean_title, allocator), allocator);
    if (meta.season_number) {
      obj.AddMember("season", *meta.season_number, allocator);
    } else {
      obj.AddMember("season", rapidjson::Value(rapidjson::kNullType), allocator);
    }
    obj.AddMember("locked", meta.user_locked_title, allocator);
    metadata.AddMember(make_string(key, allocator), obj, allocator);
  }
  data.AddMember("metadata", metadata, allocator);

  std::string parent = fs::path(storage_file).parent_path().string();
  if (!parent.empty() && !paths::ensure_directory_exists(parent)) {
    throw CueError(ErrorCode::StoreWriteFailed, "cannot create " + parent);
  }

  std::string temp_file = storage_file + ".tmp";
  FILE *outFile = fopen(temp_file.c_str(), "wb");
  if (!outFile) {
    throw CueError(ErrorCode::StoreWriteFailed,
                   temp_file + ": " + strerror(errno));
  }

  char writeBuffer[65536];
  rapidjson::FileWriteStream os(outFile, writeBuffer, sizeof(writeBuffer));
  rapidjson::PrettyWriter<rapidjson::FileWriteStream> writer(os);
  bool written = data.Accept(writer);
  os.Flush();

  bool flushed = fflush(outFile) == 0 && !ferror(outFile);
#ifndef _WIN32
  flushed = flushed && ::fsync(fileno(outFile)) == 0;
#endif
  int saved_errno = errno;
  bool closed = fclose(outFile) == 0;

  if (!written || !flushed || !closed) {
    std::error_code ignored;
    fs::remove(temp_file, ignored);
    throw CueError(ErrorCode::StoreWriteFailed,
                   temp_file + ": " + strerror(saved_errno));
  }

  std::error_code ec;
  fs::rename(temp_file, storage_file, ec);
  if (ec) {
    fs::remove(temp_file, ec);
    throw CueError(ErrorCode::StoreWriteFailed,
                   storage_file + ": " + ec.message());
  }
#ifndef _WIN32
  sync_directory(parent.empty() ? "." : parent);
#endif
}

std::optional<ResumeRecord>
JsonPositionStore::lookup(const MediaIdentity &identity) const {
  std::shared_lock<std::shared_mutex> lock(store_mutex);
  auto it = image.records.find(identity.key());
  if (it == image.records.end()) {
    return std::nullopt;
  }
  return it->second;
}

void JsonPositionStore::commit(const ResumeRecord &record) {
  std::unique_lock<std::shared_mutex> lock(store_mutex);
  Image next = image;
  next.records[record.identity.key()] = record;
  save_to_file(next);
  image = std::move(next);
}

std::vector<ResumeRecord> JsonPositionStore::list_all() const {
  std::vector<ResumeRecord> result;
  {
    std::shared_lock<std::shared_mutex> lock(store_mutex);
    result.reserve(image.records.size());
    for (const auto &[key, record] : image.records) {
      result.push_back(record);
    }
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const ResumeRecord &a, const ResumeRecord &b) {
                     return a.updated_at > b.updated_at;
                   });
  return result;
}

std::optional<FolderRecord>
JsonPositionStore::lookup_folder(const std::string &folder) const {
  std::shared_lock<std::shared_mutex> lock(store_mutex);
  auto it = image.folders.find(folder);
  if (it == image.folders.end()) {
    return std::nullopt;
  }
  return it->second;
}

void JsonPositionStore::commit_folder(const FolderRecord &record) {
  std::unique_lock<std::shared_mutex> lock(store_mutex);
  Image next = image;
  next.folders[record.folder] = record;
  save_to_file(next);
  image = std::move(next);
}

std::optional<MediaMetadata>
JsonPositionStore::lookup_metadata(const MediaIdentity &identity) const {
  std::shared_lock<std::shared_mutex> lock(store_mutex);
  auto it = image.metadata.find(identity.key());
  if (it == image.metadata.end()) {
    return std::nullopt;
  }
  return it->second;
}

void JsonPositionStore::commit_metadata(const MediaIdentity &identity,
                                        const MediaMetadata &metadata) {
  std::unique_lock<std::shared_mutex> lock(store_mutex);
  Image next = image;
  next.metadata[identity.key()] = metadata;
  save_to_file(next);
  image = std::move(next);
}

bool JsonPositionStore::remove(const std::string &normalized_path) {
  std::unique_lock<std::shared_mutex> lock(store_mutex);
  Image next = image;
  size_t erased = next.records.erase(normalized_path);
  erased += next.folders.erase(normalized_path);
  erased += next.metadata.erase(normalized_path);
  if (erased == 0) {
    return false;
  }
  save_to_file(next);
  image = std::move(next);
  return true;
}

} // namespace cue
