#pragma once

#include "../core/media.hpp"
#include "../session/session.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>
#include <vector>

namespace cue::cli {

// One-line JSON answers for the serve protocol and the one-shot commands.
class JsonOutput {
public:
  static std::string create_success(const std::string &message) {
    rapidjson::Document doc;
    doc.SetObject();
    auto &allocator = doc.GetAllocator();

    doc.AddMember("success", true, allocator);
    doc.AddMember("message", rapidjson::Value(message.c_str(), allocator), allocator);

    return document_to_string(doc);
  }

  static std::string create_error(const std::string &error) {
    rapidjson::Document doc;
    doc.SetObject();
    auto &allocator = doc.GetAllocator();

    doc.AddMember("success", false, allocator);
    doc.AddMember("error", rapidjson::Value(error.c_str(), allocator), allocator);

    return document_to_string(doc);
  }

  static std::string create_started(const SessionStatus &status) {
    rapidjson::Document doc;
    doc.SetObject();
    auto &allocator = doc.GetAllocator();

    doc.AddMember("success", true, allocator);
    doc.AddMember("session", status.handle.id, allocator);
    doc.AddMember("path", rapidjson::Value(status.identity.path.c_str(), allocator),
                  allocator);
    doc.AddMember("title", rapidjson::Value(status.title.c_str(), allocator), allocator);
    doc.AddMember("start_offset", status.offset_honored ? status.start_offset : 0.0,
                  allocator);
    doc.AddMember("precision",
                  rapidjson::StringRef(precision_name(status.precision)), allocator);

    return document_to_string(doc);
  }

  static std::string create_status(const std::optional<SessionStatus> &status) {
    rapidjson::Document doc;
    doc.SetObject();
    auto &allocator = doc.GetAllocator();

    doc.AddMember("success", true, allocator);
    if (!status) {
      doc.AddMember("state", "idle", allocator);
      return document_to_string(doc);
    }

    doc.AddMember("session", status->handle.id, allocator);
    doc.AddMember("state", rapidjson::StringRef(session_state_name(status->state)),
                  allocator);
    doc.AddMember("path", rapidjson::Value(status->identity.path.c_str(), allocator),
                  allocator);
    doc.AddMember("title", rapidjson::Value(status->title.c_str(), allocator), allocator);
    doc.AddMember("precision",
                  rapidjson::StringRef(precision_name(status->precision)), allocator);
    if (status->last_position) {
      doc.AddMember("position", *status->last_position, allocator);
    } else {
      doc.AddMember("position", rapidjson::Value(rapidjson::kNullType), allocator);
    }

    rapidjson::Value warnings(rapidjson::kArrayType);
    for (const auto &warning : status->warnings) {
      warnings.PushBack(rapidjson::Value(warning.c_str(), allocator), allocator);
    }
    doc.AddMember("warnings", warnings, allocator);

    if (status->final_record) {
      doc.AddMember("record", record_value(*status->final_record, nullptr, allocator),
                    allocator);
    }

    return document_to_string(doc);
  }

  static std::string create_info(const std::optional<ResumeInfo> &info) {
    rapidjson::Document doc;
    doc.SetObject();
    auto &allocator = doc.GetAllocator();

    doc.AddMember("success", true, allocator);
    if (!info) {
      doc.AddMember("record", rapidjson::Value(rapidjson::kNullType), allocator);
      return document_to_string(doc);
    }
    const MediaMetadata *metadata = info->metadata ? &*info->metadata : nullptr;
    doc.AddMember("record", record_value(info->record, metadata, allocator), allocator);
    doc.AddMember("start_offset", info->start_offset(), allocator);

    return document_to_string(doc);
  }

  static std::string create_records(const std::vector<ResumeRecord> &records) {
    rapidjson::Document doc;
    doc.SetObject();
    auto &allocator = doc.GetAllocator();

    rapidjson::Value list(rapidjson::kArrayType);
    for (const auto &record : records) {
      list.PushBack(record_value(record, nullptr, allocator), allocator);
    }

    doc.AddMember("success", true, allocator);
    doc.AddMember("records", list, allocator);
    doc.AddMember("count", static_cast<int>(records.size()), allocator);

    return document_to_string(doc);
  }

  static std::string create_metadata(const std::string &path,
                                     const MediaMetadata &metadata) {
    rapidjson::Document doc;
    doc.SetObject();
    auto &allocator = doc.GetAllocator();

    doc.AddMember("success", true, allocator);
    doc.AddMember("path", rapidjson::Value(path.c_str(), allocator), allocator);
    doc.AddMember("metadata", metadata_value(metadata, allocator), allocator);

    return document_to_string(doc);
  }

private:
  static rapidjson::Value metadata_value(const MediaMetadata &metadata,
                                         rapidjson::Document::AllocatorType &allocator) {
    rapidjson::Value value(rapidjson::kObjectType);
    value.AddMember("title", rapidjson::Value(metadata.clean_title.c_str(), allocator),
                    allocator);
    if (metadata.season_number) {
      value.AddMember("season", *metadata.season_number, allocator);
    } else {
      value.AddMember("season", rapidjson::Value(rapidjson::kNullType), allocator);
    }
    value.AddMember("locked", metadata.user_locked_title, allocator);
    return value;
  }

  static rapidjson::Value record_value(const ResumeRecord &record,
                                       const MediaMetadata *metadata,
                                       rapidjson::Document::AllocatorType &allocator) {
    rapidjson::Value value(rapidjson::kObjectType);
    value.AddMember("path", rapidjson::Value(record.identity.path.c_str(), allocator),
                    allocator);
    if (record.identity.kind == MediaIdentity::Kind::FolderEntry) {
      value.AddMember("folder",
                      rapidjson::Value(record.identity.folder.c_str(), allocator),
                      allocator);
    }
    value.AddMember("position", record.position_seconds, allocator);
    value.AddMember("duration", record.duration_seconds, allocator);
    value.AddMember("finished", record.finished, allocator);
    int64_t updated = std::chrono::duration_cast<std::chrono::milliseconds>(
                          record.updated_at.time_since_epoch())
                          .count();
    value.AddMember("updated_at", updated, allocator);
    if (metadata) {
      value.AddMember("metadata", metadata_value(*metadata, allocator), allocator);
    }
    return value;
  }

  static std::string document_to_string(const rapidjson::Document &doc) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
  }
};

} // namespace cue::cli
