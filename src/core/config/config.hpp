#pragma once

#include "../../common/log.hpp"
#include "../../common/paths.hpp"
#include "settings.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>
#include <vector>

namespace cue {

class Config {
private:
  rapidjson::Document config;
  std::string config_path;
  mutable std::mutex config_mutex;

  void create_default_config() {
    config.SetObject();
    auto &allocator = config.GetAllocator();
    const Settings defaults;

    // Player section
    rapidjson::Value player(rapidjson::kObjectType);
    player.AddMember("mode", "precise", allocator);
    // Empty: "mpv" in precise mode, "vlc" in coarse mode.
    player.AddMember("executable", "", allocator);
    player.AddMember("ipc_socket", "", allocator);
    player.AddMember("start_offset_arg",
                     rapidjson::Value(defaults.start_offset_arg.c_str(), allocator),
                     allocator);
    player.AddMember("extra_args", rapidjson::Value(rapidjson::kArrayType),
                     allocator);
    config.AddMember("player", player, allocator);

    // Resume section
    rapidjson::Value resume(rapidjson::kObjectType);
    resume.AddMember("sample_interval_seconds", defaults.sample_interval_seconds,
                     allocator);
    resume.AddMember("completion_threshold", defaults.completion_threshold,
                     allocator);
    resume.AddMember("recursive", defaults.recursive, allocator);
    rapidjson::Value extensions(rapidjson::kArrayType);
    for (const auto &ext : defaults.extensions) {
      extensions.PushBack(rapidjson::Value(ext.c_str(), allocator), allocator);
    }
    resume.AddMember("extensions", extensions, allocator);
    config.AddMember("resume", resume, allocator);

    // IPC timings, milliseconds
    rapidjson::Value ipc(rapidjson::kObjectType);
    ipc.AddMember("connect_timeout_ms",
                  static_cast<int>(defaults.connect_timeout.count()), allocator);
    ipc.AddMember("query_timeout_ms",
                  static_cast<int>(defaults.query_timeout.count()), allocator);
    ipc.AddMember("position_freshness_ms",
                  static_cast<int>(defaults.position_freshness.count()),
                  allocator);
    ipc.AddMember("quit_timeout_ms",
                  static_cast<int>(defaults.quit_timeout.count()), allocator);
    config.AddMember("ipc", ipc, allocator);

    // Storage section
    rapidjson::Value storage(rapidjson::kObjectType);
    std::string store_path = paths::get_data_dir() + "/sessions.json";
    storage.AddMember("path", rapidjson::Value(store_path.c_str(), allocator),
                      allocator);
    storage.AddMember("write_retries", defaults.store_write_retries, allocator);
    config.AddMember("storage", storage, allocator);

    // UI section
    rapidjson::Value ui(rapidjson::kObjectType);
    ui.AddMember("show_notifications", true, allocator);
    config.AddMember("ui", ui, allocator);

    rapidjson::Value log_section(rapidjson::kObjectType);
    log_section.AddMember("level", "info", allocator);
    config.AddMember("log", log_section, allocator);

    save_config();
  }

  void save_config() {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    config.Accept(writer);

    std::ofstream file(config_path);
    file << buffer.GetString() << std::endl;
    if (!file) {
      log::warn("Config", "could not write {}", config_path);
    }
  }

  const rapidjson::Value *find_value(const char *section, const char *key) const {
    if (config.IsObject() && config.HasMember(section) &&
        config[section].IsObject() && config[section].HasMember(key)) {
      return &config[section][key];
    }
    return nullptr;
  }

  std::string get_string_value(const char *section, const char *key,
                               const std::string &default_value = "") const {
    const auto *value = find_value(section, key);
    if (value && value->IsString()) {
      return value->GetString();
    }
    return default_value;
  }

  bool get_bool_value(const char *section, const char *key,
                      bool default_value = false) const {
    const auto *value = find_value(section, key);
    if (value && value->IsBool()) {
      return value->GetBool();
    }
    return default_value;
  }

  int get_int_value(const char *section, const char *key,
                    int default_value = 0) const {
    const auto *value = find_value(section, key);
    if (value && value->IsInt()) {
      return value->GetInt();
    }
    return default_value;
  }

  double get_double_value(const char *section, const char *key,
                          double default_value = 0.0) const {
    const auto *value = find_value(section, key);
    if (value && value->IsNumber()) {
      return value->GetDouble();
    }
    return default_value;
  }

  std::vector<std::string>
  get_string_array(const char *section, const char *key,
                   const std::vector<std::string> &default_value) const {
    const auto *value = find_value(section, key);
    if (!value || !value->IsArray()) {
      return default_value;
    }
    std::vector<std::string> result;
    for (const auto &item : value->GetArray()) {
      if (item.IsString()) {
        result.emplace_back(item.GetString());
      }
    }
    return result;
  }

public:
  Config(const std::string &path = "")
      : config_path(path.empty() ? (paths::get_config_dir() + "/config.json")
                                 : path) {
    try {
      paths::ensure_directory_exists(
          std::filesystem::path(config_path).parent_path().string());

      std::ifstream file(config_path);
      if (file.good()) {
        std::string json_str((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());

        if (config.Parse(json_str.c_str()).HasParseError() ||
            !config.IsObject()) {
          throw std::runtime_error("Invalid config file format");
        }
      } else {
        create_default_config();
      }
    } catch (const std::exception &e) {
      log::error("Config", "{}: {}", config_path, e.what());
      create_default_config();
    }
  }

  const std::string &path() const { return config_path; }

  Settings settings() const {
    std::lock_guard<std::mutex> lock(config_mutex);
    Settings s;

    std::string mode = get_string_value("player", "mode", "precise");
    if (mode == "coarse") {
      s.driver_mode = DriverMode::Coarse;
      s.player_executable = "vlc";
      s.extra_args = {"--play-and-exit"};
    } else if (mode != "precise") {
      log::warn("Config", "unknown player mode '{}', using precise", mode);
    }
    std::string executable = get_string_value("player", "executable", "");
    if (!executable.empty()) {
      s.player_executable = executable;
    }
    s.ipc_socket_path = get_string_value("player", "ipc_socket", "");
    s.start_offset_arg =
        get_string_value("player", "start_offset_arg", s.start_offset_arg);
    // Empty keeps the mode's own arguments.
    auto extra_args = get_string_array("player", "extra_args", {});
    if (!extra_args.empty()) {
      s.extra_args = extra_args;
    }

    double interval = get_double_value("resume", "sample_interval_seconds",
                                       s.sample_interval_seconds);
    if (interval > 0) {
      s.sample_interval_seconds = interval;
    } else {
      log::warn("Config", "sample_interval_seconds must be positive");
    }
    double threshold = get_double_value("resume", "completion_threshold",
                                        s.completion_threshold);
    if (threshold > 0 && threshold <= 1.0) {
      s.completion_threshold = threshold;
    } else {
      log::warn("Config", "completion_threshold must be in (0, 1]");
    }
    s.recursive = get_bool_value("resume", "recursive", s.recursive);
    s.extensions = get_string_array("resume", "extensions", s.extensions);

    auto millis = [this](const char *key, std::chrono::milliseconds fallback) {
      int value = get_int_value("ipc", key, static_cast<int>(fallback.count()));
      return value > 0 ? std::chrono::milliseconds(value) : fallback;
    };
    s.connect_timeout = millis("connect_timeout_ms", s.connect_timeout);
    s.query_timeout = millis("query_timeout_ms", s.query_timeout);
    s.position_freshness = millis("position_freshness_ms", s.position_freshness);
    s.quit_timeout = millis("quit_timeout_ms", s.quit_timeout);

    s.store_write_retries = std::max(
        0, get_int_value("storage", "write_retries", s.store_write_retries));
    return s;
  }

  std::string get_store_path() const {
    std::lock_guard<std::mutex> lock(config_mutex);
    std::string path = get_string_value("storage", "path", "");
    return path.empty() ? paths::get_data_dir() + "/sessions.json" : path;
  }

  bool get_notifications_enabled() const {
    std::lock_guard<std::mutex> lock(config_mutex);
    return get_bool_value("ui", "show_notifications", true);
  }

  log::Level get_log_level() const {
    std::lock_guard<std::mutex> lock(config_mutex);
    return log::parse_level(get_string_value("log", "level", "info"));
  }
};

} // namespace cue
