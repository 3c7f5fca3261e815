#pragma once

#include <atomic>
#include <fmt/core.h>
#include <fmt/format.h>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

// Tagged stderr logging: "[Tag] message". Lines from concurrent threads are
// never interleaved.
namespace cue::log {

enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline std::atomic<int> g_level{static_cast<int>(Level::Info)};
inline std::mutex g_write_mutex;

inline void set_level(Level level) { g_level = static_cast<int>(level); }

inline Level parse_level(const std::string &name, Level fallback = Level::Info) {
  if (name == "debug") return Level::Debug;
  if (name == "info") return Level::Info;
  if (name == "warn" || name == "warning") return Level::Warn;
  if (name == "error") return Level::Error;
  return fallback;
}

inline bool enabled(Level level) {
  return static_cast<int>(level) >= g_level.load();
}

inline void write(Level level, const std::string &tag,
                  const std::string &message) {
  if (!enabled(level)) {
    return;
  }
  const char *marker = "";
  switch (level) {
  case Level::Warn:
    marker = "warning: ";
    break;
  case Level::Error:
    marker = "error: ";
    break;
  default:
    break;
  }
  std::lock_guard<std::mutex> lock(g_write_mutex);
  std::cerr << fmt::format("[{}] {}{}", tag, marker, message) << std::endl;
}

template <typename... Args>
void debug(const std::string &tag, fmt::format_string<Args...> format,
           Args &&...args) {
  if (enabled(Level::Debug)) {
    write(Level::Debug, tag, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void info(const std::string &tag, fmt::format_string<Args...> format,
          Args &&...args) {
  if (enabled(Level::Info)) {
    write(Level::Info, tag, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void warn(const std::string &tag, fmt::format_string<Args...> format,
          Args &&...args) {
  if (enabled(Level::Warn)) {
    write(Level::Warn, tag, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void error(const std::string &tag, fmt::format_string<Args...> format,
           Args &&...args) {
  if (enabled(Level::Error)) {
    write(Level::Error, tag, fmt::format(format, std::forward<Args>(args)...));
  }
}

// mm:ss, or h:mm:ss past the hour
inline std::string format_time(double seconds) {
  if (seconds < 0) seconds = 0;
  int total = static_cast<int>(seconds);
  int hours = total / 3600;
  int minutes = (total % 3600) / 60;
  int secs = total % 60;
  if (hours > 0) {
    return fmt::format("{}:{:02d}:{:02d}", hours, minutes, secs);
  }
  return fmt::format("{:02d}:{:02d}", minutes, secs);
}

} // namespace cue::log
