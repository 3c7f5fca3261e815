#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace cue {

enum class DriverMode { Coarse, Precise };

inline const char *driver_mode_name(DriverMode mode) {
  return mode == DriverMode::Precise ? "precise" : "coarse";
}

// Plain snapshot of the configuration consumed by the driver layer, the
// resolver and the coordinator.
struct Settings {
  DriverMode driver_mode = DriverMode::Precise;
  std::string player_executable = "mpv";
  std::string ipc_socket_path; // empty: generated per session
  std::string start_offset_arg = "--start-time={}"; // coarse players only
  std::vector<std::string> extra_args;

  double sample_interval_seconds = 5.0;
  double completion_threshold = 0.98;
  bool recursive = true;
  std::vector<std::string> extensions = {".mkv", ".mp4", ".avi", ".mov",
                                         ".webm", ".m4v", ".mp3", ".flac",
                                         ".ogg", ".opus", ".m4a", ".wav"};

  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds query_timeout{2000};
  std::chrono::milliseconds position_freshness{1500};
  std::chrono::milliseconds quit_timeout{2000};

  int store_write_retries = 3;
  std::chrono::milliseconds store_retry_backoff{50};

  std::chrono::milliseconds sample_interval() const {
    return std::chrono::milliseconds(
        static_cast<long long>(sample_interval_seconds * 1000.0));
  }
};

} // namespace cue
