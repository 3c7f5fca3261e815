#pragma once

#include "../core/media.hpp"
#include "../player/player_driver.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cue {

enum class SessionState { Starting, Running, Ended, Failed };

inline const char *session_state_name(SessionState state) {
  switch (state) {
  case SessionState::Starting:
    return "starting";
  case SessionState::Running:
    return "running";
  case SessionState::Ended:
    return "ended";
  case SessionState::Failed:
    return "failed";
  }
  return "unknown";
}

struct SessionHandle {
  uint64_t id = 0;

  bool operator==(const SessionHandle &other) const { return id == other.id; }
  bool operator!=(const SessionHandle &other) const { return id != other.id; }
};

struct SessionStatus {
  SessionHandle handle;
  SessionState state = SessionState::Starting;
  MediaIdentity identity;
  std::string title;
  Precision precision = Precision::Coarse;
  double start_offset = 0.0;
  bool offset_honored = false;
  std::optional<double> last_position;
  std::vector<std::string> warnings;
  // Set once the session has ended.
  std::optional<ResumeRecord> final_record;
  int exit_status = -1;
};

// Read-only answer to "where would this resume?".
struct ResumeInfo {
  MediaIdentity identity; // the entry that would be played
  ResumeRecord record;
  std::optional<MediaMetadata> metadata;

  double start_offset() const { return record.resume_offset(); }
};

} // namespace cue
