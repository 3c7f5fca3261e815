#pragma once

#include <stdexcept>
#include <string>

namespace cue {

enum class ErrorCode {
  // launch
  SpawnFailed,
  ConnectTimeout,
  // transient, recovered by the sampler
  QueryTimeout,
  PositionUnavailable,
  ChannelClosed,
  // resolution
  NoPlayableEntries,
  InvalidIdentity,
  // persistence
  StoreWriteFailed,
  // session bookkeeping
  SessionActive,
  UnknownSession,
};

inline const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::SpawnFailed:
    return "SpawnFailed";
  case ErrorCode::ConnectTimeout:
    return "ConnectTimeout";
  case ErrorCode::QueryTimeout:
    return "QueryTimeout";
  case ErrorCode::PositionUnavailable:
    return "PositionUnavailable";
  case ErrorCode::ChannelClosed:
    return "ChannelClosed";
  case ErrorCode::NoPlayableEntries:
    return "NoPlayableEntries";
  case ErrorCode::InvalidIdentity:
    return "InvalidIdentity";
  case ErrorCode::StoreWriteFailed:
    return "StoreWriteFailed";
  case ErrorCode::SessionActive:
    return "SessionActive";
  case ErrorCode::UnknownSession:
    return "UnknownSession";
  }
  return "Unknown";
}

class CueError : public std::runtime_error {
public:
  CueError(ErrorCode code, const std::string &message)
      : std::runtime_error(std::string(error_code_name(code)) + ": " + message),
        code_(code) {}

  ErrorCode code() const { return code_; }

  // Errors the sampling loop skips over instead of ending the session.
  bool is_transient() const {
    return code_ == ErrorCode::QueryTimeout ||
           code_ == ErrorCode::PositionUnavailable ||
           code_ == ErrorCode::ChannelClosed;
  }

private:
  ErrorCode code_;
};

} // namespace cue
