#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace cue {

using Clock = std::chrono::system_clock;

// Absolute, lexically normal, symlinks resolved where the path exists and
// case-folded on case-insensitive platforms. Throws CueError(InvalidIdentity).
std::string normalize_path(const std::string &path);

struct MediaIdentity {
  enum class Kind { File, FolderEntry };

  Kind kind = Kind::File;
  std::string path;   // normalized media file
  std::string folder; // normalized enclosing folder, FolderEntry only

  static MediaIdentity file(const std::string &path);
  static MediaIdentity folder_entry(const std::string &folder,
                                    const std::string &entry);

  // Records are keyed by the media file, so a file resumes the same way
  // whether it was opened directly or through its folder.
  const std::string &key() const { return path; }

  bool operator==(const MediaIdentity &other) const {
    return kind == other.kind && path == other.path && folder == other.folder;
  }
  bool operator!=(const MediaIdentity &other) const { return !(*this == other); }
};

struct ResumeRecord {
  MediaIdentity identity;
  double position_seconds = 0.0;
  double duration_seconds = 0.0; // 0 = unknown
  bool finished = false;
  Clock::time_point updated_at{};

  // Offset to start the next playback from.
  double resume_offset() const { return finished ? 0.0 : position_seconds; }

  bool operator==(const ResumeRecord &other) const {
    return identity == other.identity &&
           position_seconds == other.position_seconds &&
           duration_seconds == other.duration_seconds &&
           finished == other.finished && updated_at == other.updated_at;
  }
  bool operator!=(const ResumeRecord &other) const { return !(*this == other); }
};

struct FolderRecord {
  std::string folder;
  std::string selected_entry;
};

struct MediaMetadata {
  std::string clean_title;
  std::optional<int> season_number;
  bool user_locked_title = false;
};

// What the UI asks to play. Paths are raw here and normalized by the
// coordinator.
struct PlaybackRequest {
  enum class Kind { File, Folder };

  Kind kind = Kind::File;
  std::string path;

  static PlaybackRequest file(std::string path) {
    return PlaybackRequest{Kind::File, std::move(path)};
  }
  static PlaybackRequest folder(std::string path) {
    return PlaybackRequest{Kind::Folder, std::move(path)};
  }
  // Picks the kind by looking at the filesystem.
  static PlaybackRequest from_path(const std::string &path);
};

// Millisecond precision, the resolution the store persists.
inline Clock::time_point now_ms() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

} // namespace cue
