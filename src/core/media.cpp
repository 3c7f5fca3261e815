#include "media.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace cue {

std::string normalize_path(const std::string &path) {
  if (path.empty()) {
    throw CueError(ErrorCode::InvalidIdentity, "empty path");
  }

  std::error_code ec;
  fs::path absolute = fs::absolute(fs::path(path), ec);
  if (ec) {
    throw CueError(ErrorCode::InvalidIdentity,
                   path + ": " + ec.message());
  }
  fs::path canonical = fs::weakly_canonical(absolute, ec);
  if (ec) {
    // Unreadable parents; fall back to a purely lexical form.
    canonical = absolute.lexically_normal();
  }

  std::string normalized = canonical.string();
  while (normalized.size() > 1 &&
         (normalized.back() == '/' || normalized.back() == '\\')) {
#ifdef _WIN32
    if (normalized.size() == 3 && normalized[1] == ':') break; // "C:\"
#endif
    normalized.pop_back();
  }

#if defined(_WIN32) || defined(__APPLE__)
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return std::tolower(c); });
#endif
  return normalized;
}

MediaIdentity MediaIdentity::file(const std::string &path) {
  MediaIdentity identity;
  identity.kind = Kind::File;
  identity.path = normalize_path(path);
  return identity;
}

MediaIdentity MediaIdentity::folder_entry(const std::string &folder,
                                          const std::string &entry) {
  MediaIdentity identity;
  identity.kind = Kind::FolderEntry;
  identity.folder = normalize_path(folder);
  identity.path = normalize_path(entry);
  return identity;
}

PlaybackRequest PlaybackRequest::from_path(const std::string &path) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    return folder(path);
  }
  return file(path);
}

} // namespace cue
