#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/types.h>
#include <unistd.h>
#endif

namespace cue::paths {

inline std::string get_config_dir() {
#ifdef _WIN32
  char *appdata = nullptr;
  size_t len = 0;
  if (_dupenv_s(&appdata, &len, "APPDATA") == 0 && appdata != nullptr) {
    std::string result = std::string(appdata) + "\\cue";
    free(appdata);
    return result;
  }
  return ".\\config";
#elif defined(__APPLE__)
  const char *home = getenv("HOME");
  if (home) {
    return std::string(home) + "/Library/Application Support/cue";
  }
  return "./config";
#else
  // XDG Base Directory Specification
  const char *xdg_config = getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return std::string(xdg_config) + "/cue";
  }

  const char *home = getenv("HOME");
  if (home) {
    return std::string(home) + "/.config/cue";
  }
  return "./config";
#endif
}

inline std::string get_data_dir() {
#ifdef _WIN32
  char *appdata = nullptr;
  size_t len = 0;
  if (_dupenv_s(&appdata, &len, "LOCALAPPDATA") == 0 && appdata != nullptr) {
    std::string result = std::string(appdata) + "\\cue";
    free(appdata);
    return result;
  }
  return ".\\data";
#elif defined(__APPLE__)
  const char *home = getenv("HOME");
  if (home) {
    return std::string(home) + "/Library/Application Support/cue";
  }
  return "./data";
#else
  const char *xdg_data = getenv("XDG_DATA_HOME");
  if (xdg_data && *xdg_data) {
    return std::string(xdg_data) + "/cue";
  }

  const char *home = getenv("HOME");
  if (home) {
    return std::string(home) + "/.local/share/cue";
  }
  return "./data";
#endif
}

// Directory for control sockets. Falls back to the temp dir when no
// per-user runtime dir exists.
inline std::string get_runtime_dir() {
#ifndef _WIN32
  const char *xdg_runtime = getenv("XDG_RUNTIME_DIR");
  if (xdg_runtime && *xdg_runtime) {
    return xdg_runtime;
  }
#endif
  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    return "/tmp";
  }
  return tmp.string();
}

inline int current_pid() {
#ifdef _WIN32
  return static_cast<int>(GetCurrentProcessId());
#else
  return static_cast<int>(getpid());
#endif
}

// Returns false when the directory could not be created; callers decide
// whether that is fatal.
inline bool ensure_directory_exists(const std::string &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  return !ec;
}

} // namespace cue::paths
