#pragma once

#include "../core/config/config.hpp"
#include "log.hpp"
#include <cstdlib>
#include <string>

namespace cue::notifications {

// Set by main(); without it notifications are logged only.
inline const Config *g_config = nullptr;

inline void init(const Config *cfg) { g_config = cfg; }

inline std::string shell_quote(const std::string &text) {
  std::string quoted = "'";
  for (char c : text) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

inline void send(const std::string &message) {
  log::info("Notify", "{}", message);
  if (g_config == nullptr || !g_config->get_notifications_enabled()) {
    return;
  }
#ifndef _WIN32
  std::string command = "notify-send 'cue' " + shell_quote(message) +
                        " >/dev/null 2>&1";
  if (std::system(command.c_str()) != 0) {
    log::debug("Notify", "notify-send unavailable");
  }
#endif
}

inline void send_resumed(const std::string &title, double position) {
  if (position > 0) {
    send("Resuming " + title + " at " + log::format_time(position));
  } else {
    send("Playing " + title);
  }
}

inline void send_finished(const std::string &title) {
  send("Finished: " + title);
}

inline void send_load_failed(const std::string &title) {
  send("Could not play " + title);
}

inline void send_store_warning(const std::string &error) {
  send("Could not save resume position: " + error);
}

} // namespace cue::notifications
