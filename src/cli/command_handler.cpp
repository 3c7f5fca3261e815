#include "command_handler.hpp"
#include "../common/log.hpp"
#include "../core/errors.hpp"
#include "json_output.hpp"

#include <cctype>
#include <stdexcept>

namespace cue::cli {

namespace {

// Single path argument; unquoted paths with spaces arrive split.
std::string path_argument(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    throw std::invalid_argument("missing <path>");
  }
  std::string path = args[1];
  for (size_t i = 2; i < args.size(); ++i) {
    path += " " + args[i];
  }
  return path;
}

} // namespace

std::vector<std::string> CommandHandler::split_arguments(const std::string &line) {
  std::vector<std::string> args;
  std::string current;
  bool in_quotes = false;
  bool has_token = false;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (c == '"') {
      in_quotes = !in_quotes;
      has_token = true;
    } else if (c == '\\' && in_quotes && i + 1 < line.size()) {
      current += line[++i];
    } else if (!in_quotes && std::isspace(static_cast<unsigned char>(c))) {
      if (has_token) {
        args.push_back(current);
        current.clear();
        has_token = false;
      }
    } else {
      current += c;
      has_token = true;
    }
  }
  if (in_quotes) {
    throw std::invalid_argument("unterminated quote");
  }
  if (has_token) {
    args.push_back(current);
  }
  return args;
}

std::string CommandHandler::execute(const std::string &command) {
  try {
    std::vector<std::string> args = split_arguments(command);
    if (args.empty()) {
      return JsonOutput::create_error("Empty command");
    }
    const std::string &cmd = args[0];

    if (cmd == "play") {
      return handle_play(args);
    } else if (cmd == "stop") {
      return handle_stop();
    } else if (cmd == "status") {
      return handle_status();
    } else if (cmd == "info") {
      return handle_info(args);
    } else if (cmd == "list") {
      return handle_list(args);
    } else if (cmd == "forget") {
      return handle_forget(args);
    } else if (cmd == "title") {
      return handle_title(args);
    } else {
      return JsonOutput::create_error("Unknown command: " + cmd);
    }
  } catch (const std::exception &e) {
    return JsonOutput::create_error(e.what());
  }
}

std::string CommandHandler::handle_play(const std::vector<std::string> &args) {
  SessionHandle handle =
      coordinator.start(PlaybackRequest::from_path(path_argument(args)));
  last_session = handle;
  return JsonOutput::create_started(coordinator.status(handle));
}

std::string CommandHandler::handle_stop() {
  auto active = coordinator.active_session();
  if (!active) {
    return JsonOutput::create_error("Nothing is playing");
  }
  coordinator.stop(*active);
  return JsonOutput::create_status(coordinator.status(*active));
}

std::string CommandHandler::handle_status() {
  if (auto active = coordinator.active_session()) {
    return JsonOutput::create_status(coordinator.status(*active));
  }
  if (last_session) {
    return JsonOutput::create_status(coordinator.status(*last_session));
  }
  return JsonOutput::create_status(std::nullopt);
}

std::string CommandHandler::handle_info(const std::vector<std::string> &args) {
  return JsonOutput::create_info(
      coordinator.resume_info(PlaybackRequest::from_path(path_argument(args))));
}

std::string CommandHandler::handle_list(const std::vector<std::string> &args) {
  bool finished_only = false;
  for (size_t i = 1; i < args.size(); ++i) {
    if (args[i] == "--finished") {
      finished_only = true;
    } else {
      return JsonOutput::create_error("Unknown option: " + args[i]);
    }
  }
  return JsonOutput::create_records(finished_only ? store.list_finished()
                                                  : store.list_all());
}

std::string CommandHandler::handle_forget(const std::vector<std::string> &args) {
  std::string path = path_argument(args);
  if (coordinator.forget(path)) {
    return JsonOutput::create_success("Forgot " + normalize_path(path));
  }
  return JsonOutput::create_error("Nothing stored for " + normalize_path(path));
}

std::string CommandHandler::handle_title(const std::vector<std::string> &args) {
  std::vector<std::string> positional;
  std::optional<int> season;
  std::optional<bool> lock;
  for (size_t i = 1; i < args.size(); ++i) {
    if (args[i] == "--season") {
      if (i + 1 >= args.size()) {
        return JsonOutput::create_error("--season needs a number");
      }
      season = std::stoi(args[++i]);
    } else if (args[i] == "--lock") {
      lock = true;
    } else if (args[i] == "--unlock") {
      lock = false;
    } else {
      positional.push_back(args[i]);
    }
  }
  if (positional.empty()) {
    return JsonOutput::create_error("usage: title <path> [<title>] [--season N] "
                                    "[--lock|--unlock]");
  }

  std::optional<std::string> title;
  if (positional.size() > 1) {
    title = positional[1];
    for (size_t i = 2; i < positional.size(); ++i) {
      *title += " " + positional[i];
    }
  }
  MediaMetadata metadata =
      coordinator.update_metadata(positional[0], title, season, lock);
  return JsonOutput::create_metadata(normalize_path(positional[0]), metadata);
}

} // namespace cue::cli
