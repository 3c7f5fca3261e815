#include "cli/command_handler.hpp"
#include "cli/json_output.hpp"
#include "cli/line_server.hpp"
#include "common/log.hpp"
#include "common/notification.hpp"
#include "core/config/config.hpp"
#include "session/resume_coordinator.hpp"
#include "storage/json_position_store.hpp"
#include "storage/memory_position_store.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) { g_interrupted = 1; }

void print_usage() {
  std::cerr << "usage: cue [--config <file>] <command> [args]\n"
               "\n"
               "  play <path>                 play a file or folder, resuming where it stopped\n"
               "  info <path>                 print the stored resume position\n"
               "  list [--finished]           list stored positions, newest first\n"
               "  forget <path>               delete the stored position\n"
               "  title <path> [<title>] [--season N] [--lock|--unlock]\n"
               "                              edit the display title\n"
               "  serve [--ephemeral]         line protocol on stdin/stdout\n";
}

std::string join_command(const std::vector<std::string> &args, size_t from) {
  std::string line;
  for (size_t i = from; i < args.size(); ++i) {
    if (!line.empty()) line += ' ';
    std::string quoted = "\"";
    for (char c : args[i]) {
      if (c == '"' || c == '\\') quoted += '\\';
      quoted += c;
    }
    quoted += '"';
    line += quoted;
  }
  return line;
}

int print_result(const std::string &json) {
  std::cout << json << std::endl;
  return json.rfind("{\"success\":true", 0) == 0 ? 0 : 1;
}

int run_play(cue::ResumeCoordinator &coordinator, const std::string &path) {
  std::signal(SIGINT, on_interrupt);
  cue::SessionHandle handle =
      coordinator.start(cue::PlaybackRequest::from_path(path));

  // Ctrl-C reaches the player too; stop() still takes the final checkpoint
  // when it is quicker than the player.
  while (!g_interrupted && coordinator.active_session() == handle) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (g_interrupted) {
    cue::log::info("Main", "interrupted, stopping session {}", handle.id);
    coordinator.stop(handle);
  }
  cue::SessionStatus status = coordinator.wait(handle);
  int code = print_result(cue::cli::JsonOutput::create_status(status));
  return status.state == cue::SessionState::Failed ? 1 : code;
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty() || args[0] == "--help" || args[0] == "-h") {
    print_usage();
    return args.empty() ? 1 : 0;
  }

  cue::Config config(config_path);
  cue::log::set_level(config.get_log_level());
  cue::notifications::init(&config);
  cue::Settings settings = config.settings();

  const std::string &command = args[0];
  bool ephemeral = command == "serve" && args.size() > 1 && args[1] == "--ephemeral";

  try {
    std::unique_ptr<cue::PositionStore> store;
    if (ephemeral) {
      store = std::make_unique<cue::MemoryPositionStore>();
    } else {
      store = std::make_unique<cue::JsonPositionStore>(config.get_store_path());
    }
    cue::ResumeCoordinator coordinator(*store, settings);
    cue::cli::CommandHandler handler(coordinator, *store);

    if (command == "serve") {
      cue::cli::LineServer server(handler);
      server.run();
      return 0;
    }
    if (command == "play") {
      if (args.size() < 2) {
        print_usage();
        return 1;
      }
      return run_play(coordinator, args[1]);
    }
    if (command == "info" || command == "list" || command == "forget" ||
        command == "title") {
      return print_result(handler.execute(command + " " + join_command(args, 1)));
    }

    std::cerr << "cue: unknown command '" << command << "'\n";
    print_usage();
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "cue: " << e.what() << std::endl;
    return 1;
  }
}
