#include "coarse_driver.hpp"
#include "../common/log.hpp"
#include "../core/errors.hpp"

#include <fmt/format.h>

namespace cue {

CoarseDriver::CoarseDriver(Settings settings) : settings(std::move(settings)) {}

std::vector<std::string>
CoarseDriver::build_command(const std::string &file_path, double start_offset,
                            bool *offset_honored) const {
  std::vector<std::string> command{settings.player_executable};
  command.insert(command.end(), settings.extra_args.begin(),
                 settings.extra_args.end());

  bool honored = start_offset <= 0;
  if (start_offset > 0 && !settings.start_offset_arg.empty()) {
    try {
      command.push_back(
          fmt::format(fmt::runtime(settings.start_offset_arg), start_offset));
      honored = true;
    } catch (const fmt::format_error &e) {
      log::warn("Coarse", "bad start_offset_arg '{}': {}",
                settings.start_offset_arg, e.what());
    }
  }
  command.push_back(file_path);

  if (offset_honored) {
    *offset_honored = honored;
  }
  return command;
}

LaunchInfo CoarseDriver::launch(const std::string &file_path,
                                double start_offset) {
  LaunchInfo info;
  info.precision = Precision::Coarse;
  auto command = build_command(file_path, start_offset, &info.offset_honored);

  process = ChildProcess::spawn(command);
  if (!info.offset_honored) {
    log::warn("Coarse", "{} has no start offset option, playing from the start",
              settings.player_executable);
  }
  log::info("Coarse", "playing {} from {}", file_path,
            log::format_time(info.offset_honored ? start_offset : 0.0));
  return info;
}

double CoarseDriver::query_position() {
  throw CueError(ErrorCode::PositionUnavailable,
                 "coarse players do not report their position");
}

void CoarseDriver::terminate() {
  if (process && process->is_alive()) {
    process->terminate(settings.quit_timeout);
  }
}

int CoarseDriver::wait_for_exit() {
  if (!process) {
    return -1;
  }
  return process->wait();
}

bool CoarseDriver::is_alive() { return process && process->is_alive(); }

} // namespace cue
