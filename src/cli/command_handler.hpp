#pragma once

#include "../session/resume_coordinator.hpp"
#include "../storage/position_store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cue::cli {

// Executes one text command and answers with a single JSON line:
//   play <path> | stop | status | info <path> | list [--finished]
//   forget <path> | title <path> <title> [--season N] [--lock|--unlock]
// Arguments containing spaces can be double-quoted.
class CommandHandler {
public:
  CommandHandler(ResumeCoordinator &coordinator, const PositionStore &store)
      : coordinator(coordinator), store(store) {}

  std::string execute(const std::string &command);

  static std::vector<std::string> split_arguments(const std::string &line);

private:
  std::string handle_play(const std::vector<std::string> &args);
  std::string handle_stop();
  std::string handle_status();
  std::string handle_info(const std::vector<std::string> &args);
  std::string handle_list(const std::vector<std::string> &args);
  std::string handle_forget(const std::vector<std::string> &args);
  std::string handle_title(const std::vector<std::string> &args);

  ResumeCoordinator &coordinator;
  const PositionStore &store;
  // Most recent session started from this handler, kept for `status`
  // after it ended.
  std::optional<SessionHandle> last_session;
};

} // namespace cue::cli
