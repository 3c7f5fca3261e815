#pragma once

#include "../core/errors.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cue {

enum class Precision { Coarse, Precise };

inline const char *precision_name(Precision precision) {
  return precision == Precision::Precise ? "precise" : "coarse";
}

struct LaunchInfo {
  Precision precision = Precision::Coarse;
  // False when the backend has no way to start at an offset and playback
  // begins at 0 regardless.
  bool offset_honored = false;
};

// How one playlist entry ended, handed over once the player moved on.
struct EntryOutcome {
  std::string path;
  std::optional<double> last_position;
  std::optional<double> duration;
  bool reached_end = false;
  bool load_failed = false;
};

// Lifecycle of one playback in an external player. Every backend exposes
// the same methods; capabilities a backend lacks fail at run time (the
// coarse driver's query_position() always throws PositionUnavailable) so
// the coordinator loop stays uniform.
class PlayerDriver {
public:
  virtual ~PlayerDriver() = default;

  // Throws CueError(SpawnFailed | ConnectTimeout). Nothing is left running
  // when it throws.
  virtual LaunchInfo launch(const std::string &file_path, double start_offset) = 0;

  // Plays `entries` in order: the first from `start_offset`, the rest from
  // the beginning. Backends without a playlist play the first entry only.
  virtual LaunchInfo launch_playlist(const std::vector<std::string> &entries,
                                     double start_offset) {
    if (entries.empty()) {
      throw CueError(ErrorCode::SpawnFailed, "nothing to play");
    }
    return launch(entries.front(), start_offset);
  }

  // Current position in seconds. Throws CueError(PositionUnavailable |
  // QueryTimeout | ChannelClosed).
  virtual double query_position() = 0;

  // Asks the player to quit, killing it if it does not comply in time.
  virtual void terminate() = 0;

  // Blocks until the process has exited and returns its exit status.
  virtual int wait_for_exit() = 0;

  virtual bool is_alive() = 0;

  virtual Precision precision() const = 0;

  // Reconciliation data for session end.
  virtual std::optional<double> last_known_position() const = 0;
  virtual std::optional<double> duration() const = 0;
  virtual bool reached_end() const = 0;

  // The current entry could not be opened by the player.
  virtual bool load_failed() const { return false; }

  // Entry playing now, empty when the backend cannot tell.
  virtual std::string current_entry() const { return {}; }

  // Entries the player has moved past since the last call, oldest first.
  virtual std::vector<EntryOutcome> take_finished_entries() { return {}; }

  virtual std::string name() const = 0;
};

} // namespace cue
