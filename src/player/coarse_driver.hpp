#pragma once

#include "../core/config/settings.hpp"
#include "child_process.hpp"
#include "player_driver.hpp"
#include <memory>
#include <vector>

namespace cue {

// Players with no control channel (VLC, mplayer, ...). Progress is only
// known through process exit, so the resume point stays wherever the
// session started.
class CoarseDriver : public PlayerDriver {
public:
  explicit CoarseDriver(Settings settings);

  LaunchInfo launch(const std::string &file_path, double start_offset) override;
  double query_position() override;
  void terminate() override;
  int wait_for_exit() override;
  bool is_alive() override;

  Precision precision() const override { return Precision::Coarse; }
  std::optional<double> last_known_position() const override { return std::nullopt; }
  std::optional<double> duration() const override { return std::nullopt; }
  bool reached_end() const override { return false; }
  std::string name() const override { return "coarse"; }

  // Command line for a launch; exposed for tests.
  std::vector<std::string> build_command(const std::string &file_path,
                                         double start_offset,
                                         bool *offset_honored = nullptr) const;

private:
  Settings settings;
  std::unique_ptr<ChildProcess> process;
};

} // namespace cue
