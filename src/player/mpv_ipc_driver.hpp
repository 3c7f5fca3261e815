#pragma once

#include "../core/config/settings.hpp"
#include "child_process.hpp"
#include "ipc_client.hpp"
#include "latest_value.hpp"
#include "player_driver.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cue {

// mpv (or a front end speaking its protocol, e.g. celluloid) driven over
// --input-ipc-server. time-pos and duration are observed for the whole
// process lifetime; the reader thread feeds them into single-slot cells
// that query_position() reads before falling back to a round trip.
//
// A playlist is queued in one process. start-file events move the current
// entry; the outgoing entry's cells are handed over as an EntryOutcome and
// cleared for the next one.
class MpvIpcDriver : public PlayerDriver {
public:
  explicit MpvIpcDriver(Settings settings);
  ~MpvIpcDriver() override;

  LaunchInfo launch(const std::string &file_path, double start_offset) override;
  LaunchInfo launch_playlist(const std::vector<std::string> &entries,
                             double start_offset) override;
  double query_position() override;
  void terminate() override;
  int wait_for_exit() override;
  bool is_alive() override;

  Precision precision() const override { return Precision::Precise; }
  std::optional<double> last_known_position() const override;
  std::optional<double> duration() const override;
  bool reached_end() const override { return end_of_file; }
  std::string name() const override { return "precise"; }

  bool load_failed() const override;
  std::string current_entry() const override;
  std::vector<EntryOutcome> take_finished_entries() override;

  const std::string &socket_path() const { return control_socket; }

  std::vector<std::string> build_command() const;

private:
  void handle_event(const IpcEvent &event);
  void enter_entry(const IpcEvent &event);
  void reset_start_offset();
  void remove_socket_file() const;

  Settings settings;
  std::string control_socket;
  std::unique_ptr<ChildProcess> process;
  IpcClient client;

  LatestValue<double> position_cell;
  LatestValue<double> duration_cell;
  std::atomic_bool end_of_file{false};

  // Playlist bookkeeping, written by the reader thread.
  mutable std::mutex entry_mutex;
  std::vector<std::string> playlist; // accepted by the player, in order
  int current_index = -1;            // -1 until the first start-file
  std::optional<int64_t> first_entry_id;
  std::vector<EntryOutcome> finished_entries;
  bool load_error = false;
  bool offset_pending_reset = false;
};

} // namespace cue
