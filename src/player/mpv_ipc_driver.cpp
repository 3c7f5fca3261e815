#include "mpv_ipc_driver.hpp"
#include "../common/log.hpp"
#include "../common/paths.hpp"
#include "../core/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <thread>

namespace cue {

namespace {

std::atomic<int> g_socket_counter{0};

constexpr int64_t kObserveTimePos = 1;
constexpr int64_t kObserveDuration = 2;

} // namespace

MpvIpcDriver::MpvIpcDriver(Settings settings) : settings(std::move(settings)) {
  if (!this->settings.ipc_socket_path.empty()) {
    control_socket = this->settings.ipc_socket_path;
  } else {
    control_socket = fmt::format("{}/cue-mpv-{}-{}.sock",
                                 paths::get_runtime_dir(), paths::current_pid(),
                                 g_socket_counter++);
  }
  client.set_event_handler([this](const IpcEvent &event) { handle_event(event); });
}

MpvIpcDriver::~MpvIpcDriver() {
  if (process && process->is_alive()) {
    terminate();
  }
  client.close();
  process.reset();
  remove_socket_file();
}

std::vector<std::string> MpvIpcDriver::build_command() const {
  std::vector<std::string> command{
      settings.player_executable,
      "--no-terminal",
      "--idle=once",
      "--input-ipc-server=" + control_socket,
  };
  command.insert(command.end(), settings.extra_args.begin(),
                 settings.extra_args.end());
  return command;
}

void MpvIpcDriver::remove_socket_file() const {
  std::error_code ec;
  std::filesystem::remove(control_socket, ec);
}

LaunchInfo MpvIpcDriver::launch(const std::string &file_path,
                                double start_offset) {
  return launch_playlist({file_path}, start_offset);
}

LaunchInfo MpvIpcDriver::launch_playlist(const std::vector<std::string> &entries,
                                         double start_offset) {
  if (entries.empty()) {
    throw CueError(ErrorCode::SpawnFailed, "nothing to play");
  }
  {
    std::lock_guard<std::mutex> lock(entry_mutex);
    playlist.clear();
    current_index = -1;
    first_entry_id.reset();
    finished_entries.clear();
    load_error = false;
    offset_pending_reset = false;
  }
  position_cell.clear();
  duration_cell.clear();
  end_of_file = false;

  remove_socket_file();
  process = ChildProcess::spawn(build_command());

  auto abandon = [this]() {
    client.close();
    process->terminate(std::chrono::milliseconds(200));
    process.reset();
    remove_socket_file();
  };

  try {
    client.connect(control_socket, settings.connect_timeout,
                   [this]() { return process->is_alive(); });
  } catch (const CueError &) {
    abandon();
    throw;
  }

  const std::string &first = entries.front();
  try {
    client.request({std::string("observe_property"), kObserveTimePos,
                    std::string("time-pos")},
                   settings.query_timeout);
    client.request({std::string("observe_property"), kObserveDuration,
                    std::string("duration")},
                   settings.query_timeout);

    if (start_offset > 0) {
      auto reply = client.request({std::string("set_property"),
                                   std::string("start"),
                                   fmt::format("{}", start_offset)},
                                  settings.query_timeout);
      if (reply.ok) {
        // "start" applies to every entry; undone once the first one loads.
        std::lock_guard<std::mutex> lock(entry_mutex);
        offset_pending_reset = true;
      } else {
        log::warn("MpvIpc", "player refused start offset: {}", reply.error);
      }
    }

    {
      // Registered before loadfile so its start-file finds it.
      std::lock_guard<std::mutex> lock(entry_mutex);
      playlist.push_back(first);
    }
    auto loaded = client.request(
        {std::string("loadfile"), first, std::string("replace")},
        settings.query_timeout);
    if (!loaded.ok) {
      abandon();
      throw CueError(ErrorCode::SpawnFailed,
                     "player rejected " + first + ": " + loaded.error);
    }
  } catch (const CueError &e) {
    if (e.code() == ErrorCode::SpawnFailed) {
      throw;
    }
    abandon();
    throw CueError(ErrorCode::ConnectTimeout,
                   std::string("control channel unresponsive: ") + e.what());
  }

  size_t queued = 1;
  for (size_t i = 1; i < entries.size(); ++i) {
    {
      std::lock_guard<std::mutex> lock(entry_mutex);
      playlist.push_back(entries[i]);
    }
    bool accepted = false;
    try {
      auto appended = client.request(
          {std::string("loadfile"), entries[i], std::string("append")},
          settings.query_timeout);
      accepted = appended.ok;
      if (!accepted) {
        log::warn("MpvIpc", "player rejected {}: {}", entries[i], appended.error);
      }
    } catch (const CueError &e) {
      log::warn("MpvIpc", "could not queue {}: {}", entries[i], e.what());
    }
    if (!accepted) {
      std::lock_guard<std::mutex> lock(entry_mutex);
      playlist.pop_back();
      break;
    }
    ++queued;
  }

  log::info("MpvIpc", "playing {} from {}", first, log::format_time(start_offset));
  if (queued > 1) {
    log::debug("MpvIpc", "{} more entries queued", queued - 1);
  }
  return LaunchInfo{Precision::Precise, true};
}

void MpvIpcDriver::handle_event(const IpcEvent &event) {
  if (event.event == "property-change") {
    if (!event.number) {
      // Property became unavailable (file unloading); keep the last value.
      return;
    }
    if (event.name == "time-pos") {
      position_cell.publish(*event.number);
    } else if (event.name == "duration") {
      duration_cell.publish(*event.number);
    }
  } else if (event.event == "end-file") {
    log::debug("MpvIpc", "end-file ({})", event.reason);
    if (event.reason == "eof") {
      end_of_file = true;
    } else if (event.reason == "error") {
      log::warn("MpvIpc", "player could not open {}: {}", current_entry(),
                event.file_error.empty() ? "unknown error" : event.file_error);
      std::lock_guard<std::mutex> lock(entry_mutex);
      load_error = true;
    }
    // A first entry that never loaded still must not pass its offset on.
    reset_start_offset();
  } else if (event.event == "start-file") {
    enter_entry(event);
  } else if (event.event == "file-loaded") {
    reset_start_offset();
  }
}

void MpvIpcDriver::enter_entry(const IpcEvent &event) {
  std::lock_guard<std::mutex> lock(entry_mutex);
  if (current_index < 0) {
    current_index = 0;
    first_entry_id = event.playlist_entry_id;
    end_of_file = false;
    return;
  }

  EntryOutcome outcome;
  outcome.path = playlist[static_cast<size_t>(current_index)];
  if (auto sample = position_cell.latest()) {
    outcome.last_position = sample->value;
  }
  if (auto sample = duration_cell.latest()) {
    outcome.duration = sample->value;
  }
  outcome.reached_end = end_of_file;
  outcome.load_failed = load_error;
  finished_entries.push_back(std::move(outcome));

  position_cell.clear();
  duration_cell.clear();
  end_of_file = false;
  load_error = false;

  int next = current_index + 1;
  if (event.playlist_entry_id && first_entry_id) {
    next = static_cast<int>(*event.playlist_entry_id - *first_entry_id);
  }
  int last = static_cast<int>(playlist.size()) - 1;
  current_index = std::max(0, std::min(next, last));
  log::debug("MpvIpc", "now playing entry {}: {}", current_index,
             playlist[static_cast<size_t>(current_index)]);
}

void MpvIpcDriver::reset_start_offset() {
  {
    std::lock_guard<std::mutex> lock(entry_mutex);
    if (!offset_pending_reset) {
      return;
    }
    offset_pending_reset = false;
  }
  // Runs on the reader thread, so the reply cannot be waited for.
  if (!client.post({std::string("set_property"), std::string("start"),
                    std::string("none")})) {
    log::warn("MpvIpc", "could not clear the start offset for queued entries");
  }
}

bool MpvIpcDriver::load_failed() const {
  std::lock_guard<std::mutex> lock(entry_mutex);
  return load_error;
}

std::string MpvIpcDriver::current_entry() const {
  std::lock_guard<std::mutex> lock(entry_mutex);
  if (playlist.empty()) {
    return {};
  }
  return playlist[static_cast<size_t>(std::max(0, current_index))];
}

std::vector<EntryOutcome> MpvIpcDriver::take_finished_entries() {
  std::lock_guard<std::mutex> lock(entry_mutex);
  std::vector<EntryOutcome> taken;
  taken.swap(finished_entries);
  return taken;
}

double MpvIpcDriver::query_position() {
  if (auto cached = position_cell.fresh(settings.position_freshness)) {
    return *cached;
  }

  auto reply = client.request(
      {std::string("get_property"), std::string("time-pos")},
      settings.query_timeout);
  if (!reply.ok || !reply.number) {
    throw CueError(ErrorCode::PositionUnavailable,
                   "time-pos: " + (reply.error.empty() ? "no data" : reply.error));
  }
  position_cell.publish(*reply.number);
  return *reply.number;
}

void MpvIpcDriver::terminate() {
  if (!process || !process->is_alive()) {
    return;
  }
  try {
    client.request({std::string("quit")}, settings.quit_timeout);
  } catch (const CueError &e) {
    log::warn("MpvIpc", "quit not acknowledged: {}", e.what());
  }
  if (!process->wait_for(settings.quit_timeout)) {
    log::warn("MpvIpc", "player still running after quit, killing it");
    process->terminate(settings.quit_timeout);
  }
}

int MpvIpcDriver::wait_for_exit() {
  if (!process) {
    return -1;
  }
  int status = process->wait();

  // Let the reader drain what the player wrote before exiting.
  auto deadline = std::chrono::steady_clock::now() + settings.quit_timeout;
  while (client.is_open() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  client.close();
  remove_socket_file();
  return status;
}

bool MpvIpcDriver::is_alive() { return process && process->is_alive(); }

std::optional<double> MpvIpcDriver::last_known_position() const {
  if (auto sample = position_cell.latest()) {
    return sample->value;
  }
  return std::nullopt;
}

std::optional<double> MpvIpcDriver::duration() const {
  if (auto sample = duration_cell.latest()) {
    return sample->value;
  }
  return std::nullopt;
}

} // namespace cue
