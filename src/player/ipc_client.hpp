#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace cue {

using CommandArg = std::variant<std::string, double, int64_t, bool>;

struct IpcReply {
  bool ok = false;
  std::string error; // "success" when ok
  std::optional<double> number;
  std::optional<std::string> text;
};

struct IpcEvent {
  std::string event;  // "property-change", "end-file", "shutdown", ...
  std::string name;   // property name for property-change
  std::optional<double> number;
  std::string reason; // end-file reason
  std::optional<int64_t> playlist_entry_id; // start-file, end-file
  std::string file_error;                   // end-file with reason "error"
};

// Client for mpv's JSON IPC protocol: newline-delimited JSON over a unix
// socket. Commands carry a request_id and are answered out of band from
// events; a reader thread routes replies to the waiting caller and events
// to the handler.
class IpcClient {
public:
  // Runs on the reader thread. Must not call request(); post() is fine.
  using EventHandler = std::function<void(const IpcEvent &)>;

  IpcClient() = default;
  ~IpcClient();

  IpcClient(const IpcClient &) = delete;
  IpcClient &operator=(const IpcClient &) = delete;

  void set_event_handler(EventHandler handler) { on_event = std::move(handler); }

  // Retries with exponential backoff until `timeout` expires or
  // `keep_trying` returns false. Throws CueError(ConnectTimeout).
  void connect(const std::string &socket_path, std::chrono::milliseconds timeout,
               const std::function<bool()> &keep_trying = nullptr);

  // Throws CueError(QueryTimeout) when no matching reply arrives in time,
  // CueError(ChannelClosed) when the socket is gone.
  IpcReply request(const std::vector<CommandArg> &command,
                   std::chrono::milliseconds timeout);

  // Fire and forget: the reply is dropped. False when the write failed.
  bool post(const std::vector<CommandArg> &command);

  bool is_open() const { return channel_open; }

  void close();

  static std::string encode_command(const std::vector<CommandArg> &command,
                                    int64_t request_id);

private:
  void reader_loop();
  void handle_line(const std::string &line);
  void fail_pending();
  bool write_all(const std::string &data);

  std::atomic<int> socket_fd{-1};
  std::thread reader_thread;
  std::atomic_bool running{false};
  std::atomic_bool channel_open{false};

  std::mutex close_mutex;
  std::mutex write_mutex;
  std::mutex pending_mutex;
  std::map<int64_t, std::promise<IpcReply>> pending;
  std::atomic<int64_t> next_request_id{1};

  EventHandler on_event;
};

} // namespace cue
