#include "ipc_client.hpp"
#include "../common/log.hpp"
#include "../core/errors.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <type_traits>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace cue {

namespace {

constexpr auto kInitialBackoff = std::chrono::milliseconds(20);
constexpr auto kMaxBackoff = std::chrono::milliseconds(500);
constexpr int kPollIntervalMs = 100;

} // namespace

IpcClient::~IpcClient() { close(); }

std::string IpcClient::encode_command(const std::vector<CommandArg> &command,
                                      int64_t request_id) {
  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
  writer.StartObject();
  writer.Key("command");
  writer.StartArray();
  for (const auto &arg : command) {
    std::visit(
        [&writer](const auto &value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::string>) {
            writer.String(value.c_str(),
                          static_cast<rapidjson::SizeType>(value.size()));
          } else if constexpr (std::is_same_v<T, double>) {
            writer.Double(value);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            writer.Int64(value);
          } else {
            writer.Bool(value);
          }
        },
        arg);
  }
  writer.EndArray();
  writer.Key("request_id");
  writer.Int64(request_id);
  writer.EndObject();
  return std::string(buffer.GetString(), buffer.GetSize()) + "\n";
}

void IpcClient::connect(const std::string &socket_path,
                        std::chrono::milliseconds timeout,
                        const std::function<bool()> &keep_trying) {
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (socket_path.size() >= sizeof(addr.sun_path)) {
    throw CueError(ErrorCode::ConnectTimeout,
                   "socket path too long: " + socket_path);
  }
  std::memcpy(addr.sun_path, socket_path.c_str(), socket_path.size() + 1);

  auto deadline = std::chrono::steady_clock::now() + timeout;
  auto backoff = kInitialBackoff;
  int attempts = 0;

  while (true) {
    ++attempts;
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      throw CueError(ErrorCode::ConnectTimeout,
                     std::string("socket: ") + strerror(errno));
    }
    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0) {
      socket_fd = fd;
      break;
    }
    int err = errno;
    ::close(fd);

    if (keep_trying && !keep_trying()) {
      throw CueError(ErrorCode::ConnectTimeout,
                     "player exited before " + socket_path + " appeared");
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      throw CueError(ErrorCode::ConnectTimeout,
                     fmt::format("{} not reachable after {} attempts ({})",
                                 socket_path, attempts, strerror(err)));
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(backoff, remaining));
    backoff = std::min(backoff * 2, kMaxBackoff);
  }

  log::debug("MpvIpc", "connected to {} after {} attempt(s)", socket_path,
             attempts);
  channel_open = true;
  running = true;
  reader_thread = std::thread([this] { reader_loop(); });
}

bool IpcClient::write_all(const std::string &data) {
  std::lock_guard<std::mutex> lock(write_mutex);
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(socket_fd, data.data() + sent, data.size() - sent,
                       MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

IpcReply IpcClient::request(const std::vector<CommandArg> &command,
                            std::chrono::milliseconds timeout) {
  if (!channel_open) {
    throw CueError(ErrorCode::ChannelClosed, "control socket is not connected");
  }

  int64_t request_id = next_request_id++;
  std::future<IpcReply> reply;
  {
    std::lock_guard<std::mutex> lock(pending_mutex);
    // The reader clears channel_open before failing pending requests, so a
    // request registered here is either failed by it or sees the flag.
    if (!channel_open) {
      throw CueError(ErrorCode::ChannelClosed, "control socket closed");
    }
    reply = pending[request_id].get_future();
  }

  if (!write_all(encode_command(command, request_id))) {
    std::lock_guard<std::mutex> lock(pending_mutex);
    pending.erase(request_id);
    throw CueError(ErrorCode::ChannelClosed,
                   std::string("write failed: ") + strerror(errno));
  }

  if (reply.wait_for(timeout) != std::future_status::ready) {
    std::lock_guard<std::mutex> lock(pending_mutex);
    pending.erase(request_id);
    throw CueError(ErrorCode::QueryTimeout,
                   fmt::format("no reply to request {} within {} ms", request_id,
                               timeout.count()));
  }
  // Rethrows ChannelClosed set by fail_pending().
  return reply.get();
}

bool IpcClient::post(const std::vector<CommandArg> &command) {
  if (!channel_open) {
    return false;
  }
  return write_all(encode_command(command, next_request_id++));
}

void IpcClient::reader_loop() {
  std::string buffer;
  char chunk[4096];

  while (running) {
    pollfd pfd{socket_fd.load(), POLLIN, 0};
    int ready = ::poll(&pfd, 1, kPollIntervalMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      continue;
    }

    ssize_t n = ::recv(socket_fd, chunk, sizeof(chunk), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    buffer.append(chunk, static_cast<size_t>(n));

    size_t newline;
    while ((newline = buffer.find('\n')) != std::string::npos) {
      std::string line = buffer.substr(0, newline);
      buffer.erase(0, newline + 1);
      if (!line.empty()) {
        handle_line(line);
      }
    }
  }

  channel_open = false;
  fail_pending();
  if (running) {
    log::debug("MpvIpc", "control socket closed by player");
  }
}

void IpcClient::handle_line(const std::string &line) {
  rapidjson::Document message;
  if (message.Parse(line.c_str(), line.size()).HasParseError() ||
      !message.IsObject()) {
    log::debug("MpvIpc", "ignoring malformed line: {}", line);
    return;
  }

  if (message.HasMember("event") && message["event"].IsString()) {
    IpcEvent event;
    event.event = message["event"].GetString();
    if (message.HasMember("name") && message["name"].IsString()) {
      event.name = message["name"].GetString();
    }
    if (message.HasMember("data") && message["data"].IsNumber()) {
      event.number = message["data"].GetDouble();
    }
    if (message.HasMember("reason") && message["reason"].IsString()) {
      event.reason = message["reason"].GetString();
    }
    if (message.HasMember("playlist_entry_id") &&
        message["playlist_entry_id"].IsInt64()) {
      event.playlist_entry_id = message["playlist_entry_id"].GetInt64();
    }
    if (message.HasMember("file_error") && message["file_error"].IsString()) {
      event.file_error = message["file_error"].GetString();
    }
    if (on_event) {
      try {
        on_event(event);
      } catch (const std::exception &e) {
        log::error("MpvIpc", "event handler failed: {}", e.what());
      }
    }
    return;
  }

  if (!message.HasMember("request_id") || !message["request_id"].IsInt64()) {
    return;
  }

  IpcReply reply;
  if (message.HasMember("error") && message["error"].IsString()) {
    reply.error = message["error"].GetString();
  }
  reply.ok = reply.error == "success";
  if (message.HasMember("data")) {
    const auto &data = message["data"];
    if (data.IsNumber()) {
      reply.number = data.GetDouble();
    } else if (data.IsString()) {
      reply.text = std::string(data.GetString(), data.GetStringLength());
    }
  }

  std::lock_guard<std::mutex> lock(pending_mutex);
  auto it = pending.find(message["request_id"].GetInt64());
  if (it == pending.end()) {
    // Caller already gave up on this request.
    return;
  }
  it->second.set_value(std::move(reply));
  pending.erase(it);
}

void IpcClient::fail_pending() {
  std::lock_guard<std::mutex> lock(pending_mutex);
  for (auto &[id, promise] : pending) {
    promise.set_exception(std::make_exception_ptr(
        CueError(ErrorCode::ChannelClosed, "control socket closed")));
  }
  pending.clear();
}

void IpcClient::close() {
  std::lock_guard<std::mutex> lock(close_mutex);
  running = false;
  if (socket_fd >= 0) {
    ::shutdown(socket_fd, SHUT_RDWR);
  }
  if (reader_thread.joinable()) {
    reader_thread.join();
  }
  int fd = socket_fd.exchange(-1);
  if (fd >= 0) {
    ::close(fd);
  }
  channel_open = false;
}

} // namespace cue
