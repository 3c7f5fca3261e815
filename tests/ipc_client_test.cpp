#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "player/ipc_client.hpp"
#include "test_support.hpp"

#include <rapidjson/document.h>

#include <atomic>
#include <cstring>
#include <mutex>
#include <thread>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace cue;
using namespace std::chrono_literals;

namespace {

// Minimal mpv-like peer. Understands:
//   ["echo", X]  -> data X
//   ["fail"]     -> error "property unavailable"
//   ["ignore"]   -> no reply
//   ["hangup"]   -> closes the connection
class FakeSocketServer {
public:
  explicit FakeSocketServer(std::string path) : socket_path(std::move(path)) {
    listen_fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, socket_path.c_str(), socket_path.size() + 1);
    ::unlink(socket_path.c_str());
    if (::bind(listen_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
        ::listen(listen_fd, 1) != 0) {
      ADD_FAILURE() << "cannot listen on " << socket_path;
    }
    worker = std::thread([this] { serve(); });
  }

  ~FakeSocketServer() {
    stopping = true;
    worker.join();
    hang_up();
    ::close(listen_fd);
    ::unlink(socket_path.c_str());
  }

  bool connected() const { return client_fd >= 0; }

  void send_line(const std::string &json) {
    std::lock_guard<std::mutex> lock(write_mutex);
    if (client_fd >= 0) {
      std::string line = json + "\n";
      ssize_t ignored = ::send(client_fd, line.data(), line.size(), MSG_NOSIGNAL);
      (void)ignored;
    }
  }

  int commands_seen() const { return commands; }

private:
  void serve() {
    while (!stopping && client_fd < 0) {
      pollfd pfd{listen_fd, POLLIN, 0};
      if (::poll(&pfd, 1, 20) > 0) {
        client_fd = ::accept(listen_fd, nullptr, nullptr);
      }
    }
    std::string buffer;
    while (!stopping && client_fd >= 0) {
      pollfd pfd{client_fd, POLLIN, 0};
      if (::poll(&pfd, 1, 20) <= 0) {
        continue;
      }
      char chunk[1024];
      ssize_t n = ::recv(client_fd, chunk, sizeof(chunk), 0);
      if (n <= 0) {
        break;
      }
      buffer.append(chunk, static_cast<size_t>(n));
      size_t newline;
      while ((newline = buffer.find('\n')) != std::string::npos) {
        std::string line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);
        handle(line);
      }
    }
  }

  void handle(const std::string &line) {
    ++commands;
    rapidjson::Document request;
    request.Parse(line.c_str());
    const auto &command = request["command"];
    int64_t id = request["request_id"].GetInt64();
    std::string name = command[0].GetString();

    if (name == "echo") {
      if (command[1].IsString()) {
        send_line("{\"request_id\":" + std::to_string(id) +
                  ",\"error\":\"success\",\"data\":\"" + command[1].GetString() + "\"}");
      } else {
        send_line("{\"request_id\":" + std::to_string(id) +
                  ",\"error\":\"success\",\"data\":" +
                  std::to_string(command[1].GetDouble()) + "}");
      }
    } else if (name == "fail") {
      send_line("{\"request_id\":" + std::to_string(id) +
                ",\"error\":\"property unavailable\"}");
    } else if (name == "hangup") {
      hang_up();
    }
  }

  void hang_up() {
    std::lock_guard<std::mutex> lock(write_mutex);
    if (client_fd >= 0) {
      ::close(client_fd);
      client_fd = -1;
    }
  }

  std::string socket_path;
  int listen_fd = -1;
  std::atomic<int> client_fd{-1};
  std::atomic<bool> stopping{false};
  std::atomic<int> commands{0};
  std::mutex write_mutex;
  std::thread worker;
};

} // namespace

class IpcClientTest : public ::testing::Test {
protected:
  cue::testing::TempDir dir;
  std::string socket_path = dir.file("mpv.sock");
};

TEST(IpcClientEncodingTest, CommandsAreJsonLines) {
  EXPECT_EQ(IpcClient::encode_command({std::string("get_property"), std::string("time-pos")}, 7),
            "{\"command\":[\"get_property\",\"time-pos\"],\"request_id\":7}\n");
  EXPECT_EQ(IpcClient::encode_command({std::string("observe_property"), int64_t(1),
                                       std::string("time-pos")},
                                      2),
            "{\"command\":[\"observe_property\",1,\"time-pos\"],\"request_id\":2}\n");
  EXPECT_EQ(IpcClient::encode_command({std::string("seek"), 12.5, true}, 3),
            "{\"command\":[\"seek\",12.5,true],\"request_id\":3}\n");
}

TEST_F(IpcClientTest, RepliesReachTheirCallers) {
  FakeSocketServer server(socket_path);
  IpcClient client;
  client.connect(socket_path, 2000ms);
  ASSERT_TRUE(client.is_open());

  auto text = client.request({std::string("echo"), std::string("hello")}, 1000ms);
  EXPECT_TRUE(text.ok);
  EXPECT_EQ(text.error, "success");
  EXPECT_EQ(text.text, std::optional<std::string>("hello"));

  std::vector<std::thread> callers;
  std::atomic<int> mismatches{0};
  for (int i = 0; i < 8; ++i) {
    callers.emplace_back([&client, &mismatches, i] {
      auto reply = client.request({std::string("echo"), double(i)}, 2000ms);
      if (!reply.number || *reply.number != i) {
        ++mismatches;
      }
    });
  }
  for (auto &caller : callers) {
    caller.join();
  }
  EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(IpcClientTest, ErrorRepliesAreNotOk) {
  FakeSocketServer server(socket_path);
  IpcClient client;
  client.connect(socket_path, 2000ms);

  auto reply = client.request({std::string("fail")}, 1000ms);
  EXPECT_FALSE(reply.ok);
  EXPECT_EQ(reply.error, "property unavailable");
  EXPECT_FALSE(reply.number.has_value());
}

TEST_F(IpcClientTest, EventsGoToTheHandler) {
  FakeSocketServer server(socket_path);
  IpcClient client;
  std::mutex events_mutex;
  std::vector<IpcEvent> events;
  client.set_event_handler([&](const IpcEvent &event) {
    std::lock_guard<std::mutex> lock(events_mutex);
    events.push_back(event);
  });
  client.connect(socket_path, 2000ms);
  ASSERT_TRUE(cue::testing::eventually([&] { return server.connected(); }));

  server.send_line("{\"event\":\"property-change\",\"id\":1,\"name\":\"time-pos\",\"data\":42.5}");
  server.send_line("{\"event\":\"end-file\",\"reason\":\"eof\",\"playlist_entry_id\":3}");
  server.send_line("not json at all");
  server.send_line("{\"event\":\"end-file\",\"reason\":\"error\","
                   "\"file_error\":\"unrecognized file format\"}");

  ASSERT_TRUE(cue::testing::eventually([&] {
    std::lock_guard<std::mutex> lock(events_mutex);
    return events.size() == 3;
  }));
  std::lock_guard<std::mutex> lock(events_mutex);
  EXPECT_EQ(events[0].event, "property-change");
  EXPECT_EQ(events[0].name, "time-pos");
  EXPECT_EQ(events[0].number, std::optional<double>(42.5));
  EXPECT_FALSE(events[0].playlist_entry_id.has_value());
  EXPECT_EQ(events[1].event, "end-file");
  EXPECT_EQ(events[1].reason, "eof");
  EXPECT_EQ(events[1].playlist_entry_id, std::optional<int64_t>(3));
  EXPECT_EQ(events[2].reason, "error");
  EXPECT_EQ(events[2].file_error, "unrecognized file format");
}

TEST_F(IpcClientTest, PostedCommandsAreSentWithoutWaiting) {
  FakeSocketServer server(socket_path);
  IpcClient client;
  EXPECT_FALSE(client.post({std::string("echo"), std::string("early")}));

  client.connect(socket_path, 2000ms);
  EXPECT_TRUE(client.post({std::string("echo"), std::string("late")}));
  ASSERT_TRUE(cue::testing::eventually([&] { return server.commands_seen() == 1; }));

  // The dropped reply does not confuse later requests.
  auto reply = client.request({std::string("echo"), std::string("next")}, 1000ms);
  EXPECT_EQ(reply.text, std::optional<std::string>("next"));
}

TEST_F(IpcClientTest, MissingReplyTimesOut) {
  FakeSocketServer server(socket_path);
  IpcClient client;
  client.connect(socket_path, 2000ms);

  try {
    client.request({std::string("ignore")}, 100ms);
    FAIL() << "expected QueryTimeout";
  } catch (const CueError &e) {
    EXPECT_EQ(e.code(), ErrorCode::QueryTimeout);
    EXPECT_TRUE(e.is_transient());
  }
  // The channel is still usable afterwards.
  EXPECT_TRUE(client.request({std::string("echo"), 1.0}, 1000ms).ok);
}

TEST_F(IpcClientTest, HangupFailsPendingAndLaterRequests) {
  FakeSocketServer server(socket_path);
  IpcClient client;
  client.connect(socket_path, 2000ms);

  try {
    client.request({std::string("hangup")}, 2000ms);
    FAIL() << "expected ChannelClosed";
  } catch (const CueError &e) {
    EXPECT_EQ(e.code(), ErrorCode::ChannelClosed);
  }
  EXPECT_TRUE(cue::testing::eventually([&] { return !client.is_open(); }));
  try {
    client.request({std::string("echo"), 1.0}, 100ms);
    FAIL() << "expected ChannelClosed";
  } catch (const CueError &e) {
    EXPECT_EQ(e.code(), ErrorCode::ChannelClosed);
  }
}

TEST_F(IpcClientTest, ConnectTimesOutWithoutSocket) {
  IpcClient client;
  auto started = std::chrono::steady_clock::now();
  try {
    client.connect(socket_path, 150ms);
    FAIL() << "expected ConnectTimeout";
  } catch (const CueError &e) {
    EXPECT_EQ(e.code(), ErrorCode::ConnectTimeout);
  }
  EXPECT_GE(std::chrono::steady_clock::now() - started, 150ms);
  EXPECT_FALSE(client.is_open());
}

TEST_F(IpcClientTest, ConnectStopsWhenToldTo) {
  IpcClient client;
  auto started = std::chrono::steady_clock::now();
  EXPECT_THROW(client.connect(socket_path, 5000ms, [] { return false; }), CueError);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 1000ms);
}

TEST_F(IpcClientTest, ConnectWaitsForLateSocket) {
  std::unique_ptr<FakeSocketServer> server;
  std::thread late([&] {
    std::this_thread::sleep_for(150ms);
    server = std::make_unique<FakeSocketServer>(socket_path);
  });
  IpcClient client;
  EXPECT_NO_THROW(client.connect(socket_path, 3000ms));
  late.join();
  EXPECT_TRUE(client.request({std::string("echo"), 2.0}, 1000ms).ok);
  client.close();
}

TEST_F(IpcClientTest, CloseIsIdempotent) {
  FakeSocketServer server(socket_path);
  IpcClient client;
  client.connect(socket_path, 2000ms);
  client.close();
  client.close();
  EXPECT_FALSE(client.is_open());
}
