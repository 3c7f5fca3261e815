// Stand-in for mpv in driver and coordinator tests. Speaks the subset of
// the JSON IPC protocol cue uses and plays a virtual file on a clock.
//
//   --input-ipc-server=PATH  socket to listen on (required)
//   --fake-duration=D        media length in seconds (default 100)
//   --fake-speed=X           media seconds per wall second (default 1)
//   --fake-stop-at=P         leave once the last entry's position passes P;
//                            with P >= D it ends with reason "eof"
//   --fake-no-socket         never open the socket, just sleep
//   --fake-reject-load       answer loadfile with an error
//   --fake-load-error        accept loadfile but fail to open every entry
// Other arguments (mpv's own flags) are ignored.
//
// "loadfile F append" queues entries; at end of file the next one starts
// from the "start" property, as in mpv.

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

struct Options {
  std::string socket_path;
  double duration = 100.0;
  double speed = 1.0;
  std::optional<double> stop_at;
  bool no_socket = false;
  bool reject_load = false;
  bool load_error = false;
};

bool starts_with(const std::string &text, const std::string &prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

Options parse_options(int argc, char *argv[]) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&arg](const std::string &prefix) { return arg.substr(prefix.size()); };
    if (starts_with(arg, "--input-ipc-server=")) {
      options.socket_path = value("--input-ipc-server=");
    } else if (starts_with(arg, "--fake-duration=")) {
      options.duration = std::stod(value("--fake-duration="));
    } else if (starts_with(arg, "--fake-speed=")) {
      options.speed = std::stod(value("--fake-speed="));
    } else if (starts_with(arg, "--fake-stop-at=")) {
      options.stop_at = std::stod(value("--fake-stop-at="));
    } else if (arg == "--fake-no-socket") {
      options.no_socket = true;
    } else if (arg == "--fake-reject-load") {
      options.reject_load = true;
    } else if (arg == "--fake-load-error") {
      options.load_error = true;
    }
  }
  return options;
}

class FakePlayer {
public:
  FakePlayer(Options options, int client) : options(std::move(options)), client(client) {}

  // Returns when the player would exit.
  void run() {
    std::string buffer;
    auto last_tick = std::chrono::steady_clock::now();
    while (!quitting) {
      pollfd pfd{client, POLLIN, 0};
      int ready = ::poll(&pfd, 1, 20);
      if (ready > 0) {
        char chunk[4096];
        ssize_t n = ::recv(client, chunk, sizeof(chunk), 0);
        if (n <= 0) {
          return;
        }
        buffer.append(chunk, static_cast<size_t>(n));
        size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
          std::string line = buffer.substr(0, newline);
          buffer.erase(0, newline + 1);
          handle_command(line);
        }
      }

      auto now = std::chrono::steady_clock::now();
      double elapsed = std::chrono::duration<double>(now - last_tick).count();
      last_tick = now;
      if (playing) {
        advance(elapsed);
      }
    }
  }

private:
  void advance(double elapsed) {
    double before = position;
    position += elapsed * options.speed;
    bool last = current + 1 >= playlist.size();

    if (position >= options.duration) {
      position = options.duration;
      send_property("time-pos", position);
      send_end_file("eof");
      next_entry();
      return;
    }
    if (last && options.stop_at && before < *options.stop_at &&
        position >= *options.stop_at) {
      position = *options.stop_at;
      send_property("time-pos", position);
      send_end_file("quit");
      quitting = true;
      return;
    }
    send_property("time-pos", position);
  }

  void begin_entry(size_t index) {
    current = index;
    send_event("{\"event\":\"start-file\",\"playlist_entry_id\":" + entry_id() + "}");
    if (options.load_error) {
      send_line("{\"event\":\"end-file\",\"reason\":\"error\","
                "\"file_error\":\"unrecognized file format\",\"playlist_entry_id\":" +
                entry_id() + "}");
      next_entry();
      return;
    }
    position = start;
    playing = true;
    send_event("{\"event\":\"file-loaded\"}");
    send_property("duration", options.duration);
    send_property("time-pos", position);
  }

  // --idle=once: leave after the last entry.
  void next_entry() {
    if (current + 1 < playlist.size()) {
      begin_entry(current + 1);
    } else {
      quitting = true;
    }
  }

  std::string entry_id() const { return std::to_string(current + 1); }

  void handle_command(const std::string &line) {
    rapidjson::Document request;
    if (request.Parse(line.c_str()).HasParseError() || !request.IsObject() ||
        !request.HasMember("command") || !request["command"].IsArray() ||
        request["command"].Empty()) {
      return;
    }
    const auto &command = request["command"];
    int64_t id = request.HasMember("request_id") && request["request_id"].IsInt64()
                     ? request["request_id"].GetInt64()
                     : 0;
    std::string name = command[0].IsString() ? command[0].GetString() : "";

    if (name == "observe_property" && command.Size() >= 3 && command[2].IsString()) {
      std::string property = command[2].GetString();
      reply(id, "success");
      if (property == "time-pos" && playing) {
        send_property("time-pos", position);
      } else if (property == "duration" && playing) {
        send_property("duration", options.duration);
      } else {
        send_unavailable(property);
      }
    } else if (name == "set_property" && command.Size() >= 3) {
      std::string property = command[1].IsString() ? command[1].GetString() : "";
      if (property == "start") {
        // "none" reads as 0.
        start = command[2].IsString() ? std::atof(command[2].GetString())
                                      : command[2].GetDouble();
      }
      reply(id, "success");
    } else if (name == "loadfile" && command.Size() >= 2 && command[1].IsString()) {
      if (options.reject_load) {
        reply(id, "loading failed");
        return;
      }
      std::string mode = command.Size() >= 3 && command[2].IsString()
                             ? command[2].GetString()
                             : "replace";
      reply(id, "success");
      if (mode == "append") {
        playlist.push_back(command[1].GetString());
        return;
      }
      playlist.assign(1, command[1].GetString());
      begin_entry(0);
    } else if (name == "get_property" && command.Size() >= 2 &&
               command[1].IsString()) {
      std::string property = command[1].GetString();
      if (!playing) {
        reply(id, "property unavailable");
      } else if (property == "time-pos") {
        reply_number(id, position);
      } else if (property == "duration") {
        reply_number(id, options.duration);
      } else {
        reply(id, "property not found");
      }
    } else if (name == "quit") {
      reply(id, "success");
      if (playing) {
        send_end_file("quit");
      }
      quitting = true;
    } else {
      reply(id, "invalid parameter");
    }
  }

  void reply(int64_t id, const char *error) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("data");
    writer.Null();
    writer.Key("request_id");
    writer.Int64(id);
    writer.Key("error");
    writer.String(error);
    writer.EndObject();
    send_line(buffer.GetString());
  }

  void reply_number(int64_t id, double value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("data");
    writer.Double(value);
    writer.Key("request_id");
    writer.Int64(id);
    writer.Key("error");
    writer.String("success");
    writer.EndObject();
    send_line(buffer.GetString());
  }

  void send_property(const char *property, double value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("event");
    writer.String("property-change");
    writer.Key("id");
    writer.Int(std::strcmp(property, "time-pos") == 0 ? 1 : 2);
    writer.Key("name");
    writer.String(property);
    writer.Key("data");
    writer.Double(value);
    writer.EndObject();
    send_line(buffer.GetString());
  }

  void send_unavailable(const std::string &property) {
    send_line("{\"event\":\"property-change\",\"name\":\"" + property + "\"}");
  }

  void send_end_file(const char *reason) {
    send_line(std::string("{\"event\":\"end-file\",\"reason\":\"") + reason +
              "\",\"playlist_entry_id\":" + entry_id() + "}");
    playing = false;
  }

  void send_event(const std::string &json) { send_line(json); }

  void send_line(const std::string &json) {
    std::string line = json + "\n";
    size_t sent = 0;
    while (sent < line.size()) {
      ssize_t n = ::send(client, line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) {
        quitting = true;
        return;
      }
      sent += static_cast<size_t>(n);
    }
  }

  Options options;
  int client;
  std::vector<std::string> playlist;
  size_t current = 0;
  double start = 0.0;
  double position = 0.0;
  bool playing = false;
  bool quitting = false;
};

} // namespace

int main(int argc, char *argv[]) {
  Options options = parse_options(argc, argv);
  if (options.no_socket) {
    std::this_thread::sleep_for(std::chrono::seconds(30));
    return 0;
  }
  if (options.socket_path.empty()) {
    std::cerr << "fake_mpv: --input-ipc-server is required" << std::endl;
    return 2;
  }

  int server = ::socket(AF_UNIX, SOCK_STREAM, 0);
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (server < 0 || options.socket_path.size() >= sizeof(addr.sun_path)) {
    std::cerr << "fake_mpv: cannot create socket" << std::endl;
    return 2;
  }
  std::memcpy(addr.sun_path, options.socket_path.c_str(), options.socket_path.size() + 1);
  ::unlink(options.socket_path.c_str());
  if (::bind(server, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
      ::listen(server, 1) != 0) {
    std::cerr << "fake_mpv: cannot listen on " << options.socket_path << std::endl;
    return 2;
  }

  int client = ::accept(server, nullptr, nullptr);
  if (client < 0) {
    return 2;
  }
  FakePlayer player(options, client);
  player.run();

  ::close(client);
  ::close(server);
  ::unlink(options.socket_path.c_str());
  return 0;
}
