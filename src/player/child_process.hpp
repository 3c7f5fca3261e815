#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace cue {

// One spawned player process. The child's stdin is /dev/null and its
// stdout goes to our stderr, so it never reads or corrupts the `serve`
// protocol. Reaping happens under a mutex, so wait() and is_alive() may be
// called from different threads.
class ChildProcess {
public:
  // argv[0] is looked up on PATH. Throws CueError(SpawnFailed) when the
  // executable cannot be started.
  static std::unique_ptr<ChildProcess> spawn(const std::vector<std::string> &argv);

  // Only spawn() can name the tag.
  struct SpawnedTag {
  private:
    explicit SpawnedTag() = default;
    friend class ChildProcess;
  };
  ChildProcess(SpawnedTag, pid_t pid) : child_pid(pid) {}

  // Kills and reaps a child that is still running.
  ~ChildProcess();

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  pid_t pid() const { return child_pid; }

  bool is_alive();

  // Blocks until exit. Exit code, or 128 + signal number.
  int wait();

  std::optional<int> wait_for(std::chrono::milliseconds timeout);

  void send_signal(int signal);

  // SIGTERM, then SIGKILL once `grace` has passed.
  int terminate(std::chrono::milliseconds grace);

  std::optional<int> exit_status() const;

private:
  // Requires reap_mutex. Returns true once the child has been reaped.
  bool reap_locked(bool block);

  pid_t child_pid;
  mutable std::mutex reap_mutex;
  bool exited = false;
  int status = -1;
};

} // namespace cue
