#include "child_process.hpp"
#include "../common/log.hpp"
#include "../core/errors.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cue {

namespace {

int decode_status(int raw) {
  if (WIFEXITED(raw)) {
    return WEXITSTATUS(raw);
  }
  if (WIFSIGNALED(raw)) {
    return 128 + WTERMSIG(raw);
  }
  return -1;
}

} // namespace

std::unique_ptr<ChildProcess>
ChildProcess::spawn(const std::vector<std::string> &argv) {
  if (argv.empty() || argv[0].empty()) {
    throw CueError(ErrorCode::SpawnFailed, "no player executable configured");
  }

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  // The child reports a failed exec through this pipe; a successful exec
  // closes it (O_CLOEXEC) and the parent reads EOF.
  int error_pipe[2];
  if (pipe2(error_pipe, O_CLOEXEC) != 0) {
    throw CueError(ErrorCode::SpawnFailed,
                   std::string("pipe: ") + strerror(errno));
  }

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close(error_pipe[0]);
    close(error_pipe[1]);
    throw CueError(ErrorCode::SpawnFailed, std::string("fork: ") + strerror(err));
  }

  if (pid == 0) {
    close(error_pipe[0]);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(STDERR_FILENO, STDOUT_FILENO);
    execvp(args[0], args.data());
    int err = errno;
    ssize_t ignored = write(error_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  close(error_pipe[1]);
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(error_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(error_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int raw = 0;
    waitpid(pid, &raw, 0);
    throw CueError(ErrorCode::SpawnFailed,
                   argv[0] + ": " + strerror(child_errno));
  }

  log::debug("Process", "spawned {} as pid {}", argv[0], pid);
  return std::make_unique<ChildProcess>(SpawnedTag(), pid);
}

ChildProcess::~ChildProcess() {
  if (is_alive()) {
    log::warn("Process", "pid {} still running, killing it", child_pid);
    send_signal(SIGKILL);
    wait();
  }
}

bool ChildProcess::reap_locked(bool block) {
  if (exited) {
    return true;
  }
  int raw = 0;
  pid_t result;
  do {
    result = waitpid(child_pid, &raw, block ? 0 : WNOHANG);
  } while (result < 0 && errno == EINTR);

  if (result == child_pid) {
    exited = true;
    status = decode_status(raw);
    log::debug("Process", "pid {} exited with {}", child_pid, status);
    return true;
  }
  if (result < 0) {
    // ECHILD: nothing left to reap.
    exited = true;
    return true;
  }
  return false;
}

bool ChildProcess::is_alive() {
  std::lock_guard<std::mutex> lock(reap_mutex);
  return !reap_locked(false);
}

int ChildProcess::wait() {
  {
    std::lock_guard<std::mutex> lock(reap_mutex);
    if (exited) {
      return status;
    }
  }
  // Block without reaping so the reap itself stays under the mutex.
  siginfo_t info;
  while (waitid(P_PID, child_pid, &info, WEXITED | WNOWAIT) < 0 &&
         errno == EINTR) {
  }
  std::lock_guard<std::mutex> lock(reap_mutex);
  reap_locked(true);
  return status;
}

std::optional<int> ChildProcess::wait_for(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    {
      std::lock_guard<std::mutex> lock(reap_mutex);
      if (reap_locked(false)) {
        return status;
      }
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void ChildProcess::send_signal(int signal) {
  std::lock_guard<std::mutex> lock(reap_mutex);
  if (!exited) {
    ::kill(child_pid, signal);
  }
}

int ChildProcess::terminate(std::chrono::milliseconds grace) {
  send_signal(SIGTERM);
  if (auto code = wait_for(grace)) {
    return *code;
  }
  log::warn("Process", "pid {} ignored SIGTERM, sending SIGKILL", child_pid);
  send_signal(SIGKILL);
  return wait();
}

std::optional<int> ChildProcess::exit_status() const {
  std::lock_guard<std::mutex> lock(reap_mutex);
  if (!exited) {
    return std::nullopt;
  }
  return status;
}

} // namespace cue
