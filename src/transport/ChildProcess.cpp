#include "transport/ChildProcess.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <string.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <etl/string.h>
#include <etl/vector.h>

#include "config/ConnectionConfig.h"
#include "util/fd_io.h"
#include "util/log.h"
#include "util/string_utils.h"

extern char** environ;

namespace meshlink {
namespace {

constexpr const char* kTag = "Bridge";
constexpr size_t kMaxArgs = 16;
constexpr uint32_t kWriteTimeoutMs = 2000;
constexpr uint32_t kReapPollMs = 10;

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void sleep_ms(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>((ms % 1000U) * 1000000UL);
  nanosleep(&ts, nullptr);
}

// Writes to a bridge that already exited must surface as EPIPE, not kill us.
void ignore_sigpipe() {
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = SIG_IGN;
  sigemptyset(&action.sa_mask);
  sigaction(SIGPIPE, &action, nullptr);
}

bool make_pipe(int fds[2]) {
  if (::pipe(fds) != 0) {
    return false;
  }
  fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
}

}  // namespace

ChildProcess::ChildProcess(const Clock& clock)
    : _clock(clock), _pid(-1), _stdin_fd(-1), _stdout_fd(-1), _stderr_fd(-1), _exit_status(-1) {}

ChildProcess::~ChildProcess() { terminate(0); }

Result<void> ChildProcess::spawn(etl::string_view command_line) {
  if (running()) {
    return make_error(ErrorCode::BUSY, "Child process already running");
  }

  etl::vector<etl::string<kBridgeCommandMax>, kMaxArgs> args;
  if (!split_command_line(command_line, args) || args.empty()) {
    return make_error(ErrorCode::CONFIGURATION, "Invalid bridge command line");
  }
  char* argv[kMaxArgs + 1];
  for (size_t i = 0; i < args.size(); ++i) {
    argv[i] = &args[i][0];
  }
  argv[args.size()] = nullptr;

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (!make_pipe(in_pipe) || !make_pipe(out_pipe) || !make_pipe(err_pipe)) {
    const Error error = Error::format(ErrorCode::TRANSPORT, "pipe() failed: %s", strerror(errno));
    close_fd(in_pipe[0]);
    close_fd(in_pipe[1]);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    return make_error(error);
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, in_pipe[0], STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);

  ignore_sigpipe();

  pid_t pid = -1;
  const int rc = posix_spawnp(&pid, argv[0], &actions, nullptr, argv, environ);
  posix_spawn_file_actions_destroy(&actions);

  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);

  if (rc != 0) {
    close_fd(in_pipe[1]);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    return make_error(Error::format(ErrorCode::TRANSPORT, "Failed to spawn %s: %s", argv[0],
                                    strerror(rc)));
  }

  _pid = pid;
  _stdin_fd = in_pipe[1];
  _stdout_fd = out_pipe[0];
  _stderr_fd = err_pipe[0];
  _exit_status = -1;
  fd_set_nonblocking(_stdin_fd);
  fd_set_nonblocking(_stdout_fd);
  fd_set_nonblocking(_stderr_fd);

  MESHLINK_LOG_INFO(kTag, "Spawned %s (pid %d)", argv[0], static_cast<int>(_pid));
  return Result<void>();
}

bool ChildProcess::writeAll(const char* data, size_t length) {
  if (_stdin_fd < 0) {
    return false;
  }
  return fd_write_all(_stdin_fd, data, length, kWriteTimeoutMs);
}

void ChildProcess::closeStdin() { close_fd(_stdin_fd); }

void ChildProcess::closeStderr() { close_fd(_stderr_fd); }

void ChildProcess::closeOutputs() {
  close_fd(_stdout_fd);
  close_fd(_stderr_fd);
}

bool ChildProcess::poll() {
  if (_pid <= 0) {
    return true;
  }
  int status = 0;
  const pid_t rc = ::waitpid(_pid, &status, WNOHANG);
  if (rc == _pid) {
    _reaped(status);
    return true;
  }
  if (rc < 0 && errno == ECHILD) {
    _pid = -1;
    return true;
  }
  return false;
}

bool ChildProcess::waitExit(uint32_t timeout_ms) {
  const uint32_t deadline = _clock.millis() + timeout_ms;
  while (!poll()) {
    if (millis_until(deadline, _clock.millis()) <= 0) {
      return false;
    }
    sleep_ms(kReapPollMs);
  }
  return true;
}

void ChildProcess::terminate(uint32_t grace_ms) {
  closeStdin();
  if (_pid > 0 && !poll()) {
    ::kill(_pid, SIGTERM);
    if (!waitExit(grace_ms)) {
      MESHLINK_LOG_WARN(kTag, "pid %d ignored SIGTERM, sending SIGKILL", static_cast<int>(_pid));
      ::kill(_pid, SIGKILL);
      int status = 0;
      while (::waitpid(_pid, &status, 0) < 0 && errno == EINTR) {
      }
      _reaped(status);
    }
  }
  closeOutputs();
}

void ChildProcess::_reaped(int status) {
  if (WIFEXITED(status)) {
    _exit_status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    _exit_status = 128 + WTERMSIG(status);
  }
  MESHLINK_LOG_DEBUG(kTag, "pid %d exited with status %d", static_cast<int>(_pid), _exit_status);
  _pid = -1;
}

}  // namespace meshlink
