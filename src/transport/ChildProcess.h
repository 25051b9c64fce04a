#ifndef MESHLINK_TRANSPORT_CHILD_PROCESS_H
#define MESHLINK_TRANSPORT_CHILD_PROCESS_H

#include <stdint.h>
#include <sys/types.h>

#include <etl/string_view.h>

#include "link_error.h"
#include "util/Clock.h"

namespace meshlink {

/**
 * @brief A spawned child with pipes on stdin, stdout and stderr.
 *
 * All three parent-side descriptors are nonblocking and close-on-exec. The
 * destructor never leaves a zombie behind: it terminates and reaps.
 */
class ChildProcess {
 public:
  explicit ChildProcess(const Clock& clock);
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  // Splits @p command_line on whitespace and spawns it via PATH lookup.
  Result<void> spawn(etl::string_view command_line);

  bool running() const { return _pid > 0; }
  pid_t pid() const { return _pid; }

  int stdinFd() const { return _stdin_fd; }
  int stdoutFd() const { return _stdout_fd; }
  int stderrFd() const { return _stderr_fd; }

  bool writeAll(const char* data, size_t length);
  void closeStdin();
  void closeStderr();
  void closeOutputs();

  // Non-blocking reap. Returns true once the child has exited.
  bool poll();

  // Waits up to @p timeout_ms for a voluntary exit.
  bool waitExit(uint32_t timeout_ms);

  // SIGTERM, then SIGKILL after @p grace_ms, then reap. Closes every pipe.
  void terminate(uint32_t grace_ms);

  int exitStatus() const { return _exit_status; }

 private:
  void _reaped(int status);

  const Clock& _clock;
  pid_t _pid;
  int _stdin_fd;
  int _stdout_fd;
  int _stderr_fd;
  int _exit_status;
};

}  // namespace meshlink

#endif  // MESHLINK_TRANSPORT_CHILD_PROCESS_H
