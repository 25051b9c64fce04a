#include "util/fd_io.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace meshlink {

ssize_t fd_read_some(int fd, uint8_t* buffer, size_t length) {
  const ssize_t n = ::read(fd, buffer, length);
  if (n > 0) {
    return n;
  }
  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
    return 0;
  }
  return -1;
}

bool fd_write_all(int fd, const char* data, size_t length, uint32_t timeout_ms) {
  while (length > 0) {
    const ssize_t written = ::write(fd, data, length);
    if (written > 0) {
      data += written;
      length -= static_cast<size_t>(written);
      continue;
    }
    if (written < 0 && errno == EINTR) {
      continue;
    }
    if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      struct pollfd pfd;
      pfd.fd = fd;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      const int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
      if (ready > 0 && (pfd.revents & POLLOUT) != 0) {
        continue;
      }
      if (ready < 0 && errno == EINTR) {
        continue;
      }
    }
    return false;
  }
  return true;
}

bool fd_set_nonblocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

}  // namespace meshlink
