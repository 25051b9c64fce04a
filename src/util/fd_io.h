#ifndef MESHLINK_UTIL_FD_IO_H
#define MESHLINK_UTIL_FD_IO_H

#include <stddef.h>
#include <stdint.h>
#include <sys/types.h>

namespace meshlink {

// Nonblocking read: >0 bytes read, 0 when nothing is available (EAGAIN or
// EINTR), -1 on EOF or error.
ssize_t fd_read_some(int fd, uint8_t* buffer, size_t length);

// Writes every byte, waiting for POLLOUT in between. Gives up after
// @p timeout_ms without progress.
bool fd_write_all(int fd, const char* data, size_t length, uint32_t timeout_ms);

bool fd_set_nonblocking(int fd);

}  // namespace meshlink

#endif  // MESHLINK_UTIL_FD_IO_H
