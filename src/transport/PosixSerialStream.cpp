#include "transport/ByteStream.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

#include "util/fd_io.h"
#include "util/log.h"

namespace meshlink {
namespace {

constexpr const char* kTag = "Serial";
constexpr uint32_t kWriteTimeoutMs = 1000;

bool baud_to_speed(uint32_t baud, speed_t& speed) {
  switch (baud) {
    case 9600: speed = B9600; return true;
    case 19200: speed = B19200; return true;
    case 38400: speed = B38400; return true;
    case 57600: speed = B57600; return true;
    case 115200: speed = B115200; return true;
    case 230400: speed = B230400; return true;
#ifdef B460800
    case 460800: speed = B460800; return true;
#endif
#ifdef B921600
    case 921600: speed = B921600; return true;
#endif
    default: return false;
  }
}

Result<void> configure_port(int fd, uint32_t baud) {
  speed_t speed;
  if (!baud_to_speed(baud, speed)) {
    return make_error(Error::format(ErrorCode::CONFIGURATION, "Unsupported baud rate %u",
                                    static_cast<unsigned>(baud)));
  }

  struct termios tty;
  if (tcgetattr(fd, &tty) != 0) {
    return make_error(Error::format(ErrorCode::TRANSPORT, "tcgetattr failed: %s", strerror(errno)));
  }

  cfsetospeed(&tty, speed);
  cfsetispeed(&tty, speed);

  // 8N1, no flow control, raw in both directions.
  tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
  tty.c_cflag |= CS8 | CREAD | CLOCAL;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY | ICRNL | INLCR | IGNCR);
  tty.c_lflag &= ~(ICANON | ECHO | ECHOE | ECHONL | ISIG | IEXTEN);
  tty.c_oflag &= ~OPOST;
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (tcsetattr(fd, TCSANOW, &tty) != 0) {
    return make_error(Error::format(ErrorCode::TRANSPORT, "tcsetattr failed: %s", strerror(errno)));
  }
  tcflush(fd, TCIOFLUSH);
  return Result<void>();
}

}  // namespace

ssize_t PosixSerialStream::readSome(uint8_t* buffer, size_t length) {
  if (_fd < 0) {
    return -1;
  }
  // With VMIN=0/VTIME=0 the tty reports "nothing pending" as 0, not EOF.
  // Unplugging surfaces as EIO here or as POLLHUP in the caller's poll().
  const ssize_t n = ::read(_fd, buffer, length);
  if (n >= 0) {
    return n;
  }
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
    return 0;
  }
  return -1;
}

bool PosixSerialStream::writeAll(const char* data, size_t length) {
  if (_fd < 0) {
    return false;
  }
  return fd_write_all(_fd, data, length, kWriteTimeoutMs);
}

void PosixSerialStream::close() {
  if (_fd >= 0) {
    ::close(_fd);
    _fd = -1;
  }
}

Result<void> PosixSerialPortProvider::open(const SerialEndpoint& endpoint,
                                           std::unique_ptr<ByteStream>& out) {
  const int fd = ::open(endpoint.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    return make_error(Error::format(ErrorCode::TRANSPORT, "Failed to open %s: %s",
                                    endpoint.path.c_str(), strerror(errno)));
  }

  Result<void> configured = configure_port(fd, endpoint.baud);
  if (!configured) {
    ::close(fd);
    return configured;
  }

  out.reset(new PosixSerialStream(fd));
  MESHLINK_LOG_INFO(kTag, "Opened %s at %u baud", endpoint.path.c_str(),
                    static_cast<unsigned>(endpoint.baud));
  return Result<void>();
}

}  // namespace meshlink
