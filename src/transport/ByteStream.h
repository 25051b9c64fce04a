#ifndef MESHLINK_TRANSPORT_BYTE_STREAM_H
#define MESHLINK_TRANSPORT_BYTE_STREAM_H

#include <stddef.h>
#include <stdint.h>
#include <sys/types.h>

#include <memory>

#include "config/ConnectionConfig.h"
#include "link_error.h"

namespace meshlink {

// Bidirectional byte channel to a locally attached device.
class ByteStream {
 public:
  virtual ~ByteStream() {}

  // Descriptor to poll for readability, or -1 when not pollable.
  virtual int fd() const = 0;

  // >0 bytes read, 0 when nothing is pending, -1 once the device is gone.
  virtual ssize_t readSome(uint8_t* buffer, size_t length) = 0;

  virtual bool writeAll(const char* data, size_t length) = 0;

  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

class ISerialPortProvider {
 public:
  virtual ~ISerialPortProvider() {}
  virtual Result<void> open(const SerialEndpoint& endpoint, std::unique_ptr<ByteStream>& out) = 0;
};

// termios-backed port: raw mode, 8N1, no flow control, nonblocking.
class PosixSerialStream : public ByteStream {
 public:
  explicit PosixSerialStream(int fd) : _fd(fd) {}
  ~PosixSerialStream() override { close(); }

  PosixSerialStream(const PosixSerialStream&) = delete;
  PosixSerialStream& operator=(const PosixSerialStream&) = delete;

  int fd() const override { return _fd; }
  ssize_t readSome(uint8_t* buffer, size_t length) override;
  bool writeAll(const char* data, size_t length) override;
  void close() override;
  bool isOpen() const override { return _fd >= 0; }

 private:
  int _fd;
};

class PosixSerialPortProvider : public ISerialPortProvider {
 public:
  Result<void> open(const SerialEndpoint& endpoint, std::unique_ptr<ByteStream>& out) override;
};

}  // namespace meshlink

#endif  // MESHLINK_TRANSPORT_BYTE_STREAM_H
