#include "transport/SerialTransport.h"

#include <string.h>

#include "protocol/link_protocol.h"
#include "util/log.h"
#include "util/string_utils.h"

namespace meshlink {
namespace {

constexpr const char* kTag = "Serial";
constexpr size_t kReadChunk = 256;

}  // namespace

SerialTransport::SerialTransport(ISerialPortProvider& provider, const IResponseParser& parser,
                                 const Clock& clock)
    : _provider(provider),
      _parser(parser),
      _stream(),
      _framer(),
      _line(),
      _correlator(clock),
      _accumulator(),
      _extra_terminator(),
      _active_id(0),
      _lines_received(0) {}

SerialTransport::~SerialTransport() { close(Error(ErrorCode::DISCONNECTED, "Serial transport destroyed")); }

Result<void> SerialTransport::open(const SerialEndpoint& endpoint) {
  if (isOpen()) {
    close(Error(ErrorCode::DISCONNECTED, "Serial port reopened"));
  }
  _framer.reset();
  _resetCommand();
  return _provider.open(endpoint, _stream);
}

void SerialTransport::close(const Error& reason) {
  _correlator.rejectAll(reason);
  _resetCommand();
  _framer.reset();
  if (_stream) {
    _stream->close();
    _stream.reset();
    MESHLINK_LOG_DEBUG(kTag, "Port closed: %s", reason.message.c_str());
  }
}

Result<void> SerialTransport::sendCommand(const char* command, uint32_t timeout_ms,
                                          PendingReply<CliReply>& reply,
                                          const char* extra_terminator) {
  if (!isOpen()) {
    return make_error(ErrorCode::NOT_READY, "Serial port not open");
  }

  Result<uint32_t> id = _correlator.dispatch(command, timeout_ms, reply);
  if (!id) {
    return make_error(Error::format(ErrorCode::BUSY, "CLI command already outstanding, dropped: %s",
                                    command));
  }

  _accumulator.clear();
  _extra_terminator.clear();
  if (extra_terminator != nullptr) {
    _extra_terminator.assign(extra_terminator);
  }
  _active_id = id.value();

  MESHLINK_LOG_DEBUG(kTag, "-> %s", command);
  if (!_stream->writeAll(command, strlen(command)) || !_stream->writeAll("\n", 1)) {
    _correlator.forget(_active_id);
    _resetCommand();
    return make_error(Error::format(ErrorCode::TRANSPORT, "Serial write failed: %s", command));
  }
  return Result<void>();
}

void SerialTransport::process(bool hangup) {
  if (isOpen()) {
    uint8_t chunk[kReadChunk];
    for (;;) {
      const ssize_t n = _stream->readSome(chunk, sizeof(chunk));
      if (n < 0) {
        hangup = true;
        break;
      }
      if (n == 0) {
        break;
      }
      for (ssize_t i = 0; i < n; ++i) {
        if (_framer.consume(static_cast<char>(chunk[i]), _line)) {
          _handleLine(view_of(_line));
        }
      }
      if (!isOpen()) {
        break;
      }
    }
    if (hangup && isOpen()) {
      MESHLINK_LOG_ERROR(kTag, "Serial port closed by device");
      close(Error(ErrorCode::TRANSPORT, "Serial port closed"));
    }
  }

  if (_correlator.tick() > 0) {
    MESHLINK_LOG_WARN(kTag, "CLI command timed out");
  }
  if (_active_id != 0 && !_correlator.contains(_active_id)) {
    _resetCommand();
  }
}

void SerialTransport::_handleLine(etl::string_view line) {
  ++_lines_received;
  MESHLINK_LOG_DEBUG(kTag, "<- %.*s", static_cast<int>(line.size()), line.data());

  if (_line_handler.is_valid()) {
    _line_handler(line);
  }

  PublicKeyHex from;
  MessageText text;
  if (_parser.parsePush(line, from, text)) {
    if (_push_handler.is_valid()) {
      _push_handler(from, text);
    }
    return;
  }

  if (_active_id == 0) {
    return;
  }

  if (!_accumulator.empty()) {
    _accumulator.push_back('\n');
  }
  _accumulator.append(line.data(), line.size());

  if (_isTerminal()) {
    const uint32_t id = _active_id;
    CliReply reply;
    assign_bounded(reply, trim(view_of(_accumulator)));
    _resetCommand();
    _correlator.resolve(id, etl::move(reply));
  }
}

bool SerialTransport::_isTerminal() const {
  const etl::string_view text = view_of(_accumulator);
  if (contains(text, protocol::cli::kPromptMarker) || contains(text, protocol::cli::kOkMarker) ||
      contains(text, protocol::cli::kErrorMarker)) {
    return true;
  }
  return !_extra_terminator.empty() && contains(text, _extra_terminator.c_str());
}

void SerialTransport::_resetCommand() {
  _active_id = 0;
  _accumulator.clear();
  _extra_terminator.clear();
}

}  // namespace meshlink
