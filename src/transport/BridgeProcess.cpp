#include "transport/BridgeProcess.h"

#include "util/fd_io.h"
#include "util/log.h"
#include "util/string_utils.h"

namespace meshlink {
namespace {

constexpr const char* kTag = "Bridge";
constexpr size_t kReadChunk = 4096;

}  // namespace

BridgeProcess::BridgeProcess(const Clock& clock, const BridgeCommandLine& command)
    : _clock(clock),
      _command(command),
      _child(clock),
      _correlator(clock),
      _stdout_framer(),
      _stderr_framer(),
      _line(),
      _err_line(),
      _request(),
      _ready_info(),
      _ready(false),
      _lines_received(0),
      _late_responses(0),
      _exit_handler() {
  _ready_info.meshcore_available = false;
  _ready_info.tcp_available = false;
}

BridgeProcess::~BridgeProcess() { stop(0); }

Result<void> BridgeProcess::start() {
  if (_child.running()) {
    return make_error(ErrorCode::BUSY, "Bridge already running");
  }
  _ready = false;
  _ready_info.meshcore_available = false;
  _ready_info.tcp_available = false;
  _stdout_framer.reset();
  _stderr_framer.reset();
  return _child.spawn(view_of(_command));
}

void BridgeProcess::stop(uint32_t grace_ms) {
  _ready = false;
  _correlator.rejectAll(Error(ErrorCode::DISCONNECTED, "Bridge stopped"));
  if (!_child.running()) {
    _child.closeStdin();
    _child.closeOutputs();
    return;
  }

  // EOF on stdin is the bridge's cue to exit on its own.
  _child.closeStdin();
  if (!_child.waitExit(grace_ms)) {
    _child.terminate(grace_ms);
  }
  _child.closeOutputs();
  MESHLINK_LOG_INFO(kTag, "Bridge stopped (status %d)", _child.exitStatus());
}

Result<void> BridgeProcess::sendCommand(const char* cmd, JsonObjectConst params,
                                        uint32_t timeout_ms, BridgeReplySlot& reply) {
  if (!_child.running()) {
    return make_error(ErrorCode::TRANSPORT, "Bridge process not running");
  }
  if (!_ready) {
    return make_error(Error::format(ErrorCode::NOT_READY, "Bridge not ready for %s", cmd));
  }

  Result<uint32_t> id = _correlator.dispatch(cmd, timeout_ms, reply);
  if (!id) {
    return make_error(id.error());
  }

  if (!protocol::BridgeCodec::encodeRequest(id.value(), cmd, params, _request)) {
    _correlator.forget(id.value());
    return make_error(Error::format(ErrorCode::VALIDATION, "Request too large: %s", cmd));
  }

  MESHLINK_LOG_DEBUG(kTag, "-> %.*s", static_cast<int>(_request.size() - 1), _request.data());
  if (!_child.writeAll(_request.data(), _request.size())) {
    _correlator.forget(id.value());
    return make_error(Error::format(ErrorCode::TRANSPORT, "Bridge write failed: %s", cmd));
  }
  return Result<void>();
}

void BridgeProcess::process() {
  if (_child.stdoutFd() >= 0) {
    _drainStdout();
  }
  if (_child.stderrFd() >= 0) {
    _drainStderr();
  }
  if (_correlator.tick() > 0) {
    MESHLINK_LOG_WARN(kTag, "Bridge command timed out");
  }
}

size_t BridgeProcess::pollFds(struct pollfd* fds, size_t max) const {
  size_t count = 0;
  if (count < max && _child.stdoutFd() >= 0) {
    fds[count].fd = _child.stdoutFd();
    fds[count].events = POLLIN;
    fds[count].revents = 0;
    ++count;
  }
  if (count < max && _child.stderrFd() >= 0) {
    fds[count].fd = _child.stderrFd();
    fds[count].events = POLLIN;
    fds[count].revents = 0;
    ++count;
  }
  return count;
}

void BridgeProcess::_drainStdout() {
  uint8_t chunk[kReadChunk];
  for (;;) {
    const ssize_t n = fd_read_some(_child.stdoutFd(), chunk, sizeof(chunk));
    if (n == 0) {
      return;
    }
    if (n < 0) {
      _handleExit();
      return;
    }
    for (ssize_t i = 0; i < n; ++i) {
      const uint32_t overflows = _stdout_framer.overflows();
      if (_stdout_framer.consume(static_cast<char>(chunk[i]), _line)) {
        _handleLine(view_of(_line));
      } else if (_stdout_framer.overflows() != overflows) {
        _handleOverflow(_stdout_framer.discardedHead());
      }
    }
  }
}

void BridgeProcess::_drainStderr() {
  uint8_t chunk[kReadChunk];
  for (;;) {
    const ssize_t n = fd_read_some(_child.stderrFd(), chunk, sizeof(chunk));
    if (n == 0) {
      return;
    }
    if (n < 0) {
      _child.closeStderr();
      return;
    }
    for (ssize_t i = 0; i < n; ++i) {
      if (_stderr_framer.consume(static_cast<char>(chunk[i]), _err_line) && !_err_line.empty()) {
        MESHLINK_LOG_INFO(kTag, "stderr: %s", _err_line.c_str());
      }
    }
  }
}

void BridgeProcess::_handleLine(etl::string_view line) {
  line = trim(line);
  if (line.empty()) {
    return;
  }
  ++_lines_received;

  protocol::BridgeReply frame;
  Result<protocol::BridgeFrameKind> kind = protocol::BridgeCodec::decodeFrame(line, frame.doc);
  if (!kind) {
    MESHLINK_LOG_WARN(kTag, "%s: %.*s", kind.error().message.c_str(),
                      static_cast<int>(line.size() < 120 ? line.size() : 120), line.data());
    return;
  }

  switch (kind.value()) {
    case protocol::BridgeFrameKind::READY:
      _ready_info = protocol::BridgeCodec::readReady(frame.doc);
      _ready = true;
      MESHLINK_LOG_INFO(kTag, "Bridge ready (meshcore=%d, tcp=%d)",
                        _ready_info.meshcore_available ? 1 : 0,
                        _ready_info.tcp_available ? 1 : 0);
      return;

    case protocol::BridgeFrameKind::RESPONSE: {
      protocol::ResponseHeader header;
      if (!protocol::BridgeCodec::readResponseHeader(frame.doc, header)) {
        MESHLINK_LOG_WARN(kTag, "Response with unusable id dropped");
        return;
      }
      bool matched;
      if (header.success) {
        matched = _correlator.resolve(header.id, etl::move(frame));
      } else {
        matched = _correlator.reject(header.id, Error(ErrorCode::PROTOCOL, view_of(header.error)));
      }
      if (!matched) {
        ++_late_responses;
        MESHLINK_LOG_DEBUG(kTag, "Discarding response for unknown id %u",
                           static_cast<unsigned>(header.id));
      }
      return;
    }

    case protocol::BridgeFrameKind::UNKNOWN:
      MESHLINK_LOG_DEBUG(kTag, "Ignoring frame: %.*s", static_cast<int>(line.size()), line.data());
      return;
  }
}

// The rest of the line is dropped; fail its command now rather than let it
// run into the timeout.
void BridgeProcess::_handleOverflow(etl::string_view head) {
  uint32_t id = 0;
  if (!protocol::BridgeCodec::peekResponseId(head, id)) {
    MESHLINK_LOG_ERROR(kTag, "Bridge frame exceeds %u bytes, dropped",
                       static_cast<unsigned>(MESHLINK_BRIDGE_LINE_MAX));
    return;
  }
  const bool matched = _correlator.reject(
      id, Error::format(ErrorCode::PROTOCOL, "Bridge response exceeds %u bytes",
                        static_cast<unsigned>(MESHLINK_BRIDGE_LINE_MAX)));
  MESHLINK_LOG_ERROR(kTag, "Response %u exceeds %u bytes, dropped%s", static_cast<unsigned>(id),
                     static_cast<unsigned>(MESHLINK_BRIDGE_LINE_MAX),
                     matched ? "" : " (no pending command)");
}

void BridgeProcess::_handleExit() {
  _ready = false;
  _child.closeOutputs();
  _child.waitExit(100);
  const size_t rejected =
      _correlator.rejectAll(Error(ErrorCode::TRANSPORT, "Bridge process exited"));
  MESHLINK_LOG_ERROR(kTag, "Bridge process exited (status %d), %u pending commands rejected",
                     _child.exitStatus(), static_cast<unsigned>(rejected));
  if (_exit_handler.is_valid()) {
    _exit_handler(_child.exitStatus());
  }
}

}  // namespace meshlink
