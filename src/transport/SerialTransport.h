/**
 * @file SerialTransport.h
 * @brief Line-oriented request/response channel to a Repeater CLI.
 *
 * One physical channel carries both solicited replies and unsolicited push
 * lines. Every received line is handed to the line handler. Push lines
 * ("MSG:<key>:<text>") go to the push handler. All other lines are appended
 * to the reply of the outstanding command, which resolves once the reply
 * holds a terminal marker (">", "OK", "Error").
 */
#ifndef MESHLINK_TRANSPORT_SERIAL_TRANSPORT_H
#define MESHLINK_TRANSPORT_SERIAL_TRANSPORT_H

#include <stdint.h>

#include <memory>

#include <etl/delegate.h>
#include <etl/string.h>
#include <etl/string_view.h>

#include "correlator/CommandCorrelator.h"
#include "meshlink_config.h"
#include "protocol/LineFramer.h"
#include "protocol/ResponseParser.h"
#include "transport/ByteStream.h"
#include "util/Clock.h"

namespace meshlink {

using CliReply = etl::string<MESHLINK_CLI_REPLY_MAX>;

class SerialTransport {
 public:
  using LineHandler = etl::delegate<void(etl::string_view)>;
  using PushHandler = etl::delegate<void(const PublicKeyHex&, const MessageText&)>;

  SerialTransport(ISerialPortProvider& provider, const IResponseParser& parser,
                  const Clock& clock);
  ~SerialTransport();

  Result<void> open(const SerialEndpoint& endpoint);

  // Closes the port and rejects the outstanding command with @p reason.
  void close(const Error& reason);

  bool isOpen() const { return _stream && _stream->isOpen(); }
  int fd() const { return isOpen() ? _stream->fd() : -1; }

  /**
   * @brief Write "command\n" and park @p reply until a terminal marker.
   *
   * @param extra_terminator Additional substring that completes the reply
   *        (the firmware banner for the version probe), or nullptr.
   */
  Result<void> sendCommand(const char* command, uint32_t timeout_ms,
                           PendingReply<CliReply>& reply,
                           const char* extra_terminator = nullptr);

  // Drains readable bytes and expires the outstanding command.
  void process(bool hangup = false);

  int32_t nextDeadlineIn() const { return _correlator.nextDeadlineIn(); }
  bool commandPending() const { return !_correlator.empty(); }

  void onLine(const LineHandler& handler) { _line_handler = handler; }
  void onPush(const PushHandler& handler) { _push_handler = handler; }

  uint32_t linesReceived() const { return _lines_received; }
  uint32_t timeouts() const { return _correlator.timeouts(); }
  uint32_t overflows() const { return _framer.overflows(); }

 private:
  void _handleLine(etl::string_view line);
  void _resetCommand();
  bool _isTerminal() const;

  ISerialPortProvider& _provider;
  const IResponseParser& _parser;
  std::unique_ptr<ByteStream> _stream;
  LineFramer<MESHLINK_SERIAL_LINE_MAX> _framer;
  etl::string<MESHLINK_SERIAL_LINE_MAX> _line;
  CommandCorrelator<CliReply, 1> _correlator;
  CliReply _accumulator;
  etl::string<16> _extra_terminator;
  uint32_t _active_id;
  uint32_t _lines_received;
  LineHandler _line_handler;
  PushHandler _push_handler;
};

}  // namespace meshlink

#endif  // MESHLINK_TRANSPORT_SERIAL_TRANSPORT_H
