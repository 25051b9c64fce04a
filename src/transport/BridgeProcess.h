/**
 * @file BridgeProcess.h
 * @brief Persistent bridge subprocess speaking JSON lines on stdio.
 *
 * Lifecycle: start() spawns the child, which must announce itself with a
 * {"type":"ready"} frame before any command is accepted. Commands sent before
 * that fail with NOT_READY. Responses are matched by id; a response whose id
 * already timed out is dropped. When the child exits every outstanding
 * command is rejected at once.
 */
#ifndef MESHLINK_TRANSPORT_BRIDGE_PROCESS_H
#define MESHLINK_TRANSPORT_BRIDGE_PROCESS_H

#include <stdint.h>

#include <etl/delegate.h>
#include <etl/string.h>

#include "config/ConnectionConfig.h"
#include "meshlink_config.h"
#include "protocol/LineFramer.h"
#include "transport/ChildProcess.h"
#include "transport/CompanionDriver.h"

namespace meshlink {

class BridgeProcess : public ICompanionDriver {
 public:
  using ExitHandler = etl::delegate<void(int)>;

  BridgeProcess(const Clock& clock, const BridgeCommandLine& command);
  ~BridgeProcess() override;

  Result<void> start() override;
  void stop(uint32_t grace_ms) override;

  bool running() const override { return _child.running(); }
  bool ready() const override { return _ready; }
  bool protocolAvailable() const override { return _ready_info.meshcore_available; }
  bool tcpAvailable() const { return _ready_info.tcp_available; }

  Result<void> sendCommand(const char* cmd, JsonObjectConst params, uint32_t timeout_ms,
                           BridgeReplySlot& reply) override;

  void process() override;

  int32_t nextDeadlineIn() const override { return _correlator.nextDeadlineIn(); }
  size_t pollFds(struct pollfd* fds, size_t max) const override;
  size_t pendingCount() const override { return _correlator.size(); }

  void onExit(const ExitHandler& handler) { _exit_handler = handler; }

  uint32_t linesReceived() const { return _lines_received; }
  uint32_t lateResponses() const { return _late_responses; }
  uint32_t timeouts() const { return _correlator.timeouts(); }
  uint32_t lineOverflows() const { return _stdout_framer.overflows(); }

#if defined(MESHLINK_HOST_TEST)
 public:
  bool hasPending(uint32_t id) const { return _correlator.contains(id); }
#endif

 private:
  void _drainStdout();
  void _drainStderr();
  void _handleLine(etl::string_view line);
  void _handleOverflow(etl::string_view head);
  void _handleExit();

  const Clock& _clock;
  BridgeCommandLine _command;
  ChildProcess _child;
  CommandCorrelator<protocol::BridgeReply> _correlator;
  LineFramer<MESHLINK_BRIDGE_LINE_MAX> _stdout_framer;
  LineFramer<MESHLINK_SERIAL_LINE_MAX> _stderr_framer;
  etl::string<MESHLINK_BRIDGE_LINE_MAX> _line;
  etl::string<MESHLINK_SERIAL_LINE_MAX> _err_line;
  etl::string<MESHLINK_BRIDGE_REQUEST_MAX> _request;
  protocol::ReadyInfo _ready_info;
  bool _ready;
  uint32_t _lines_received;
  uint32_t _late_responses;
  ExitHandler _exit_handler;
};

}  // namespace meshlink

#endif  // MESHLINK_TRANSPORT_BRIDGE_PROCESS_H
