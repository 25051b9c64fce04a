#ifndef MESHLINK_TRANSPORT_COMPANION_DRIVER_H
#define MESHLINK_TRANSPORT_COMPANION_DRIVER_H

#include <poll.h>
#include <stddef.h>
#include <stdint.h>

#include <ArduinoJson.h>

#include "correlator/CommandCorrelator.h"
#include "link_error.h"
#include "protocol/BridgeCodec.h"

namespace meshlink {

using BridgeReplySlot = PendingReply<protocol::BridgeReply>;

/**
 * @brief Request/response channel that speaks the Companion protocol.
 *
 * BridgeProcess is the production implementation. Tests substitute scripted
 * drivers to exercise CompanionTransport without a subprocess.
 */
class ICompanionDriver {
 public:
  virtual ~ICompanionDriver() {}

  virtual Result<void> start() = 0;

  // Tears the channel down. Outstanding commands are rejected.
  virtual void stop(uint32_t grace_ms) = 0;

  virtual bool running() const = 0;
  virtual bool ready() const = 0;

  // False when the bridge reported its protocol library missing.
  virtual bool protocolAvailable() const = 0;

  virtual Result<void> sendCommand(const char* cmd, JsonObjectConst params, uint32_t timeout_ms,
                                   BridgeReplySlot& reply) = 0;

  // Drains readable input and expires timed-out commands.
  virtual void process() = 0;

  virtual int32_t nextDeadlineIn() const = 0;
  virtual size_t pollFds(struct pollfd* fds, size_t max) const = 0;
  virtual size_t pendingCount() const = 0;
};

}  // namespace meshlink

#endif  // MESHLINK_TRANSPORT_COMPANION_DRIVER_H
