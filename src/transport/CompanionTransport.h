#ifndef MESHLINK_TRANSPORT_COMPANION_TRANSPORT_H
#define MESHLINK_TRANSPORT_COMPANION_TRANSPORT_H

#include <stdint.h>

#include <etl/delegate.h>
#include <etl/string_view.h>

#include "config/ConnectionConfig.h"
#include "state/mesh_types.h"
#include "transport/CompanionDriver.h"
#include "util/Clock.h"

namespace meshlink {

/**
 * @brief Typed Companion operations over an ICompanionDriver.
 *
 * Every operation is a single bridge command with a fixed name and a typed
 * parameter and result shape. Calls block by driving the pump until the
 * reply settles.
 */
class CompanionTransport {
 public:
  using Pump = etl::delegate<void(uint32_t)>;

  CompanionTransport(ICompanionDriver& driver, const Clock& clock);

  void setPump(const Pump& pump) { _pump = pump; }

  // Start the driver, wait for ready, then connect it to the device.
  Result<void> open(const ConnectionConfig& config, const LinkOptions& options);

  // Ask the bridge to shut down, then stop the driver regardless.
  void close(const LinkOptions& options);

  bool ready() const { return _driver.ready(); }

  Result<void> call(const char* cmd, JsonObjectConst params, uint32_t timeout_ms,
                    BridgeReplySlot& reply);

  Result<void> getSelfInfo(uint32_t timeout_ms, Node& out);
  Result<void> getContacts(uint32_t timeout_ms, uint64_t now_ms, ContactList& out);
  Result<void> sendMessage(etl::string_view text, const PublicKeyHex* to, uint32_t timeout_ms);
  Result<void> sendAdvert(uint32_t timeout_ms);
  Result<void> login(etl::string_view public_key, etl::string_view password, uint32_t timeout_ms);
  Result<void> getStatus(etl::string_view public_key, uint32_t timeout_ms, NodeStatus& out);
  Result<void> setName(etl::string_view name, uint32_t timeout_ms);
  Result<void> setRadio(double freq_mhz, double bw_khz, uint8_t sf, uint8_t cr,
                        uint32_t timeout_ms);
  Result<void> shutdown(uint32_t timeout_ms);

 private:
  Result<void> _awaitReady(uint32_t timeout_ms);
  void _await(BridgeReplySlot& reply);

  ICompanionDriver& _driver;
  const Clock& _clock;
  Pump _pump;
};

}  // namespace meshlink

#endif  // MESHLINK_TRANSPORT_COMPANION_TRANSPORT_H
