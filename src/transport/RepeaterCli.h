#ifndef MESHLINK_TRANSPORT_REPEATER_CLI_H
#define MESHLINK_TRANSPORT_REPEATER_CLI_H

#include <stdint.h>

#include <etl/delegate.h>
#include <etl/string_view.h>

#include "protocol/ResponseParser.h"
#include "state/mesh_types.h"
#include "transport/SerialTransport.h"

namespace meshlink {

/**
 * @brief Typed Repeater commands over a SerialTransport.
 *
 * Each call blocks the caller by driving the pump (normally the coordinator's
 * process()) until the reply settles. Inputs are expected to be validated.
 */
class RepeaterCli {
 public:
  using Pump = etl::delegate<void(uint32_t)>;

  RepeaterCli(SerialTransport& transport, const IResponseParser& parser);

  void setPump(const Pump& pump) { _pump = pump; }

  Result<CliReply> execute(const char* command, uint32_t timeout_ms,
                           const char* extra_terminator = nullptr);

  // true when the version banner carries the Repeater firmware signature.
  Result<bool> probeVersion(uint32_t timeout_ms);

  Result<void> readNode(uint32_t timeout_ms, Node& out);
  Result<void> setName(etl::string_view name, uint32_t timeout_ms);
  Result<void> setRadio(double freq_mhz, double bw_khz, uint8_t sf, uint8_t cr,
                        uint32_t timeout_ms);
  Result<void> advert(uint32_t timeout_ms);

 private:
  Result<void> _expectAccepted(const char* command, uint32_t timeout_ms);

  SerialTransport& _transport;
  const IResponseParser& _parser;
  Pump _pump;
};

}  // namespace meshlink

#endif  // MESHLINK_TRANSPORT_REPEATER_CLI_H
