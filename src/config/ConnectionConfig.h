/**
 * @file ConnectionConfig.h
 * @brief Connection target, runtime tunables and input validation.
 *
 * A ConnectionConfig names exactly one transport: a local serial port or a
 * TCP endpoint reachable through the bridge. It is immutable for the duration
 * of one connection attempt.
 */
#ifndef MESHLINK_CONFIG_CONNECTION_CONFIG_H
#define MESHLINK_CONFIG_CONNECTION_CONFIG_H

#include <stdint.h>

#include <etl/optional.h>
#include <etl/string.h>
#include <etl/string_view.h>

#include "link_error.h"
#include "meshlink_config.h"
#include "state/mesh_types.h"

namespace meshlink {

static constexpr size_t kSerialPathMax = 128;
static constexpr size_t kHostMax = 128;
static constexpr size_t kBridgeCommandMax = 256;
static constexpr size_t kPasswordMax = 32;

using SerialPath = etl::string<kSerialPathMax>;
using HostName = etl::string<kHostMax>;
using BridgeCommandLine = etl::string<kBridgeCommandMax>;

struct SerialEndpoint {
  SerialPath path;
  uint32_t baud;
};

struct TcpEndpoint {
  HostName host;
  uint16_t port;
};

struct ConnectionConfig {
  etl::optional<SerialEndpoint> serial;
  etl::optional<TcpEndpoint> tcp;

  static ConnectionConfig forSerial(etl::string_view path,
                                    uint32_t baud = MESHLINK_DEFAULT_BAUDRATE);
  static ConnectionConfig forTcp(etl::string_view host,
                                 uint16_t port = MESHLINK_DEFAULT_TCP_PORT);

  bool isSerial() const { return serial.has_value() && !tcp.has_value(); }
  bool isTcp() const { return tcp.has_value() && !serial.has_value(); }
};

struct LinkOptions {
  uint32_t detect_timeout_ms;
  uint32_t repeater_command_timeout_ms;
  uint32_t bridge_ready_timeout_ms;
  uint32_t bridge_connect_timeout_ms;
  uint32_t bridge_command_timeout_ms;
  uint32_t status_timeout_ms;
  uint32_t bridge_shutdown_timeout_ms;
  uint32_t bridge_kill_grace_ms;
  BridgeCommandLine bridge_command;

  LinkOptions();

  // Defaults overridden by MESHCORE_BRIDGE_COMMAND when set.
  static LinkOptions fromEnvironment();
};

/**
 * @brief Read MESHCORE_SERIAL_PORT / MESHCORE_BAUD_RATE or, failing that,
 * MESHCORE_TCP_HOST / MESHCORE_TCP_PORT.
 *
 * The serial variables take precedence when both are present.
 */
Result<ConnectionConfig> config_from_environment();

// Exactly one transport, sane port numbers, accepted serial path.
Result<void> validate_config(const ConnectionConfig& config);

/**
 * @brief Check a serial device path against the accepted OS patterns.
 *
 * Returns the path unchanged when accepted. Nothing is rewritten: a path is
 * either passed through verbatim or rejected with VALIDATION.
 */
Result<SerialPath> sanitize_serial_path(etl::string_view path);

// Node names: 1-31 bytes, no control characters, none of [ ] \ : , ? *
Result<void> validate_node_name(etl::string_view name);

// Ranges accepted by the firmware's "set radio" handler.
Result<void> validate_radio_params(double freq_mhz, double bw_khz, int sf, int cr);

Result<void> validate_message_text(etl::string_view text);

// Hex public key or key prefix, 2-64 characters.
Result<void> validate_public_key(etl::string_view key);

Result<void> validate_password(etl::string_view password);

}  // namespace meshlink

#endif  // MESHLINK_CONFIG_CONNECTION_CONFIG_H
