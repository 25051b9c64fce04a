#include "config/ConnectionConfig.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include "util/log.h"
#include "util/posix_regex.h"
#include "util/string_utils.h"

namespace meshlink {
namespace {

constexpr const char* kTag = "Config";

// First character of a device name may not be '.', so "." and ".." never pass.
#define MESHLINK_DEVICE_NAME "[A-Za-z0-9_:-][A-Za-z0-9._:-]*"

const char* const kSerialPathPatterns[] = {
    "^/dev/tty[A-Za-z]+[0-9]+$",
    "^/dev/serial/by-(id|path)/" MESHLINK_DEVICE_NAME "$",
    "^/dev/cu\\." MESHLINK_DEVICE_NAME "$",
    "^/dev/tty\\." MESHLINK_DEVICE_NAME "$",
    "^COM[0-9]+$",
};

#undef MESHLINK_DEVICE_NAME

constexpr const char kNameForbidden[] = "[]\\:,?*";

bool parse_unsigned(const char* text, unsigned long max, unsigned long& out) {
  if (text == nullptr || *text == '\0') {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long value = strtoul(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || value == 0 || value > max) {
    return false;
  }
  out = value;
  return true;
}

bool is_hex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

}  // namespace

ConnectionConfig ConnectionConfig::forSerial(etl::string_view path, uint32_t baud) {
  ConnectionConfig config;
  SerialEndpoint endpoint;
  assign_bounded(endpoint.path, path);
  endpoint.baud = baud;
  config.serial = endpoint;
  return config;
}

ConnectionConfig ConnectionConfig::forTcp(etl::string_view host, uint16_t port) {
  ConnectionConfig config;
  TcpEndpoint endpoint;
  assign_bounded(endpoint.host, host);
  endpoint.port = port;
  config.tcp = endpoint;
  return config;
}

LinkOptions::LinkOptions()
    : detect_timeout_ms(MESHLINK_DETECT_TIMEOUT_MS),
      repeater_command_timeout_ms(MESHLINK_REPEATER_COMMAND_TIMEOUT_MS),
      bridge_ready_timeout_ms(MESHLINK_BRIDGE_READY_TIMEOUT_MS),
      bridge_connect_timeout_ms(MESHLINK_BRIDGE_CONNECT_TIMEOUT_MS),
      bridge_command_timeout_ms(MESHLINK_BRIDGE_COMMAND_TIMEOUT_MS),
      status_timeout_ms(MESHLINK_STATUS_TIMEOUT_MS),
      bridge_shutdown_timeout_ms(MESHLINK_BRIDGE_SHUTDOWN_TIMEOUT_MS),
      bridge_kill_grace_ms(MESHLINK_BRIDGE_KILL_GRACE_MS),
      bridge_command(MESHLINK_DEFAULT_BRIDGE_COMMAND) {}

LinkOptions LinkOptions::fromEnvironment() {
  LinkOptions options;
  const char* command = getenv("MESHCORE_BRIDGE_COMMAND");
  if (command != nullptr && *command != '\0') {
    if (!assign_bounded(options.bridge_command, etl::string_view(command, strlen(command)))) {
      MESHLINK_LOG_WARN(kTag, "MESHCORE_BRIDGE_COMMAND too long, using default");
      options.bridge_command = MESHLINK_DEFAULT_BRIDGE_COMMAND;
    }
  }
  return options;
}

Result<ConnectionConfig> config_from_environment() {
  const char* port = getenv("MESHCORE_SERIAL_PORT");
  const char* host = getenv("MESHCORE_TCP_HOST");

  if (port != nullptr && *port != '\0') {
    unsigned long baud = MESHLINK_DEFAULT_BAUDRATE;
    const char* baud_text = getenv("MESHCORE_BAUD_RATE");
    if (baud_text != nullptr && *baud_text != '\0' &&
        !parse_unsigned(baud_text, 4000000UL, baud)) {
      return make_error(ErrorCode::CONFIGURATION, "MESHCORE_BAUD_RATE is not a valid baud rate");
    }
    return ConnectionConfig::forSerial(etl::string_view(port, strlen(port)),
                                       static_cast<uint32_t>(baud));
  }

  if (host != nullptr && *host != '\0') {
    unsigned long tcp_port = MESHLINK_DEFAULT_TCP_PORT;
    const char* port_text = getenv("MESHCORE_TCP_PORT");
    if (port_text != nullptr && *port_text != '\0' &&
        !parse_unsigned(port_text, 65535UL, tcp_port)) {
      return make_error(ErrorCode::CONFIGURATION, "MESHCORE_TCP_PORT is not a valid port");
    }
    return ConnectionConfig::forTcp(etl::string_view(host, strlen(host)),
                                    static_cast<uint16_t>(tcp_port));
  }

  return make_error(ErrorCode::CONFIGURATION,
                    "No MeshCore connection configured (set MESHCORE_SERIAL_PORT or MESHCORE_TCP_HOST)");
}

Result<void> validate_config(const ConnectionConfig& config) {
  const bool has_serial = config.serial.has_value();
  const bool has_tcp = config.tcp.has_value();
  if (has_serial == has_tcp) {
    return make_error(ErrorCode::CONFIGURATION,
                      has_serial ? "Both serial and TCP transports specified"
                                 : "No transport specified");
  }

  if (has_serial) {
    if (config.serial->baud == 0) {
      return make_error(ErrorCode::CONFIGURATION, "Baud rate must be positive");
    }
    Result<SerialPath> path = sanitize_serial_path(view_of(config.serial->path));
    if (!path) {
      return make_error(path.error());
    }
    return Result<void>();
  }

  if (config.tcp->host.empty()) {
    return make_error(ErrorCode::CONFIGURATION, "TCP host is empty");
  }
  if (config.tcp->port == 0) {
    return make_error(ErrorCode::CONFIGURATION, "TCP port must be positive");
  }
  return Result<void>();
}

Result<SerialPath> sanitize_serial_path(etl::string_view path) {
  SerialPath candidate;
  if (path.empty() || !assign_bounded(candidate, path)) {
    return make_error(ErrorCode::VALIDATION, "Serial path is empty or too long");
  }
  if (memchr(path.data(), '\0', path.size()) != nullptr) {
    return make_error(ErrorCode::VALIDATION, "Serial path contains NUL");
  }

  for (size_t i = 0; i < sizeof(kSerialPathPatterns) / sizeof(kSerialPathPatterns[0]); ++i) {
    const PosixRegex pattern(kSerialPathPatterns[i], REG_NOSUB);
    if (pattern.matches(candidate.c_str())) {
      return candidate;
    }
  }
  return make_error(Error::format(ErrorCode::VALIDATION, "Invalid serial port path: %s",
                                  candidate.c_str()));
}

Result<void> validate_node_name(etl::string_view name) {
  if (name.empty() || name.size() >= kNodeNameMax) {
    return make_error(ErrorCode::VALIDATION, "Name must be 1-31 bytes");
  }
  for (size_t i = 0; i < name.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(name[i]);
    if (c < 0x20 || c == 0x7F) {
      return make_error(ErrorCode::VALIDATION, "Name contains control characters");
    }
    if (memchr(kNameForbidden, c, sizeof(kNameForbidden) - 1) != nullptr) {
      return make_error(ErrorCode::VALIDATION, "Name contains forbidden characters");
    }
  }
  return Result<void>();
}

Result<void> validate_radio_params(double freq_mhz, double bw_khz, int sf, int cr) {
  if (!(freq_mhz >= 300.0 && freq_mhz <= 2500.0)) {
    return make_error(ErrorCode::VALIDATION, "Frequency must be 300-2500 MHz");
  }
  if (!(bw_khz >= 7.0 && bw_khz <= 500.0)) {
    return make_error(ErrorCode::VALIDATION, "Bandwidth must be 7-500 kHz");
  }
  if (sf < 5 || sf > 12) {
    return make_error(ErrorCode::VALIDATION, "Spreading factor must be 5-12");
  }
  if (cr < 5 || cr > 8) {
    return make_error(ErrorCode::VALIDATION, "Coding rate must be 5-8");
  }
  return Result<void>();
}

Result<void> validate_message_text(etl::string_view text) {
  if (text.empty() || text.size() > MESHLINK_MAX_MESSAGE_TEXT) {
    return make_error(ErrorCode::VALIDATION, "Message text is empty or too long");
  }
  if (memchr(text.data(), '\n', text.size()) != nullptr ||
      memchr(text.data(), '\r', text.size()) != nullptr ||
      memchr(text.data(), '\0', text.size()) != nullptr) {
    return make_error(ErrorCode::VALIDATION, "Message text contains line breaks");
  }
  return Result<void>();
}

Result<void> validate_public_key(etl::string_view key) {
  if (key.size() < 2 || key.size() > kPublicKeyHexMax) {
    return make_error(ErrorCode::VALIDATION, "Public key must be 2-64 hex characters");
  }
  for (size_t i = 0; i < key.size(); ++i) {
    if (!is_hex(key[i])) {
      return make_error(ErrorCode::VALIDATION, "Public key is not hex");
    }
  }
  return Result<void>();
}

Result<void> validate_password(etl::string_view password) {
  if (password.size() > kPasswordMax) {
    return make_error(ErrorCode::VALIDATION, "Password too long");
  }
  for (size_t i = 0; i < password.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(password[i]);
    if (c < 0x20 || c == 0x7F) {
      return make_error(ErrorCode::VALIDATION, "Password contains control characters");
    }
  }
  return Result<void>();
}

}  // namespace meshlink
