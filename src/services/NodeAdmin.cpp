#include "MeshLink.h"

#include "util/log.h"

namespace meshlink {
namespace {

constexpr const char* kTag = "MeshCore";

}  // namespace

bool ConnectionCoordinator::_requireConnected(const char* operation) const {
  if (!isConnected()) {
    MESHLINK_LOG_WARN(kTag, "%s: not connected", operation);
    return false;
  }
  return true;
}

bool ConnectionCoordinator::_requireCompanion(const char* operation) const {
  if (_device_type != DeviceType::COMPANION) {
    MESHLINK_LOG_WARN(kTag, "%s requires Companion firmware (device is %s)", operation,
                      device_type_name(_device_type));
    return false;
  }
  return true;
}

bool ConnectionCoordinator::loginToNode(etl::string_view public_key, etl::string_view password) {
  if (!_requireConnected("loginToNode") || !_requireCompanion("loginToNode")) {
    return false;
  }
  Result<void> valid = validate_public_key(public_key);
  if (valid) {
    valid = validate_password(password);
  }
  if (!valid) {
    MESHLINK_LOG_ERROR(kTag, "loginToNode: %s", valid.error().message.c_str());
    return false;
  }

  Result<void> done = _companion.login(public_key, password, _options.bridge_command_timeout_ms);
  if (!done) {
    MESHLINK_LOG_ERROR(kTag, "Login failed: %s", done.error().message.c_str());
    return false;
  }
  return true;
}

etl::optional<NodeStatus> ConnectionCoordinator::requestNodeStatus(etl::string_view public_key) {
  if (!_requireConnected("requestNodeStatus") || !_requireCompanion("requestNodeStatus")) {
    return etl::nullopt;
  }
  Result<void> valid = validate_public_key(public_key);
  if (!valid) {
    MESHLINK_LOG_ERROR(kTag, "requestNodeStatus: %s", valid.error().message.c_str());
    return etl::nullopt;
  }

  const uint32_t epoch = _epoch;
  NodeStatus status;
  Result<void> done = _companion.getStatus(public_key, _options.status_timeout_ms, status);
  if (!done) {
    MESHLINK_LOG_ERROR(kTag, "Status request failed: %s", done.error().message.c_str());
    return etl::nullopt;
  }
  if (!_epochCurrent(epoch)) {
    return etl::nullopt;
  }
  return status;
}

bool ConnectionCoordinator::setName(etl::string_view name) {
  if (!_requireConnected("setName")) {
    return false;
  }
  Result<void> valid = validate_node_name(name);
  if (!valid) {
    MESHLINK_LOG_ERROR(kTag, "setName: %s", valid.error().message.c_str());
    return false;
  }

  const uint32_t epoch = _epoch;
  Result<void> done = _device_type == DeviceType::REPEATER
                          ? _cli.setName(name, _options.repeater_command_timeout_ms)
                          : _companion.setName(name, _options.bridge_command_timeout_ms);
  if (!done) {
    MESHLINK_LOG_ERROR(kTag, "Failed to set name: %s", done.error().message.c_str());
    return false;
  }
  if (_epochCurrent(epoch)) {
    _cache.renameLocalNode(name);
  }
  return true;
}

bool ConnectionCoordinator::setRadio(double freq_mhz, double bw_khz, int sf, int cr) {
  if (!_requireConnected("setRadio")) {
    return false;
  }
  Result<void> valid = validate_radio_params(freq_mhz, bw_khz, sf, cr);
  if (!valid) {
    MESHLINK_LOG_ERROR(kTag, "setRadio: %s", valid.error().message.c_str());
    return false;
  }

  const uint8_t sf8 = static_cast<uint8_t>(sf);
  const uint8_t cr8 = static_cast<uint8_t>(cr);
  Result<void> done =
      _device_type == DeviceType::REPEATER
          ? _cli.setRadio(freq_mhz, bw_khz, sf8, cr8, _options.repeater_command_timeout_ms)
          : _companion.setRadio(freq_mhz, bw_khz, sf8, cr8, _options.bridge_command_timeout_ms);
  if (!done) {
    MESHLINK_LOG_ERROR(kTag, "Failed to set radio: %s", done.error().message.c_str());
    return false;
  }
  MESHLINK_LOG_INFO(kTag, "Radio set to %.3f MHz, %.1f kHz, SF%d, CR%d", freq_mhz, bw_khz, sf, cr);
  return true;
}

}  // namespace meshlink
