#include "MeshLink.h"

#include "util/log.h"

namespace meshlink {
namespace {

constexpr const char* kTag = "MeshCore";

}  // namespace

const Node* ConnectionCoordinator::refreshLocalNode() {
  if (!_requireConnected("refreshLocalNode")) {
    return nullptr;
  }
  Result<void> done = _refreshLocalNode(_epoch);
  if (!done) {
    MESHLINK_LOG_ERROR(kTag, "Failed to refresh local node: %s", done.error().message.c_str());
    return nullptr;
  }
  return _cache.localNode();
}

bool ConnectionCoordinator::refreshContacts() {
  if (!_requireConnected("refreshContacts")) {
    return false;
  }
  Result<void> done = _refreshContacts(_epoch);
  if (!done) {
    MESHLINK_LOG_ERROR(kTag, "Failed to refresh contacts: %s", done.error().message.c_str());
    return false;
  }
  return true;
}

Result<void> ConnectionCoordinator::_refreshLocalNode(uint32_t epoch) {
  Node node;
  Result<void> read = _device_type == DeviceType::REPEATER
                          ? _cli.readNode(_options.repeater_command_timeout_ms, node)
                          : _companion.getSelfInfo(_options.bridge_command_timeout_ms, node);
  if (!read) {
    return read;
  }
  if (!_epochCurrent(epoch)) {
    return make_error(ErrorCode::DISCONNECTED, "Link changed during refresh");
  }

  _cache.setLocalNode(node);
  MESHLINK_LOG_INFO(kTag, "Local node: %s (%s)", node.name.c_str(),
                    device_type_name(node.device_type));
  return Result<void>();
}

// Repeaters expose no contact list; the table stays empty.
Result<void> ConnectionCoordinator::_refreshContacts(uint32_t epoch) {
  if (_device_type == DeviceType::REPEATER) {
    return Result<void>();
  }

  Result<void> read = _companion.getContacts(_options.bridge_command_timeout_ms,
                                             _clock.epochMillis(), _staging_contacts);
  if (!read) {
    return read;
  }
  if (!_epochCurrent(epoch)) {
    return make_error(ErrorCode::DISCONNECTED, "Link changed during refresh");
  }

  _cache.replaceContacts(_staging_contacts);
  MESHLINK_LOG_INFO(kTag, "Refreshed %u contacts", static_cast<unsigned>(_cache.contactCount()));
  return Result<void>();
}

}  // namespace meshlink
