#include "fsm/link_fsm.h"

#include "util/log.h"

namespace meshlink {
namespace fsm {
namespace {

constexpr etl::message_router_id_t kLinkFsmRouterId = 1;

}  // namespace

const char* state_name(etl::fsm_state_id_t id) {
  switch (id) {
    case STATE_DISCONNECTED:
      return "Disconnected";
    case STATE_CONNECTING:
      return "Connecting";
    case STATE_DETECTING:
      return "Detecting";
    case STATE_CONNECTED_REPEATER:
      return "ConnectedRepeater";
    case STATE_CONNECTED_COMPANION:
      return "ConnectedCompanion";
    case STATE_DISCONNECTING:
      return "Disconnecting";
    default:
      return "Invalid";
  }
}

LinkFsm::LinkFsm() : etl::fsm(kLinkFsmRouterId), _state_list() {}

void LinkFsm::begin() {
  _state_list[STATE_DISCONNECTED] = &_disconnected;
  _state_list[STATE_CONNECTING] = &_connecting;
  _state_list[STATE_DETECTING] = &_detecting;
  _state_list[STATE_CONNECTED_REPEATER] = &_connected_repeater;
  _state_list[STATE_CONNECTED_COMPANION] = &_connected_companion;
  _state_list[STATE_DISCONNECTING] = &_disconnecting;
  set_states(_state_list, NUMBER_OF_STATES);
  start();
}

void LinkFsm::_trigger(const etl::imessage& event) {
  const etl::fsm_state_id_t before = get_state_id();
  receive(event);
  const etl::fsm_state_id_t after = get_state_id();
  if (before != after) {
    MESHLINK_LOG_DEBUG("MeshCore", "State %s -> %s", state_name(before), state_name(after));
  }
}

}  // namespace fsm
}  // namespace meshlink
