/**
 * @file link_fsm.h
 * @brief ETL state machine for the lifetime of one device link.
 *
 * States:
 *   - Disconnected (0): Nothing open.
 *   - Connecting (1): Validating config, opening the serial port.
 *   - Detecting (2): Classifying firmware and hydrating the cache.
 *   - ConnectedRepeater (3): Text CLI over the serial port.
 *   - ConnectedCompanion (4): Bridge subprocess owns the device.
 *   - Disconnecting (5): Tearing down transports.
 *
 * Events:
 *   - EvConnect: Attempt started → Connecting
 *   - EvTransportOpened: Channel is up → Detecting
 *   - EvRepeaterReady / EvCompanionReady: Hydrated → Connected*
 *   - EvDisconnect: Any active state → Disconnecting
 *   - EvTeardownComplete: → Disconnected
 *
 * State objects are members so that several links can coexist in one
 * process.
 */
#ifndef MESHLINK_FSM_LINK_FSM_H
#define MESHLINK_FSM_LINK_FSM_H

#include "etl/fsm.h"
#include "etl/message.h"

namespace meshlink {
namespace fsm {

class LinkFsm;

// ============================================================================
// State IDs - Must be sequential starting from 0
// ============================================================================
enum StateId : etl::fsm_state_id_t {
  STATE_DISCONNECTED = 0,
  STATE_CONNECTING = 1,
  STATE_DETECTING = 2,
  STATE_CONNECTED_REPEATER = 3,
  STATE_CONNECTED_COMPANION = 4,
  STATE_DISCONNECTING = 5,
  NUMBER_OF_STATES = 6
};

enum EventId : etl::message_id_t {
  EVENT_CONNECT = 0,
  EVENT_TRANSPORT_OPENED = 1,
  EVENT_REPEATER_READY = 2,
  EVENT_COMPANION_READY = 3,
  EVENT_DISCONNECT = 4,
  EVENT_TEARDOWN_COMPLETE = 5
};

struct EvConnect : public etl::message<EVENT_CONNECT> {};
struct EvTransportOpened : public etl::message<EVENT_TRANSPORT_OPENED> {};
struct EvRepeaterReady : public etl::message<EVENT_REPEATER_READY> {};
struct EvCompanionReady : public etl::message<EVENT_COMPANION_READY> {};
struct EvDisconnect : public etl::message<EVENT_DISCONNECT> {};
struct EvTeardownComplete : public etl::message<EVENT_TEARDOWN_COMPLETE> {};

const char* state_name(etl::fsm_state_id_t id);

class StateDisconnected
    : public etl::fsm_state<LinkFsm, StateDisconnected, STATE_DISCONNECTED, EvConnect> {
 public:
  etl::fsm_state_id_t on_event(const EvConnect&) { return STATE_CONNECTING; }
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class StateConnecting
    : public etl::fsm_state<LinkFsm, StateConnecting, STATE_CONNECTING, EvTransportOpened,
                            EvDisconnect> {
 public:
  etl::fsm_state_id_t on_event(const EvTransportOpened&) { return STATE_DETECTING; }
  etl::fsm_state_id_t on_event(const EvDisconnect&) { return STATE_DISCONNECTING; }
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class StateDetecting
    : public etl::fsm_state<LinkFsm, StateDetecting, STATE_DETECTING, EvRepeaterReady,
                            EvCompanionReady, EvDisconnect> {
 public:
  etl::fsm_state_id_t on_event(const EvRepeaterReady&) { return STATE_CONNECTED_REPEATER; }
  etl::fsm_state_id_t on_event(const EvCompanionReady&) { return STATE_CONNECTED_COMPANION; }
  etl::fsm_state_id_t on_event(const EvDisconnect&) { return STATE_DISCONNECTING; }
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class StateConnectedRepeater
    : public etl::fsm_state<LinkFsm, StateConnectedRepeater, STATE_CONNECTED_REPEATER,
                            EvDisconnect> {
 public:
  etl::fsm_state_id_t on_event(const EvDisconnect&) { return STATE_DISCONNECTING; }
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class StateConnectedCompanion
    : public etl::fsm_state<LinkFsm, StateConnectedCompanion, STATE_CONNECTED_COMPANION,
                            EvDisconnect> {
 public:
  etl::fsm_state_id_t on_event(const EvDisconnect&) { return STATE_DISCONNECTING; }
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class StateDisconnecting
    : public etl::fsm_state<LinkFsm, StateDisconnecting, STATE_DISCONNECTING,
                            EvTeardownComplete> {
 public:
  etl::fsm_state_id_t on_event(const EvTeardownComplete&) { return STATE_DISCONNECTED; }
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class LinkFsm : public etl::fsm {
 public:
  LinkFsm();

  void begin();

  bool isDisconnected() const { return get_state_id() == STATE_DISCONNECTED; }
  bool isConnecting() const { return get_state_id() == STATE_CONNECTING; }
  bool isDetecting() const { return get_state_id() == STATE_DETECTING; }
  bool isDisconnecting() const { return get_state_id() == STATE_DISCONNECTING; }
  bool isConnected() const {
    return get_state_id() == STATE_CONNECTED_REPEATER ||
           get_state_id() == STATE_CONNECTED_COMPANION;
  }
  const char* stateName() const { return state_name(get_state_id()); }

  void connectRequested() { _trigger(EvConnect()); }
  void transportOpened() { _trigger(EvTransportOpened()); }
  void repeaterReady() { _trigger(EvRepeaterReady()); }
  void companionReady() { _trigger(EvCompanionReady()); }
  void disconnectRequested() { _trigger(EvDisconnect()); }
  void teardownComplete() { _trigger(EvTeardownComplete()); }

 private:
  void _trigger(const etl::imessage& event);

  StateDisconnected _disconnected;
  StateConnecting _connecting;
  StateDetecting _detecting;
  StateConnectedRepeater _connected_repeater;
  StateConnectedCompanion _connected_companion;
  StateDisconnecting _disconnecting;
  etl::ifsm_state* _state_list[NUMBER_OF_STATES];
};

}  // namespace fsm
}  // namespace meshlink

#endif  // MESHLINK_FSM_LINK_FSM_H
