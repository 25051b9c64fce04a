/**
 * @file MeshLink.h
 * @brief Connection coordinator for a locally attached MeshCore node.
 *
 * A ConnectionCoordinator owns one link: it picks the transport, probes the
 * firmware (Repeater text CLI or Companion via the bridge subprocess), keeps
 * the DeviceStateCache hydrated and publishes connected/disconnected/message
 * events to registered observers.
 *
 * Threading: single-threaded and cooperative. The host calls process() from
 * its loop; blocking operations drive process() themselves while waiting, so
 * observers may run inside any public call. Results that cross such a wait
 * are only applied if no disconnect()/connect() happened meanwhile.
 *
 * Public operations never throw. Failures are logged and reported as
 * false / nullptr / empty optional.
 */
#ifndef MESHLINK_H
#define MESHLINK_H

#include <stdint.h>

#include <etl/optional.h>
#include <etl/queue.h>
#include <etl/string.h>
#include <etl/string_view.h>

#include "config/ConnectionConfig.h"
#include "events/link_events.h"
#include "fsm/link_fsm.h"
#include "link_error.h"
#include "meshlink_config.h"
#include "protocol/ResponseParser.h"
#include "state/DeviceStateCache.h"
#include "state/mesh_types.h"
#include "transport/BridgeProcess.h"
#include "transport/ByteStream.h"
#include "transport/CompanionTransport.h"
#include "transport/RepeaterCli.h"
#include "transport/SerialTransport.h"
#include "util/Clock.h"

namespace meshlink {

static constexpr size_t kDefaultRecentMessages = 50;

struct ConnectionStatus {
  bool connected;
  DeviceType device_type;
  const char* state;
  etl::optional<ConnectionConfig> config;
};

struct LinkStats {
  uint32_t connect_attempts;
  uint32_t connect_failures;
  uint32_t serial_opens;
  uint32_t bridge_spawns;
  uint32_t bridge_exits;
  uint32_t repeater_detections;
  uint32_t companion_detections;
  uint32_t messages_received;
  uint32_t messages_sent;
  uint32_t serial_lines;
  uint32_t serial_timeouts;
  uint32_t bridge_timeouts;
  uint32_t late_responses;
  uint32_t line_overflows;         // serial CLI lines dropped as too long
  uint32_t bridge_line_overflows;  // bridge frames dropped as too long
  uint32_t events_dropped;
};

class ConnectionCoordinator {
 public:
  explicit ConnectionCoordinator(const LinkOptions& options = LinkOptions());

  // Injection points for hosts and tests. A null driver means the built-in
  // BridgeProcess is used.
  ConnectionCoordinator(const LinkOptions& options, ISerialPortProvider& serial_provider,
                        ICompanionDriver* companion_driver, const Clock& clock);

  ~ConnectionCoordinator();

  ConnectionCoordinator(const ConnectionCoordinator&) = delete;
  ConnectionCoordinator& operator=(const ConnectionCoordinator&) = delete;

  // --- Lifecycle ---
  bool connect(const ConnectionConfig& config);
  bool connect();  // configuration from the environment
  void disconnect();

  // Waits up to @p max_wait_ms for device input, handles it, delivers events.
  void process(uint32_t max_wait_ms = 0);

  // --- Commands ---
  bool sendMessage(etl::string_view text);
  bool sendMessage(etl::string_view text, etl::string_view to_public_key);
  bool sendAdvert();
  bool loginToNode(etl::string_view public_key, etl::string_view password);
  etl::optional<NodeStatus> requestNodeStatus(etl::string_view public_key);
  bool setName(etl::string_view name);
  bool setRadio(double freq_mhz, double bw_khz, int sf, int cr);
  const Node* refreshLocalNode();
  bool refreshContacts();

  // --- Queries ---
  const Node* getLocalNode() const { return _cache.localNode(); }
  void getContacts(ContactList& out) const { _cache.contacts(out); }
  void getAllNodes(NodeList& out) const { _cache.allNodes(out); }
  void getRecentMessages(MessageList& out, size_t limit = kDefaultRecentMessages) const {
    _cache.recentMessages(limit, out);
  }
  bool isConnected() const { return _fsm.isConnected(); }
  DeviceType deviceType() const { return _device_type; }
  ConnectionStatus getConnectionStatus() const;
  LinkStats getStats() const;
  const LinkOptions& options() const { return _options; }

  // --- Events ---
  bool subscribe(ILinkObserver& observer) { return _events.subscribe(observer); }
  bool unsubscribe(ILinkObserver& observer) { return _events.unsubscribe(observer); }

 private:
  struct QueuedEvent {
    enum class Kind : uint8_t { MESSAGE, SERIAL_LINE };
    Kind kind;
    Message message;
    etl::string<MESHLINK_SERIAL_LINE_MAX> line;
  };

  void _init();

  // Coordinator.cpp
  Result<void> _connectSerial(uint32_t epoch);
  Result<void> _startBridge(uint32_t epoch);
  Result<void> _hydrate(uint32_t epoch);
  void _teardown(bool emit);
  bool _epochCurrent(uint32_t epoch) const { return epoch == _epoch; }
  bool _hasOpenResources() const;
  void _onBridgeExit(int status);
  void _enqueue(const QueuedEvent& event);
  void _dispatchEvents();

  // Refresh.cpp
  Result<void> _refreshLocalNode(uint32_t epoch);
  Result<void> _refreshContacts(uint32_t epoch);

  // Messaging.cpp
  bool _sendMessage(etl::string_view text, const PublicKeyHex* to);
  void _onSerialLine(etl::string_view line);
  void _onPush(const PublicKeyHex& from, const MessageText& text);
  void _mintMessageId(const char* prefix, MessageId& out);

  // NodeAdmin.cpp
  bool _requireConnected(const char* operation) const;
  bool _requireCompanion(const char* operation) const;

  LinkOptions _options;
  const Clock& _clock;
  RepeaterTextParser _parser;
  PosixSerialPortProvider _posix_serial;
  ISerialPortProvider& _serial_provider;
  SerialTransport _serial;
  RepeaterCli _cli;
  BridgeProcess _bridge;
  ICompanionDriver& _driver;
  CompanionTransport _companion;
  DeviceStateCache _cache;
  ContactList _staging_contacts;
  fsm::LinkFsm _fsm;
  EventRouter _events;
  etl::queue<QueuedEvent, MESHLINK_EVENT_QUEUE_DEPTH> _event_queue;
  etl::optional<ConnectionConfig> _config;
  DeviceType _device_type;
  uint32_t _epoch;
  uint32_t _message_seq;
  bool _dispatching;
  LinkStats _stats;
};

}  // namespace meshlink

#endif  // MESHLINK_H
