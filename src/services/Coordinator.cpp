#include "MeshLink.h"

#include <poll.h>
#include <time.h>

#include "util/log.h"
#include "util/string_utils.h"

namespace meshlink {
namespace {

constexpr const char* kTag = "MeshCore";
constexpr size_t kMaxPollFds = 4;

// Channels without a descriptor (in-memory ports, scripted drivers) are polled
// on this cadence.
constexpr uint32_t kUnpollableSliceMs = 5;

void sleep_ms(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>((ms % 1000U) * 1000000UL);
  nanosleep(&ts, nullptr);
}

uint32_t clamp_wait(uint32_t wait, int32_t deadline_in) {
  if (deadline_in >= 0 && static_cast<uint32_t>(deadline_in) < wait) {
    return static_cast<uint32_t>(deadline_in);
  }
  return wait;
}

}  // namespace

ConnectionCoordinator::ConnectionCoordinator(const LinkOptions& options)
    : _options(options),
      _clock(SystemClock::instance()),
      _parser(),
      _posix_serial(),
      _serial_provider(_posix_serial),
      _serial(_serial_provider, _parser, _clock),
      _cli(_serial, _parser),
      _bridge(_clock, _options.bridge_command),
      _driver(_bridge),
      _companion(_driver, _clock),
      _cache(),
      _staging_contacts(),
      _fsm(),
      _events(),
      _event_queue(),
      _config(),
      _device_type(DeviceType::UNKNOWN),
      _epoch(0),
      _message_seq(0),
      _dispatching(false),
      _stats() {
  _init();
}

ConnectionCoordinator::ConnectionCoordinator(const LinkOptions& options,
                                             ISerialPortProvider& serial_provider,
                                             ICompanionDriver* companion_driver,
                                             const Clock& clock)
    : _options(options),
      _clock(clock),
      _parser(),
      _posix_serial(),
      _serial_provider(serial_provider),
      _serial(_serial_provider, _parser, _clock),
      _cli(_serial, _parser),
      _bridge(_clock, _options.bridge_command),
      _driver(companion_driver != nullptr ? *companion_driver
                                          : static_cast<ICompanionDriver&>(_bridge)),
      _companion(_driver, _clock),
      _cache(),
      _staging_contacts(),
      _fsm(),
      _events(),
      _event_queue(),
      _config(),
      _device_type(DeviceType::UNKNOWN),
      _epoch(0),
      _message_seq(0),
      _dispatching(false),
      _stats() {
  _init();
}

ConnectionCoordinator::~ConnectionCoordinator() { _teardown(false); }

void ConnectionCoordinator::_init() {
  _fsm.begin();

  const RepeaterCli::Pump pump =
      RepeaterCli::Pump::create<ConnectionCoordinator, &ConnectionCoordinator::process>(*this);
  _cli.setPump(pump);
  _companion.setPump(pump);

  _serial.onLine(SerialTransport::LineHandler::create<ConnectionCoordinator,
                                                      &ConnectionCoordinator::_onSerialLine>(*this));
  _serial.onPush(SerialTransport::PushHandler::create<ConnectionCoordinator,
                                                      &ConnectionCoordinator::_onPush>(*this));
  _bridge.onExit(
      BridgeProcess::ExitHandler::create<ConnectionCoordinator,
                                         &ConnectionCoordinator::_onBridgeExit>(*this));
}

bool ConnectionCoordinator::connect() {
  Result<ConnectionConfig> config = config_from_environment();
  if (!config) {
    MESHLINK_LOG_ERROR(kTag, "%s", config.error().message.c_str());
    return false;
  }
  return connect(config.value());
}

bool ConnectionCoordinator::connect(const ConnectionConfig& config) {
  if (!_fsm.isDisconnected() || _hasOpenResources()) {
    MESHLINK_LOG_WARN(kTag, "Already connected, disconnecting first");
    disconnect();
  }

  ++_stats.connect_attempts;
  Result<void> valid = validate_config(config);
  if (!valid) {
    ++_stats.connect_failures;
    MESHLINK_LOG_ERROR(kTag, "Invalid configuration (%s): %s", error_code_name(valid.error().code),
                       valid.error().message.c_str());
    return false;
  }

  const uint32_t epoch = ++_epoch;
  _config = config;
  _device_type = DeviceType::UNKNOWN;
  _fsm.connectRequested();

  if (config.serial.has_value()) {
    MESHLINK_LOG_INFO(kTag, "Connecting via serial %s @ %u", config.serial->path.c_str(),
                      static_cast<unsigned>(config.serial->baud));
  } else {
    MESHLINK_LOG_INFO(kTag, "Connecting via TCP %s:%u", config.tcp->host.c_str(),
                      static_cast<unsigned>(config.tcp->port));
  }

  Result<void> result = config.serial.has_value() ? _connectSerial(epoch) : _startBridge(epoch);
  if (result) {
    result = _hydrate(epoch);
  }
  if (result && !_epochCurrent(epoch)) {
    result = make_error(ErrorCode::DISCONNECTED, "Connection attempt superseded");
  }

  if (!result) {
    ++_stats.connect_failures;
    MESHLINK_LOG_ERROR(kTag, "Connection failed (%s): %s", error_code_name(result.error().code),
                       result.error().message.c_str());
    if (_epochCurrent(epoch)) {
      disconnect();
    }
    return false;
  }

  if (_device_type == DeviceType::REPEATER) {
    _fsm.repeaterReady();
  } else {
    _fsm.companionReady();
  }

  // Observers may disconnect from onConnected(), which clears the cache.
  const Node snapshot = *_cache.localNode();
  MESHLINK_LOG_INFO(kTag, "Connected to %s (%s)", snapshot.name.c_str(),
                    device_type_name(_device_type));
  _events.receive(events::EvConnected(snapshot));
  return _epochCurrent(epoch);
}

Result<void> ConnectionCoordinator::_connectSerial(uint32_t epoch) {
  Result<void> opened = _serial.open(*_config->serial);
  if (!opened) {
    return opened;
  }
  ++_stats.serial_opens;
  _fsm.transportOpened();

  Result<bool> repeater = _cli.probeVersion(_options.detect_timeout_ms);
  if (!repeater) {
    return make_error(repeater.error());
  }
  if (!_epochCurrent(epoch)) {
    return make_error(ErrorCode::DISCONNECTED, "Connection attempt superseded");
  }

  if (repeater.value()) {
    ++_stats.repeater_detections;
    _device_type = DeviceType::REPEATER;
    MESHLINK_LOG_INFO(kTag, "Detected Repeater firmware");
    return Result<void>();
  }

  MESHLINK_LOG_INFO(kTag, "No Repeater banner, assuming Companion firmware");
  _serial.close(Error(ErrorCode::DISCONNECTED, "Port handed to bridge"));
  return _startBridge(epoch);
}

Result<void> ConnectionCoordinator::_startBridge(uint32_t epoch) {
  ++_stats.bridge_spawns;
  Result<void> opened = _companion.open(*_config, _options);
  if (!opened) {
    return opened;
  }
  if (!_epochCurrent(epoch)) {
    return make_error(ErrorCode::DISCONNECTED, "Connection attempt superseded");
  }
  if (_fsm.isConnecting()) {
    _fsm.transportOpened();
  }
  ++_stats.companion_detections;
  _device_type = DeviceType::COMPANION;
  return Result<void>();
}

Result<void> ConnectionCoordinator::_hydrate(uint32_t epoch) {
  Result<void> node = _refreshLocalNode(epoch);
  if (!node) {
    return node;
  }
  return _refreshContacts(epoch);
}

void ConnectionCoordinator::disconnect() { _teardown(true); }

void ConnectionCoordinator::_teardown(bool emit) {
  if (_fsm.isDisconnecting()) {
    return;
  }
  if (_fsm.isDisconnected() && !_hasOpenResources()) {
    return;
  }

  ++_epoch;
  _fsm.disconnectRequested();
  MESHLINK_LOG_INFO(kTag, "Disconnecting");

  _companion.close(_options);
  _serial.close(Error(ErrorCode::DISCONNECTED, "Disconnected"));

  _cache.clear();
  _staging_contacts.clear();
  _device_type = DeviceType::UNKNOWN;
  _event_queue.clear();

  _fsm.teardownComplete();
  MESHLINK_LOG_INFO(kTag, "Disconnected");
  if (emit) {
    _events.receive(events::EvDisconnected());
  }
}

bool ConnectionCoordinator::_hasOpenResources() const {
  return _serial.isOpen() || _driver.running();
}

void ConnectionCoordinator::process(uint32_t max_wait_ms) {
  struct pollfd fds[kMaxPollFds];
  size_t count = 0;
  int serial_index = -1;
  uint32_t wait = max_wait_ms;

  if (_serial.isOpen()) {
    if (_serial.fd() >= 0) {
      fds[count].fd = _serial.fd();
      fds[count].events = POLLIN;
      fds[count].revents = 0;
      serial_index = static_cast<int>(count++);
    } else if (wait > kUnpollableSliceMs) {
      wait = kUnpollableSliceMs;
    }
    wait = clamp_wait(wait, _serial.nextDeadlineIn());
  }
  const size_t driver_fds = _driver.pollFds(fds + count, kMaxPollFds - count);
  if (driver_fds == 0 && _driver.running() && wait > kUnpollableSliceMs) {
    wait = kUnpollableSliceMs;
  }
  count += driver_fds;
  wait = clamp_wait(wait, _driver.nextDeadlineIn());

  if (count > 0) {
    ::poll(fds, static_cast<nfds_t>(count), static_cast<int>(wait));
  } else if (wait > 0) {
    sleep_ms(wait);
  }

  bool hangup = false;
  if (serial_index >= 0) {
    const short revents = fds[serial_index].revents;
    hangup = (revents & (POLLHUP | POLLERR | POLLNVAL)) != 0 && (revents & POLLIN) == 0;
  }
  _serial.process(hangup);
  _driver.process();

  _dispatchEvents();
}

ConnectionStatus ConnectionCoordinator::getConnectionStatus() const {
  ConnectionStatus status;
  status.connected = isConnected();
  status.device_type = _device_type;
  status.state = _fsm.stateName();
  status.config = _config;
  return status;
}

LinkStats ConnectionCoordinator::getStats() const {
  LinkStats stats = _stats;
  stats.serial_timeouts = _serial.timeouts();
  stats.bridge_timeouts = _bridge.timeouts();
  stats.late_responses = _bridge.lateResponses();
  stats.line_overflows = _serial.overflows();
  stats.bridge_line_overflows = _bridge.lineOverflows();
  return stats;
}

void ConnectionCoordinator::_onBridgeExit(int status) {
  ++_stats.bridge_exits;
  if (_fsm.isConnected()) {
    MESHLINK_LOG_ERROR(kTag, "Bridge exited with status %d while connected, call disconnect() "
                             "and connect() to recover", status);
  }
}

void ConnectionCoordinator::_enqueue(const QueuedEvent& event) {
  if (_event_queue.full()) {
    ++_stats.events_dropped;
    MESHLINK_LOG_WARN(kTag, "Event queue full, dropping event");
    return;
  }
  _event_queue.push(event);
}

void ConnectionCoordinator::_dispatchEvents() {
  if (_dispatching) {
    return;
  }
  _dispatching = true;
  while (!_event_queue.empty()) {
    const QueuedEvent event = _event_queue.front();
    _event_queue.pop();
    if (event.kind == QueuedEvent::Kind::MESSAGE) {
      _events.receive(events::EvMessage(event.message));
    } else {
      _events.receive(events::EvSerialLine(view_of(event.line)));
    }
  }
  _dispatching = false;
}

}  // namespace meshlink
