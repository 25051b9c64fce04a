#include "transport/CompanionTransport.h"

#include "protocol/link_protocol.h"
#include "util/log.h"
#include "util/string_utils.h"

namespace meshlink {
namespace {

constexpr const char* kTag = "Bridge";
constexpr uint32_t kReadySliceMs = 100;

// ArduinoJson needs NUL-terminated input for string values.
template <size_t N>
const char* terminated(etl::string_view text, etl::string<N>& storage) {
  assign_bounded(storage, text);
  return storage.c_str();
}

}  // namespace

CompanionTransport::CompanionTransport(ICompanionDriver& driver, const Clock& clock)
    : _driver(driver), _clock(clock), _pump() {}

Result<void> CompanionTransport::open(const ConnectionConfig& config, const LinkOptions& options) {
  Result<void> started = _driver.start();
  if (!started) {
    return started;
  }

  Result<void> ready = _awaitReady(options.bridge_ready_timeout_ms);
  if (!ready) {
    return ready;
  }
  if (!_driver.protocolAvailable()) {
    MESHLINK_LOG_WARN(kTag, "Bridge reports meshcore library unavailable, commands will fail");
  }

  JsonDocument params;
  if (config.serial.has_value()) {
    params["type"] = protocol::bridge::kTransportSerial;
    params["port"] = config.serial->path.c_str();
    params["baud"] = config.serial->baud;
  } else if (config.tcp.has_value()) {
    params["type"] = protocol::bridge::kTransportTcp;
    params["host"] = config.tcp->host.c_str();
    params["tcp_port"] = config.tcp->port;
  } else {
    return make_error(ErrorCode::CONFIGURATION, "No transport specified");
  }

  BridgeReplySlot reply;
  Result<void> connected = call(protocol::bridge::kCmdConnect, params.as<JsonObjectConst>(),
                                options.bridge_connect_timeout_ms, reply);
  if (!connected) {
    MESHLINK_LOG_ERROR(kTag, "Bridge connect failed: %s", connected.error().message.c_str());
    return connected;
  }
  return Result<void>();
}

void CompanionTransport::close(const LinkOptions& options) {
  if (_driver.ready()) {
    Result<void> done = shutdown(options.bridge_shutdown_timeout_ms);
    if (!done) {
      MESHLINK_LOG_DEBUG(kTag, "Shutdown request failed: %s", done.error().message.c_str());
    }
  }
  _driver.stop(options.bridge_kill_grace_ms);
}

Result<void> CompanionTransport::call(const char* cmd, JsonObjectConst params,
                                      uint32_t timeout_ms, BridgeReplySlot& reply) {
  if (!_pump.is_valid()) {
    return make_error(ErrorCode::NOT_READY, "No event pump attached");
  }
  Result<void> sent = _driver.sendCommand(cmd, params, timeout_ms, reply);
  if (!sent) {
    return sent;
  }
  _await(reply);
  if (!reply.ok()) {
    return make_error(reply.error());
  }
  return Result<void>();
}

Result<void> CompanionTransport::getSelfInfo(uint32_t timeout_ms, Node& out) {
  BridgeReplySlot reply;
  Result<void> done = call(protocol::bridge::kCmdGetSelfInfo, JsonObjectConst(), timeout_ms, reply);
  if (!done) {
    return done;
  }
  Node node;
  protocol::BridgeCodec::parseSelfInfo(reply.value().data(), node);
  out = node;
  return Result<void>();
}

Result<void> CompanionTransport::getContacts(uint32_t timeout_ms, uint64_t now_ms,
                                             ContactList& out) {
  BridgeReplySlot reply;
  Result<void> done = call(protocol::bridge::kCmdGetContacts, JsonObjectConst(), timeout_ms, reply);
  if (!done) {
    return done;
  }
  if (!reply.value().data().is<JsonArrayConst>()) {
    return make_error(ErrorCode::PROTOCOL, "get_contacts returned no list");
  }
  protocol::BridgeCodec::parseContacts(reply.value().data(), now_ms, out);
  return Result<void>();
}

Result<void> CompanionTransport::sendMessage(etl::string_view text, const PublicKeyHex* to,
                                             uint32_t timeout_ms) {
  MessageText text_buf;
  JsonDocument params;
  params["text"] = terminated(text, text_buf);
  if (to != nullptr) {
    params["to"] = to->c_str();
  } else {
    params["to"] = nullptr;
  }
  BridgeReplySlot reply;
  return call(protocol::bridge::kCmdSendMessage, params.as<JsonObjectConst>(), timeout_ms, reply);
}

Result<void> CompanionTransport::sendAdvert(uint32_t timeout_ms) {
  BridgeReplySlot reply;
  return call(protocol::bridge::kCmdSendAdvert, JsonObjectConst(), timeout_ms, reply);
}

Result<void> CompanionTransport::login(etl::string_view public_key, etl::string_view password,
                                       uint32_t timeout_ms) {
  PublicKeyHex key_buf;
  etl::string<kPasswordMax> password_buf;
  JsonDocument params;
  params["public_key"] = terminated(public_key, key_buf);
  params["password"] = terminated(password, password_buf);
  BridgeReplySlot reply;
  return call(protocol::bridge::kCmdLogin, params.as<JsonObjectConst>(), timeout_ms, reply);
}

Result<void> CompanionTransport::getStatus(etl::string_view public_key, uint32_t timeout_ms,
                                           NodeStatus& out) {
  PublicKeyHex key_buf;
  JsonDocument params;
  params["public_key"] = terminated(public_key, key_buf);
  BridgeReplySlot reply;
  Result<void> done =
      call(protocol::bridge::kCmdGetStatus, params.as<JsonObjectConst>(), timeout_ms, reply);
  if (!done) {
    return done;
  }
  NodeStatus status;
  protocol::BridgeCodec::parseStatus(reply.value().data(), status);
  out = status;
  return Result<void>();
}

Result<void> CompanionTransport::setName(etl::string_view name, uint32_t timeout_ms) {
  NodeName name_buf;
  JsonDocument params;
  params["name"] = terminated(name, name_buf);
  BridgeReplySlot reply;
  return call(protocol::bridge::kCmdSetName, params.as<JsonObjectConst>(), timeout_ms, reply);
}

Result<void> CompanionTransport::setRadio(double freq_mhz, double bw_khz, uint8_t sf, uint8_t cr,
                                          uint32_t timeout_ms) {
  JsonDocument params;
  params["freq"] = freq_mhz;
  params["bw"] = bw_khz;
  params["sf"] = sf;
  params["cr"] = cr;
  BridgeReplySlot reply;
  return call(protocol::bridge::kCmdSetRadio, params.as<JsonObjectConst>(), timeout_ms, reply);
}

Result<void> CompanionTransport::shutdown(uint32_t timeout_ms) {
  BridgeReplySlot reply;
  return call(protocol::bridge::kCmdShutdown, JsonObjectConst(), timeout_ms, reply);
}

Result<void> CompanionTransport::_awaitReady(uint32_t timeout_ms) {
  if (!_pump.is_valid()) {
    return make_error(ErrorCode::NOT_READY, "No event pump attached");
  }
  const uint32_t deadline = _clock.millis() + timeout_ms;
  while (!_driver.ready()) {
    if (!_driver.running()) {
      return make_error(ErrorCode::TRANSPORT, "Bridge exited before ready");
    }
    const int32_t remaining = millis_until(deadline, _clock.millis());
    if (remaining <= 0) {
      return make_error(Error::format(ErrorCode::PROTOCOL_TIMEOUT,
                                      "Bridge not ready after %u ms",
                                      static_cast<unsigned>(timeout_ms)));
    }
    _pump(static_cast<uint32_t>(remaining) < kReadySliceMs ? static_cast<uint32_t>(remaining)
                                                           : kReadySliceMs);
  }
  return Result<void>();
}

void CompanionTransport::_await(BridgeReplySlot& reply) {
  while (reply.pending()) {
    const int32_t remaining = _driver.nextDeadlineIn();
    _pump(remaining < 0 ? 0U : static_cast<uint32_t>(remaining));
  }
}

}  // namespace meshlink
