#include "MeshLink.h"

#include <stdio.h>

#include "protocol/link_protocol.h"
#include "util/log.h"
#include "util/string_utils.h"

namespace meshlink {
namespace {

constexpr const char* kTag = "MeshCore";

}  // namespace

bool ConnectionCoordinator::sendMessage(etl::string_view text) {
  return _sendMessage(text, nullptr);
}

bool ConnectionCoordinator::sendMessage(etl::string_view text, etl::string_view to_public_key) {
  Result<void> key = validate_public_key(to_public_key);
  if (!key) {
    MESHLINK_LOG_ERROR(kTag, "sendMessage: %s", key.error().message.c_str());
    return false;
  }
  PublicKeyHex to;
  assign_bounded(to, to_public_key);
  return _sendMessage(text, &to);
}

bool ConnectionCoordinator::_sendMessage(etl::string_view text, const PublicKeyHex* to) {
  if (!_requireConnected("sendMessage") || !_requireCompanion("sendMessage")) {
    return false;
  }
  Result<void> valid = validate_message_text(text);
  if (!valid) {
    MESHLINK_LOG_ERROR(kTag, "sendMessage: %s", valid.error().message.c_str());
    return false;
  }

  const uint32_t epoch = _epoch;
  Result<void> sent = _companion.sendMessage(text, to, _options.bridge_command_timeout_ms);
  if (!sent) {
    MESHLINK_LOG_ERROR(kTag, "Failed to send message: %s", sent.error().message.c_str());
    return false;
  }
  if (!_epochCurrent(epoch)) {
    return false;
  }

  QueuedEvent event;
  event.kind = QueuedEvent::Kind::MESSAGE;
  Message& message = event.message;
  _mintMessageId("sent-", message.id);
  const Node* local = _cache.localNode();
  if (local != nullptr && !local->public_key.empty()) {
    message.from_public_key = local->public_key;
  } else {
    message.from_public_key = protocol::kLocalSender;
  }
  if (to != nullptr) {
    message.to_public_key = *to;
  }
  assign_bounded(message.text, text);
  message.timestamp_ms = _clock.epochMillis();

  _cache.appendMessage(message);
  ++_stats.messages_sent;
  _enqueue(event);
  _dispatchEvents();
  return true;
}

bool ConnectionCoordinator::sendAdvert() {
  if (!_requireConnected("sendAdvert")) {
    return false;
  }
  Result<void> sent = _device_type == DeviceType::REPEATER
                          ? _cli.advert(_options.repeater_command_timeout_ms)
                          : _companion.sendAdvert(_options.bridge_command_timeout_ms);
  if (!sent) {
    MESHLINK_LOG_ERROR(kTag, "Failed to send advert: %s", sent.error().message.c_str());
    return false;
  }
  MESHLINK_LOG_INFO(kTag, "Advert sent");
  return true;
}

void ConnectionCoordinator::_onSerialLine(etl::string_view line) {
  ++_stats.serial_lines;
  QueuedEvent event;
  event.kind = QueuedEvent::Kind::SERIAL_LINE;
  assign_bounded(event.line, line);
  _enqueue(event);
}

void ConnectionCoordinator::_onPush(const PublicKeyHex& from, const MessageText& text) {
  QueuedEvent event;
  event.kind = QueuedEvent::Kind::MESSAGE;
  Message& message = event.message;
  _mintMessageId("", message.id);
  message.from_public_key = from;
  message.text = text;
  message.timestamp_ms = _clock.epochMillis();

  _cache.appendMessage(message);
  ++_stats.messages_received;
  MESHLINK_LOG_DEBUG(kTag, "Message from %s", from.c_str());
  _enqueue(event);
}

// <epoch-ms>-<sequence>: unique within a coordinator, ordered by arrival.
void ConnectionCoordinator::_mintMessageId(const char* prefix, MessageId& out) {
  char buffer[kMessageIdMax + 1];
  snprintf(buffer, sizeof(buffer), "%s%llu-%06x", prefix,
           static_cast<unsigned long long>(_clock.epochMillis()),
           static_cast<unsigned>(++_message_seq & 0xFFFFFFU));
  out = buffer;
}

}  // namespace meshlink
