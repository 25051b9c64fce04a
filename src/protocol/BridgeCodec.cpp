#include "protocol/BridgeCodec.h"

#include <stdlib.h>
#include <string.h>

#include "protocol/link_protocol.h"
#include "util/log.h"
#include "util/string_utils.h"

namespace meshlink {
namespace protocol {
namespace {

constexpr const char* kTag = "Bridge";

void copy_string(JsonVariantConst value, etl::istring& out) {
  out.clear();
  const char* text = value.as<const char*>();
  if (text != nullptr) {
    assign_bounded(out, etl::string_view(text, strlen(text)));
  }
}

template <typename T>
void copy_number(JsonVariantConst value, etl::optional<T>& out) {
  if (value.is<double>()) {
    out = value.as<T>();
  } else {
    out.reset();
  }
}

void copy_radio(JsonVariantConst data, RadioParams& out) {
  copy_number(data["radio_freq"], out.freq_mhz);
  copy_number(data["radio_bw"], out.bw_khz);
  copy_number(data["radio_sf"], out.sf);
  copy_number(data["radio_cr"], out.cr);
}

// 0.0 means the device has no GPS fix.
void copy_position(JsonVariantConst data, etl::optional<Position>& out) {
  out.reset();
  JsonVariantConst lat = data["latitude"];
  JsonVariantConst lon = data["longitude"];
  if (!lat.is<double>() || !lon.is<double>()) {
    return;
  }
  Position position;
  position.latitude = lat.as<double>();
  position.longitude = lon.as<double>();
  // 0,0 is what the firmware reports when it has no fix.
  if (position.latitude == 0.0 && position.longitude == 0.0) {
    return;
  }
  out = position;
}

}  // namespace

bool BridgeCodec::encodeRequest(uint32_t id, const char* cmd, JsonObjectConst params,
                                etl::istring& out) {
  JsonDocument request;
  request["id"] = id;
  request["cmd"] = cmd;
  if (!params.isNull()) {
    for (JsonPairConst kv : params) {
      request[kv.key()] = kv.value();
    }
  }

  const size_t length = measureJson(request);
  if (length + 1 > out.max_size()) {
    MESHLINK_LOG_ERROR(kTag, "Request %s too large (%u bytes)", cmd,
                       static_cast<unsigned>(length));
    return false;
  }

  out.clear();
  out.resize(length);
  serializeJson(request, out.data(), length + 1);
  out.push_back('\n');
  return true;
}

Result<BridgeFrameKind> BridgeCodec::decodeFrame(etl::string_view line, JsonDocument& doc) {
  const DeserializationError err = deserializeJson(doc, line.data(), line.size());
  if (err) {
    return make_error(Error::format(ErrorCode::PROTOCOL, "Malformed bridge frame: %s",
                                    err.c_str()));
  }
  if (!doc.is<JsonObject>()) {
    return make_error(ErrorCode::PROTOCOL, "Bridge frame is not an object");
  }

  const char* type = doc["type"].as<const char*>();
  if (type != nullptr && strcmp(type, bridge::kFrameTypeReady) == 0) {
    return BridgeFrameKind::READY;
  }
  if (!doc["id"].isNull()) {
    return BridgeFrameKind::RESPONSE;
  }
  return BridgeFrameKind::UNKNOWN;
}

ReadyInfo BridgeCodec::readReady(const JsonDocument& doc) {
  ReadyInfo info;
  info.meshcore_available = doc["meshcore_available"] | false;
  info.tcp_available = doc["tcp_available"] | false;
  return info;
}

bool BridgeCodec::readResponseHeader(const JsonDocument& doc, ResponseHeader& out) {
  JsonVariantConst id = doc["id"];
  if (id.is<uint32_t>()) {
    out.id = id.as<uint32_t>();
  } else if (id.is<const char*>()) {
    const char* text = id.as<const char*>();
    char* end = nullptr;
    const unsigned long value = strtoul(text, &end, 10);
    if (end == text || *end != '\0') {
      return false;
    }
    out.id = static_cast<uint32_t>(value);
  } else {
    return false;
  }

  out.success = doc["success"] | false;
  out.error.clear();
  if (!out.success) {
    const char* error = doc["error"] | "Unknown bridge error";
    assign_bounded(out.error, etl::string_view(error, strlen(error)));
  }
  return true;
}

bool BridgeCodec::peekResponseId(etl::string_view head, uint32_t& id) {
  static const char kIdKey[] = "\"id\"";
  const size_t key_len = sizeof(kIdKey) - 1;

  size_t pos = 0;
  while (pos < head.size() && (head[pos] == ' ' || head[pos] == '{')) {
    ++pos;
  }
  if (head.size() - pos < key_len || head.substr(pos, key_len) != etl::string_view(kIdKey)) {
    return false;
  }
  pos += key_len;
  while (pos < head.size() && (head[pos] == ' ' || head[pos] == ':' || head[pos] == '"')) {
    ++pos;
  }

  uint32_t value = 0;
  size_t digits = 0;
  while (pos < head.size() && head[pos] >= '0' && head[pos] <= '9' && digits < 10) {
    value = value * 10U + static_cast<uint32_t>(head[pos] - '0');
    ++pos;
    ++digits;
  }
  if (digits == 0) {
    return false;
  }
  id = value;
  return true;
}

void BridgeCodec::parseSelfInfo(JsonVariantConst data, Node& out) {
  copy_string(data["public_key"], out.public_key);
  copy_string(data["name"], out.name);
  if (out.name.empty()) {
    out.name = kUnknownNodeName;
  }

  JsonVariantConst adv_type = data["adv_type"];
  out.device_type = adv_type.is<int>() && adv_type.as<int>() != 0
                        ? device_type_from_wire(adv_type.as<int>())
                        : DeviceType::COMPANION;

  copy_number(data["tx_power"], out.tx_power);
  copy_number(data["max_tx_power"], out.max_tx_power);
  copy_radio(data, out.radio);
  copy_position(data, out.position);
}

size_t BridgeCodec::parseContacts(JsonVariantConst data, uint64_t now_ms, ContactList& out) {
  out.clear();
  JsonArrayConst list = data.as<JsonArrayConst>();
  if (list.isNull()) {
    return 0;
  }

  size_t dropped = 0;
  for (JsonVariantConst item : list) {
    const char* key = item["public_key"].as<const char*>();
    if (key == nullptr || *key == '\0') {
      continue;
    }
    if (out.full()) {
      ++dropped;
      continue;
    }

    Contact contact;
    assign_bounded(contact.public_key, etl::string_view(key, strlen(key)));
    copy_string(item["adv_name"], contact.adv_name);
    copy_string(item["name"], contact.name);
    copy_number(item["rssi"], contact.rssi);
    copy_number(item["snr"], contact.snr);
    contact.adv_type = device_type_from_wire(item["adv_type"] | 0);
    copy_position(item, contact.position);
    contact.last_seen_ms = now_ms;
    out.push_back(contact);
  }

  if (dropped > 0) {
    MESHLINK_LOG_WARN(kTag, "Contact table full, dropped %u contacts",
                      static_cast<unsigned>(dropped));
  }
  return out.size();
}

void BridgeCodec::parseStatus(JsonVariantConst data, NodeStatus& out) {
  copy_number(data["bat_mv"], out.battery_mv);
  copy_number(data["up_secs"], out.uptime_secs);
  copy_number(data["tx_power"], out.tx_power);
  copy_radio(data, out.radio);
}

}  // namespace protocol
}  // namespace meshlink
