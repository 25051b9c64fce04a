/**
 * @file mesh_types.h
 * @brief Domain records shared by the transports, the cache and observers.
 *
 * All strings are bounded. Telemetry and radio fields are optional because
 * neither firmware reports every field.
 */
#ifndef MESHLINK_STATE_MESH_TYPES_H
#define MESHLINK_STATE_MESH_TYPES_H

#include <stdint.h>

#include <etl/optional.h>
#include <etl/string.h>
#include <etl/vector.h>

#include "meshlink_config.h"
#include "protocol/link_protocol.h"

namespace meshlink {

// 32-byte Ed25519 public key in hex.
static constexpr size_t kPublicKeyHexMax = 64;
static constexpr size_t kNodeNameMax = 32;
static constexpr size_t kMessageIdMax = 48;

using PublicKeyHex = etl::string<kPublicKeyHexMax>;
using NodeName = etl::string<kNodeNameMax>;
using MessageText = etl::string<MESHLINK_MAX_MESSAGE_TEXT>;
using MessageId = etl::string<kMessageIdMax>;

struct RadioParams {
  etl::optional<double> freq_mhz;
  etl::optional<double> bw_khz;
  etl::optional<uint8_t> sf;
  etl::optional<uint8_t> cr;
};

struct SignalQuality {
  double rssi;
  double snr;
};

struct Position {
  double latitude;
  double longitude;
};

struct Node {
  PublicKeyHex public_key;
  NodeName name;
  DeviceType device_type;
  RadioParams radio;
  etl::optional<int8_t> tx_power;
  etl::optional<int8_t> max_tx_power;
  etl::optional<uint16_t> battery_mv;
  etl::optional<uint32_t> uptime_secs;
  etl::optional<double> rssi;
  etl::optional<double> snr;
  etl::optional<Position> position;
  etl::optional<uint64_t> last_heard_ms;

  Node() : device_type(DeviceType::UNKNOWN) {}
};

struct Contact {
  PublicKeyHex public_key;
  NodeName adv_name;
  NodeName name;
  etl::optional<double> rssi;
  etl::optional<double> snr;
  DeviceType adv_type;
  etl::optional<Position> position;
  uint64_t last_seen_ms;

  Contact() : adv_type(DeviceType::UNKNOWN), last_seen_ms(0) {}
};

struct Message {
  MessageId id;
  PublicKeyHex from_public_key;
  etl::optional<PublicKeyHex> to_public_key;
  MessageText text;
  uint64_t timestamp_ms;
  etl::optional<SignalQuality> signal;

  Message() : timestamp_ms(0) {}
};

struct NodeStatus {
  etl::optional<uint16_t> battery_mv;
  etl::optional<uint32_t> uptime_secs;
  etl::optional<int8_t> tx_power;
  RadioParams radio;
};

using ContactList = etl::vector<Contact, MESHLINK_MAX_CONTACTS>;
using NodeList = etl::vector<Node, MESHLINK_MAX_CONTACTS + 1>;
using MessageList = etl::vector<Message, MESHLINK_MAX_MESSAGE_HISTORY>;

}  // namespace meshlink

#endif  // MESHLINK_STATE_MESH_TYPES_H
