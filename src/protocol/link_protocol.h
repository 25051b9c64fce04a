/**
 * @file link_protocol.h
 * @brief Wire-level constants for the Repeater CLI and the bridge protocol.
 */
#ifndef MESHLINK_PROTOCOL_LINK_PROTOCOL_H
#define MESHLINK_PROTOCOL_LINK_PROTOCOL_H

#include <stdint.h>

namespace meshlink {

enum class DeviceType : uint8_t {
  UNKNOWN = 0,
  COMPANION = 1,
  REPEATER = 2,
  ROOM_SERVER = 3
};

const char* device_type_name(DeviceType type);

// Maps an advert type reported by the device. Types outside the known set
// (sensors and future roles) are reported as UNKNOWN.
DeviceType device_type_from_wire(int value);

namespace protocol {

// --- Repeater text CLI ---
namespace cli {

static constexpr const char* kVersion = "ver";
static constexpr const char* kGetName = "get name";
static constexpr const char* kGetRadio = "get radio";
static constexpr const char* kSetName = "set name ";
static constexpr const char* kSetRadio = "set radio ";
static constexpr const char* kAdvert = "advert";

// Substrings that end an accumulated CLI reply.
static constexpr const char* kPromptMarker = ">";
static constexpr const char* kOkMarker = "OK";
static constexpr const char* kErrorMarker = "Error";

static constexpr const char* kFirmwareSignature = "MeshCore";

// Repeaters have no addressable identity over the CLI.
static constexpr const char* kPlaceholderPublicKey = "repeater";
static constexpr const char* kUnknownRepeaterName = "Unknown Repeater";

}  // namespace cli

// --- Bridge JSON-lines protocol ---
namespace bridge {

static constexpr const char* kCmdConnect = "connect";
static constexpr const char* kCmdGetSelfInfo = "get_self_info";
static constexpr const char* kCmdGetContacts = "get_contacts";
static constexpr const char* kCmdSendMessage = "send_message";
static constexpr const char* kCmdSendAdvert = "send_advert";
static constexpr const char* kCmdLogin = "login";
static constexpr const char* kCmdGetStatus = "get_status";
static constexpr const char* kCmdSetName = "set_name";
static constexpr const char* kCmdSetRadio = "set_radio";
static constexpr const char* kCmdShutdown = "shutdown";

static constexpr const char* kFrameTypeReady = "ready";
static constexpr const char* kTransportSerial = "serial";
static constexpr const char* kTransportTcp = "tcp";

}  // namespace bridge

static constexpr const char* kLocalSender = "local";
static constexpr const char* kUnknownNodeName = "Unknown";

}  // namespace protocol
}  // namespace meshlink

#endif  // MESHLINK_PROTOCOL_LINK_PROTOCOL_H
