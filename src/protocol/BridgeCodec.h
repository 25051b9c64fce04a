/**
 * @file BridgeCodec.h
 * @brief JSON-lines codec for the Companion bridge subprocess.
 *
 * Requests are one JSON object per line: {"id", "cmd", ...params}.
 * The bridge answers {"id", "success", "data"} or {"id", "success": false,
 * "error"}, and announces itself once with {"type": "ready", ...}.
 */
#ifndef MESHLINK_PROTOCOL_BRIDGE_CODEC_H
#define MESHLINK_PROTOCOL_BRIDGE_CODEC_H

#include <stdint.h>

#include <ArduinoJson.h>
#include <etl/string.h>
#include <etl/string_view.h>

#include "link_error.h"
#include "state/mesh_types.h"

namespace meshlink {
namespace protocol {

enum class BridgeFrameKind : uint8_t { READY, RESPONSE, UNKNOWN };

struct ReadyInfo {
  bool meshcore_available;
  bool tcp_available;
};

struct ResponseHeader {
  uint32_t id;
  bool success;
  etl::string<kErrorMessageMax> error;
};

// Payload of a successful bridge response. Owns the parsed line.
struct BridgeReply {
  JsonDocument doc;

  JsonVariantConst data() const { return doc["data"]; }
};

class BridgeCodec {
 public:
  /**
   * @brief Serialize one request line, newline included.
   * @return false if the request does not fit in @p out.
   */
  static bool encodeRequest(uint32_t id, const char* cmd, JsonObjectConst params,
                            etl::istring& out);

  // Parse one line and classify it. Malformed JSON yields PROTOCOL.
  static Result<BridgeFrameKind> decodeFrame(etl::string_view line, JsonDocument& doc);

  static ReadyInfo readReady(const JsonDocument& doc);

  // Ids are echoed as given; both numbers and numeric strings are accepted.
  static bool readResponseHeader(const JsonDocument& doc, ResponseHeader& out);

  /**
   * @brief Recover the id from the head of a response too long to parse.
   *
   * Expects the id as the first member, as the bridge writes it:
   * {"id": 7, ...} or {"id": "7", ...}.
   */
  static bool peekResponseId(etl::string_view head, uint32_t& id);

  static void parseSelfInfo(JsonVariantConst data, Node& out);
  static size_t parseContacts(JsonVariantConst data, uint64_t now_ms, ContactList& out);
  static void parseStatus(JsonVariantConst data, NodeStatus& out);
};

}  // namespace protocol
}  // namespace meshlink

#endif  // MESHLINK_PROTOCOL_BRIDGE_CODEC_H
