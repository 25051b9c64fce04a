#include "protocol/ResponseParser.h"

#include <stdlib.h>

#include <etl/string.h>

#include "protocol/link_protocol.h"
#include "util/string_utils.h"

namespace meshlink {
namespace {

using ReplyBuffer = etl::string<MESHLINK_CLI_REPLY_MAX>;

double to_double(etl::string_view text) {
  etl::string<32> buf;
  assign_bounded(buf, text);
  return strtod(buf.c_str(), nullptr);
}

unsigned long to_unsigned(etl::string_view text) {
  etl::string<16> buf;
  assign_bounded(buf, text);
  return strtoul(buf.c_str(), nullptr, 10);
}

}  // namespace

RepeaterTextParser::RepeaterTextParser()
    : _name_labelled("name:[[:space:]]*(.+)", REG_NEWLINE),
      _name_prompt("^>[[:space:]]*(.+)$", REG_NEWLINE),
      _radio("([0-9]+\\.?[0-9]*),[[:space:]]*([0-9]+\\.?[0-9]*),[[:space:]]*([0-9]+),[[:space:]]*([0-9]+)"),
      _push("^MSG:([a-f0-9]+):(.+)$", REG_ICASE | REG_NEWLINE) {}

bool RepeaterTextParser::isRepeaterBanner(etl::string_view reply) const {
  return contains(reply, protocol::cli::kFirmwareSignature);
}

bool RepeaterTextParser::isErrorReply(etl::string_view reply) const {
  return contains(reply, protocol::cli::kErrorMarker);
}

void RepeaterTextParser::parseName(etl::string_view reply, NodeName& out) const {
  ReplyBuffer buffer;
  assign_bounded(buffer, reply);

  etl::string_view captured;
  if (_name_labelled.capture(buffer.c_str(), 1, captured) ||
      _name_prompt.capture(buffer.c_str(), 1, captured)) {
    const etl::string_view name = trim(captured);
    if (!name.empty()) {
      assign_bounded(out, name);
      return;
    }
  }
  out = protocol::cli::kUnknownRepeaterName;
}

bool RepeaterTextParser::parseRadio(etl::string_view reply, RadioParams& out) const {
  ReplyBuffer buffer;
  assign_bounded(buffer, reply);

  etl::string_view groups[PosixRegex::kMaxGroups];
  if (!_radio.captureAll(buffer.c_str(), groups)) {
    return false;
  }
  out.freq_mhz = to_double(groups[1]);
  out.bw_khz = to_double(groups[2]);
  out.sf = static_cast<uint8_t>(to_unsigned(groups[3]));
  out.cr = static_cast<uint8_t>(to_unsigned(groups[4]));
  return true;
}

bool RepeaterTextParser::parsePush(etl::string_view line, PublicKeyHex& from,
                                   MessageText& text) const {
  if (line.size() <= 4) {
    return false;
  }
  ReplyBuffer buffer;
  assign_bounded(buffer, line);

  etl::string_view groups[PosixRegex::kMaxGroups];
  if (!_push.captureAll(buffer.c_str(), groups)) {
    return false;
  }
  assign_bounded(from, groups[1]);
  assign_bounded(text, groups[2]);
  return true;
}

}  // namespace meshlink
