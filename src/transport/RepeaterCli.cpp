#include "transport/RepeaterCli.h"

#include "protocol/link_protocol.h"
#include "util/log.h"
#include "util/string_utils.h"

namespace meshlink {
namespace {

constexpr const char* kTag = "Serial";
constexpr size_t kCommandMax = 96;

}  // namespace

RepeaterCli::RepeaterCli(SerialTransport& transport, const IResponseParser& parser)
    : _transport(transport), _parser(parser), _pump() {}

Result<CliReply> RepeaterCli::execute(const char* command, uint32_t timeout_ms,
                                      const char* extra_terminator) {
  if (!_pump.is_valid()) {
    return make_error(ErrorCode::NOT_READY, "No event pump attached");
  }

  PendingReply<CliReply> reply;
  Result<void> sent = _transport.sendCommand(command, timeout_ms, reply, extra_terminator);
  if (!sent) {
    return make_error(sent.error());
  }

  while (reply.pending()) {
    const int32_t remaining = _transport.nextDeadlineIn();
    _pump(remaining < 0 ? 0U : static_cast<uint32_t>(remaining));
  }

  if (!reply.ok()) {
    return make_error(reply.error());
  }
  return reply.value();
}

Result<bool> RepeaterCli::probeVersion(uint32_t timeout_ms) {
  Result<CliReply> reply =
      execute(protocol::cli::kVersion, timeout_ms, protocol::cli::kFirmwareSignature);
  if (!reply) {
    if (reply.error().code == ErrorCode::NOT_READY) {
      return make_error(reply.error());
    }
    MESHLINK_LOG_INFO(kTag, "Version probe failed (%s)", reply.error().message.c_str());
    return false;
  }
  MESHLINK_LOG_DEBUG(kTag, "Version reply: %s", reply.value().c_str());
  return _parser.isRepeaterBanner(view_of(reply.value()));
}

Result<void> RepeaterCli::readNode(uint32_t timeout_ms, Node& out) {
  Result<CliReply> name = execute(protocol::cli::kGetName, timeout_ms);
  if (!name) {
    return make_error(name.error());
  }
  Result<CliReply> radio = execute(protocol::cli::kGetRadio, timeout_ms);
  if (!radio) {
    return make_error(radio.error());
  }

  Node node;
  node.public_key = protocol::cli::kPlaceholderPublicKey;
  node.device_type = DeviceType::REPEATER;
  _parser.parseName(view_of(name.value()), node.name);
  if (!_parser.parseRadio(view_of(radio.value()), node.radio)) {
    MESHLINK_LOG_WARN(kTag, "Unrecognised radio reply: %s", radio.value().c_str());
  }
  out = node;
  return Result<void>();
}

Result<void> RepeaterCli::setName(etl::string_view name, uint32_t timeout_ms) {
  etl::string<kCommandMax> command(protocol::cli::kSetName);
  command.append(name.data(), name.size());
  return _expectAccepted(command.c_str(), timeout_ms);
}

Result<void> RepeaterCli::setRadio(double freq_mhz, double bw_khz, uint8_t sf, uint8_t cr,
                                   uint32_t timeout_ms) {
  etl::string<16> freq;
  etl::string<16> bw;
  format_decimal(freq_mhz, freq);
  format_decimal(bw_khz, bw);

  char command[kCommandMax];
  snprintf(command, sizeof(command), "%s%s,%s,%u,%u", protocol::cli::kSetRadio, freq.c_str(),
           bw.c_str(), static_cast<unsigned>(sf), static_cast<unsigned>(cr));
  return _expectAccepted(command, timeout_ms);
}

Result<void> RepeaterCli::advert(uint32_t timeout_ms) {
  return _expectAccepted(protocol::cli::kAdvert, timeout_ms);
}

Result<void> RepeaterCli::_expectAccepted(const char* command, uint32_t timeout_ms) {
  Result<CliReply> reply = execute(command, timeout_ms);
  if (!reply) {
    return make_error(reply.error());
  }
  if (_parser.isErrorReply(view_of(reply.value()))) {
    return make_error(Error::format(ErrorCode::PROTOCOL, "%s: %s", command, reply.value().c_str()));
  }
  return Result<void>();
}

}  // namespace meshlink
