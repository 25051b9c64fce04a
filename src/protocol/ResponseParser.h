/**
 * @file ResponseParser.h
 * @brief Free-text parsing of Repeater CLI replies.
 *
 * The Repeater firmware answers in human-oriented text, so every field is
 * recovered by pattern matching. Keeping that behind IResponseParser lets the
 * transport stay format-agnostic and lets firmware revisions get their own
 * parser.
 */
#ifndef MESHLINK_PROTOCOL_RESPONSE_PARSER_H
#define MESHLINK_PROTOCOL_RESPONSE_PARSER_H

#include <etl/string_view.h>

#include "state/mesh_types.h"
#include "util/posix_regex.h"

namespace meshlink {

class IResponseParser {
 public:
  virtual ~IResponseParser() {}

  // True when a version reply identifies Repeater firmware.
  virtual bool isRepeaterBanner(etl::string_view reply) const = 0;

  // True when the firmware rejected the command.
  virtual bool isErrorReply(etl::string_view reply) const = 0;

  // Always produces a name; falls back to a placeholder when nothing matches.
  virtual void parseName(etl::string_view reply, NodeName& out) const = 0;

  // Leaves @p out untouched and returns false when no radio tuple is found.
  virtual bool parseRadio(etl::string_view reply, RadioParams& out) const = 0;

  // Unsolicited "MSG:<hex key>:<text>" line.
  virtual bool parsePush(etl::string_view line, PublicKeyHex& from, MessageText& text) const = 0;
};

class RepeaterTextParser : public IResponseParser {
 public:
  RepeaterTextParser();

  bool isRepeaterBanner(etl::string_view reply) const override;
  bool isErrorReply(etl::string_view reply) const override;
  void parseName(etl::string_view reply, NodeName& out) const override;
  bool parseRadio(etl::string_view reply, RadioParams& out) const override;
  bool parsePush(etl::string_view line, PublicKeyHex& from, MessageText& text) const override;

 private:
  PosixRegex _name_labelled;
  PosixRegex _name_prompt;
  PosixRegex _radio;
  PosixRegex _push;
};

}  // namespace meshlink

#endif  // MESHLINK_PROTOCOL_RESPONSE_PARSER_H
