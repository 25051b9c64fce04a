#ifndef MESHLINK_LINK_ERROR_H
#define MESHLINK_LINK_ERROR_H

#include <stdint.h>

#include <etl/expected.h>
#include <etl/string.h>
#include <etl/string_view.h>

namespace meshlink {

enum class ErrorCode : uint8_t {
  CONFIGURATION = 0,
  TRANSPORT = 1,
  PROTOCOL_TIMEOUT = 2,
  PROTOCOL = 3,
  VALIDATION = 4,
  DISCONNECTED = 5,
  NOT_READY = 6,
  BUSY = 7
};

static constexpr size_t kErrorMessageMax = 128;

struct Error {
  ErrorCode code;
  etl::string<kErrorMessageMax> message;

  Error() : code(ErrorCode::PROTOCOL), message() {}
  Error(ErrorCode c, etl::string_view text) : code(c), message(text.data(), text.size()) {}
  Error(ErrorCode c, const char* text) : code(c), message(text) {}

  static Error format(ErrorCode c, const char* fmt, ...)
      __attribute__((format(printf, 2, 3)));
};

template <typename T>
using Result = etl::expected<T, Error>;

inline etl::unexpected<Error> make_error(ErrorCode code, const char* text) {
  return etl::unexpected<Error>(Error(code, text));
}

inline etl::unexpected<Error> make_error(const Error& error) {
  return etl::unexpected<Error>(error);
}

const char* error_code_name(ErrorCode code);

}  // namespace meshlink

#endif  // MESHLINK_LINK_ERROR_H
