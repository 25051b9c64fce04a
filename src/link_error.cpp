#include "link_error.h"

#include <stdarg.h>
#include <stdio.h>

namespace meshlink {

Error Error::format(ErrorCode c, const char* fmt, ...) {
  char buffer[kErrorMessageMax];
  va_list args;
  va_start(args, fmt);
  const int written = vsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);
  if (written < 0) {
    return Error(c, fmt);
  }
  return Error(c, buffer);
}

const char* error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::CONFIGURATION:
      return "ConfigurationError";
    case ErrorCode::TRANSPORT:
      return "TransportError";
    case ErrorCode::PROTOCOL_TIMEOUT:
      return "ProtocolTimeoutError";
    case ErrorCode::PROTOCOL:
      return "ProtocolError";
    case ErrorCode::VALIDATION:
      return "ValidationError";
    case ErrorCode::DISCONNECTED:
      return "Disconnected";
    case ErrorCode::NOT_READY:
      return "NotReady";
    case ErrorCode::BUSY:
      return "Busy";
  }
  return "UnknownError";
}

}  // namespace meshlink
