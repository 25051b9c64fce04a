#include "util/log.h"

#include <stdarg.h>
#include <stdio.h>
#include <strings.h>
#include <unistd.h>

#include <etl/error_handler.h>
#include <etl/exception.h>

namespace meshlink {
namespace log {
namespace {

Level g_level = Level::INFO;
Sink g_sink;

constexpr size_t kLineMax = 512;

void write_all(const char* data, size_t len) {
  while (len > 0) {
    const ssize_t written = ::write(2, data, len);
    if (written <= 0) {
      return;
    }
    data += static_cast<size_t>(written);
    len -= static_cast<size_t>(written);
  }
}

void on_etl_error(const etl::exception& e) {
  write(Level::ERROR, "ETL", "%s (%s:%d)", e.what(), e.file_name(),
        static_cast<int>(e.line_number()));
}

}  // namespace

void setLevel(Level level) { g_level = level; }

Level level() { return g_level; }

bool parseLevel(const char* text, Level& out) {
  if (text == nullptr) {
    return false;
  }
  if (strcasecmp(text, "debug") == 0) {
    out = Level::DEBUG;
  } else if (strcasecmp(text, "info") == 0) {
    out = Level::INFO;
  } else if (strcasecmp(text, "warn") == 0 || strcasecmp(text, "warning") == 0) {
    out = Level::WARN;
  } else if (strcasecmp(text, "error") == 0) {
    out = Level::ERROR;
  } else if (strcasecmp(text, "off") == 0) {
    out = Level::OFF;
  } else {
    return false;
  }
  return true;
}

void setSink(const Sink& sink) { g_sink = sink; }

void resetSink() { g_sink = Sink(); }

void installEtlErrorHook() {
  etl::error_handler::set_callback<&on_etl_error>();
}

bool enabled(Level level) {
  return level != Level::OFF && static_cast<uint8_t>(level) >= static_cast<uint8_t>(g_level);
}

void write(Level level, const char* tag, const char* fmt, ...) {
  if (!enabled(level)) {
    return;
  }

  char line[kLineMax];
  int offset = snprintf(line, sizeof(line), "[%s] ", tag);
  if (offset < 0) {
    return;
  }
  if (static_cast<size_t>(offset) >= sizeof(line)) {
    offset = static_cast<int>(sizeof(line) - 1);
  }

  va_list args;
  va_start(args, fmt);
  const int body = vsnprintf(line + offset, sizeof(line) - static_cast<size_t>(offset), fmt, args);
  va_end(args);

  size_t length = static_cast<size_t>(offset);
  if (body > 0) {
    length += static_cast<size_t>(body);
    if (length > sizeof(line) - 2) {
      length = sizeof(line) - 2;
    }
  }

  if (g_sink.is_valid()) {
    g_sink(level, etl::string_view(line, length));
    return;
  }

  line[length++] = '\n';
  write_all(line, length);
}

}  // namespace log
}  // namespace meshlink
