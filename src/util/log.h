/**
 * @file log.h
 * @brief Level-filtered line logger.
 *
 * Lines are written as "[Tag] message\n" straight to fd 2. A replacement sink
 * can be installed (tests capture output this way). installEtlErrorHook()
 * routes etl::error_handler reports (container overflow, bad optional access)
 * into the same stream under the "ETL" tag.
 */
#ifndef MESHLINK_UTIL_LOG_H
#define MESHLINK_UTIL_LOG_H

#include <stdint.h>

#include <etl/delegate.h>
#include <etl/string_view.h>

namespace meshlink {
namespace log {

enum class Level : uint8_t { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, OFF = 4 };

using Sink = etl::delegate<void(Level, etl::string_view)>;

void setLevel(Level level);
Level level();

// Parses "debug", "info", "warn", "error" or "off" (case-insensitive).
bool parseLevel(const char* text, Level& out);

void setSink(const Sink& sink);
void resetSink();

void installEtlErrorHook();

bool enabled(Level level);

void write(Level level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

}  // namespace log
}  // namespace meshlink

#define MESHLINK_LOG_DEBUG(tag, ...)                                   \
  do {                                                                 \
    if (::meshlink::log::enabled(::meshlink::log::Level::DEBUG)) {     \
      ::meshlink::log::write(::meshlink::log::Level::DEBUG, tag, __VA_ARGS__); \
    }                                                                  \
  } while (0)

#define MESHLINK_LOG_INFO(tag, ...) \
  ::meshlink::log::write(::meshlink::log::Level::INFO, tag, __VA_ARGS__)
#define MESHLINK_LOG_WARN(tag, ...) \
  ::meshlink::log::write(::meshlink::log::Level::WARN, tag, __VA_ARGS__)
#define MESHLINK_LOG_ERROR(tag, ...) \
  ::meshlink::log::write(::meshlink::log::Level::ERROR, tag, __VA_ARGS__)

#endif  // MESHLINK_UTIL_LOG_H
