#include <string.h>

#include <etl/string.h>

#include "link_error.h"
#include "util/log.h"
#include "test_support.h"

using namespace meshlink;

namespace {

unsigned g_calls = 0;
log::Level g_last_level = log::Level::OFF;
etl::string<600> g_last_line;

void capture(log::Level level, etl::string_view line) {
  ++g_calls;
  g_last_level = level;
  g_last_line.assign(line.data(), line.size());
}

void reset_capture() {
  g_calls = 0;
  g_last_line.clear();
  log::setSink(log::Sink::create<&capture>());
}

}  // namespace

static void test_lines_are_tagged() {
  reset_capture();
  log::setLevel(log::Level::INFO);
  MESHLINK_LOG_INFO("Serial", "Port %s opened", "/dev/ttyUSB0");
  TEST_ASSERT_EQ_UINT(g_calls, 1);
  TEST_ASSERT(g_last_level == log::Level::INFO);
  TEST_ASSERT_EQ_STR(g_last_line.c_str(), "[Serial] Port /dev/ttyUSB0 opened");
}

static void test_level_filtering() {
  reset_capture();
  log::setLevel(log::Level::WARN);
  MESHLINK_LOG_DEBUG("Bridge", "hidden %d", 1);
  MESHLINK_LOG_INFO("Bridge", "hidden %d", 2);
  TEST_ASSERT_EQ_UINT(g_calls, 0);
  MESHLINK_LOG_ERROR("Bridge", "shown");
  TEST_ASSERT_EQ_UINT(g_calls, 1);

  log::setLevel(log::Level::OFF);
  MESHLINK_LOG_ERROR("Bridge", "silenced");
  TEST_ASSERT_EQ_UINT(g_calls, 1);
  log::setLevel(log::Level::INFO);
}

static void test_long_lines_truncated() {
  reset_capture();
  char big[1024];
  memset(big, 'x', sizeof(big) - 1);
  big[sizeof(big) - 1] = '\0';
  MESHLINK_LOG_WARN("Cache", "%s", big);
  TEST_ASSERT_EQ_UINT(g_calls, 1);
  TEST_ASSERT(g_last_line.size() < 512);
  TEST_ASSERT(g_last_line.size() > 400);
}

static void test_parse_level() {
  log::Level level = log::Level::INFO;
  TEST_ASSERT(log::parseLevel("DEBUG", level));
  TEST_ASSERT(level == log::Level::DEBUG);
  TEST_ASSERT(log::parseLevel("warning", level));
  TEST_ASSERT(level == log::Level::WARN);
  TEST_ASSERT(!log::parseLevel("loud", level));
  TEST_ASSERT(level == log::Level::WARN);
  TEST_ASSERT(!log::parseLevel(nullptr, level));
}

static void test_error_formatting() {
  Error error = Error::format(ErrorCode::PROTOCOL_TIMEOUT, "Command timeout: %s", "get_status");
  TEST_ASSERT(error.code == ErrorCode::PROTOCOL_TIMEOUT);
  TEST_ASSERT_EQ_STR(error.message.c_str(), "Command timeout: get_status");
  TEST_ASSERT_EQ_STR(error_code_name(ErrorCode::CONFIGURATION), "ConfigurationError");

  char big[400];
  memset(big, 'e', sizeof(big) - 1);
  big[sizeof(big) - 1] = '\0';
  Error truncated = Error::format(ErrorCode::TRANSPORT, "%s", big);
  TEST_ASSERT_EQ_UINT(truncated.message.size(), kErrorMessageMax - 1);

  Result<int> failed = make_error(ErrorCode::BUSY, "busy");
  TEST_ASSERT(!failed.has_value());
  TEST_ASSERT(failed.error().code == ErrorCode::BUSY);
}

int main() {
  RUN_TEST(test_lines_are_tagged);
  RUN_TEST(test_level_filtering);
  RUN_TEST(test_long_lines_truncated);
  RUN_TEST(test_parse_level);
  RUN_TEST(test_error_formatting);
  log::resetSink();
  return 0;
}
