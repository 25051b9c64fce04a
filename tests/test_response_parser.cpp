#include "protocol/ResponseParser.h"
#include "state/mesh_types.h"
#include "test_support.h"

using namespace meshlink;

static void test_banner_detection() {
  RepeaterTextParser parser;
  TEST_ASSERT(parser.isRepeaterBanner("MeshCore Repeater v1.2"));
  TEST_ASSERT(parser.isRepeaterBanner("ver\nMeshCore v1.7.1 (Build: 2024)"));
  TEST_ASSERT(!parser.isRepeaterBanner("\x01\x02 binary junk"));
  TEST_ASSERT(!parser.isRepeaterBanner(""));
}

static void test_error_detection() {
  RepeaterTextParser parser;
  TEST_ASSERT(parser.isErrorReply("Error: unknown command"));
  TEST_ASSERT(!parser.isErrorReply("OK"));
}

static void test_name_from_label() {
  RepeaterTextParser parser;
  NodeName name;
  parser.parseName("name: Hilltop Relay\nOK", name);
  TEST_ASSERT_EQ_STR(name.c_str(), "Hilltop Relay");
}

static void test_name_from_prompt() {
  RepeaterTextParser parser;
  NodeName name;
  parser.parseName("> Valley Node", name);
  TEST_ASSERT_EQ_STR(name.c_str(), "Valley Node");
}

static void test_name_fallback() {
  RepeaterTextParser parser;
  NodeName name("stale");
  parser.parseName("OK", name);
  TEST_ASSERT_EQ_STR(name.c_str(), "Unknown Repeater");
}

static void test_radio_tuple() {
  RepeaterTextParser parser;
  RadioParams radio;
  TEST_ASSERT(parser.parseRadio("> 869.525,250.0,11,5", radio));
  TEST_ASSERT(radio.freq_mhz.has_value());
  TEST_ASSERT(*radio.freq_mhz > 869.52 && *radio.freq_mhz < 869.53);
  TEST_ASSERT(*radio.bw_khz > 249.9 && *radio.bw_khz < 250.1);
  TEST_ASSERT_EQ_UINT(*radio.sf, 11);
  TEST_ASSERT_EQ_UINT(*radio.cr, 5);

  RadioParams spaced;
  TEST_ASSERT(parser.parseRadio("915, 125, 9, 8", spaced));
  TEST_ASSERT_EQ_UINT(*spaced.sf, 9);
}

static void test_radio_unrecognised() {
  RepeaterTextParser parser;
  RadioParams radio;
  TEST_ASSERT(!parser.parseRadio("> radio unavailable", radio));
  TEST_ASSERT(!radio.freq_mhz.has_value());
  TEST_ASSERT(!radio.sf.has_value());
}

static void test_push_line() {
  RepeaterTextParser parser;
  PublicKeyHex from;
  MessageText text;
  TEST_ASSERT(parser.parsePush("MSG:a1b2c3:hello: mesh", from, text));
  TEST_ASSERT_EQ_STR(from.c_str(), "a1b2c3");
  TEST_ASSERT_EQ_STR(text.c_str(), "hello: mesh");

  TEST_ASSERT(parser.parsePush("msg:A1B2:hi", from, text));
  TEST_ASSERT_EQ_STR(from.c_str(), "A1B2");
}

static void test_push_rejects_other_lines() {
  RepeaterTextParser parser;
  PublicKeyHex from;
  MessageText text;
  TEST_ASSERT(!parser.parsePush("MSG:", from, text));
  TEST_ASSERT(!parser.parsePush("MSG:zz:text", from, text));
  TEST_ASSERT(!parser.parsePush("MSG:abcd:", from, text));
  TEST_ASSERT(!parser.parsePush("name: MSG:ab:x", from, text));
}

int main() {
  RUN_TEST(test_banner_detection);
  RUN_TEST(test_error_detection);
  RUN_TEST(test_name_from_label);
  RUN_TEST(test_name_from_prompt);
  RUN_TEST(test_name_fallback);
  RUN_TEST(test_radio_tuple);
  RUN_TEST(test_radio_unrecognised);
  RUN_TEST(test_push_line);
  RUN_TEST(test_push_rejects_other_lines);
  return 0;
}
