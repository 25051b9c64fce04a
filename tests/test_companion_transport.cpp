#include <string.h>

#include "config/ConnectionConfig.h"
#include "mocks/ManualClock.h"
#include "mocks/ScriptedCompanionDriver.h"
#include "transport/CompanionTransport.h"
#include "test_support.h"

using namespace meshlink;
using meshlink::test::ManualClock;
using meshlink::test::ScriptedCompanionDriver;

namespace {

LinkOptions fast_options() {
  LinkOptions options;
  options.bridge_ready_timeout_ms = 500;
  options.bridge_connect_timeout_ms = 1000;
  options.bridge_command_timeout_ms = 1000;
  options.status_timeout_ms = 1500;
  options.bridge_shutdown_timeout_ms = 200;
  options.bridge_kill_grace_ms = 0;
  return options;
}

struct Harness {
  Harness() : clock(), driver(clock), companion(driver, clock), options(fast_options()) {
    companion.setPump(CompanionTransport::Pump::create<Harness, &Harness::pump>(*this));
  }

  void pump(uint32_t wait_ms) {
    clock.advance(wait_ms < 10 ? (wait_ms == 0 ? 1 : wait_ms) : 10);
    driver.process();
  }

  bool openTcp() {
    driver.script("connect", "{\"connected\":true}");
    return companion.open(ConnectionConfig::forTcp("192.168.1.50", 5000), options).has_value();
  }

  ManualClock clock;
  ScriptedCompanionDriver driver;
  CompanionTransport companion;
  LinkOptions options;
};

bool params_contain(const ScriptedCompanionDriver::Sent* sent, const char* fragment) {
  return sent != nullptr && strstr(sent->params.c_str(), fragment) != nullptr;
}

}  // namespace

static void test_open_tcp_sends_connect() {
  Harness h;
  TEST_ASSERT(h.openTcp());
  TEST_ASSERT_EQ_UINT(h.driver.starts, 1);
  const ScriptedCompanionDriver::Sent* connect = h.driver.lastSent("connect");
  TEST_ASSERT(params_contain(connect, "\"type\":\"tcp\""));
  TEST_ASSERT(params_contain(connect, "\"host\":\"192.168.1.50\""));
  TEST_ASSERT(params_contain(connect, "\"tcp_port\":5000"));
}

static void test_open_serial_sends_port_and_baud() {
  Harness h;
  h.driver.script("connect", "{}");
  TEST_ASSERT(h.companion.open(ConnectionConfig::forSerial("/dev/ttyACM0", 115200), h.options)
                  .has_value());
  const ScriptedCompanionDriver::Sent* connect = h.driver.lastSent("connect");
  TEST_ASSERT(params_contain(connect, "\"type\":\"serial\""));
  TEST_ASSERT(params_contain(connect, "\"port\":\"/dev/ttyACM0\""));
  TEST_ASSERT(params_contain(connect, "\"baud\":115200"));
}

static void test_ready_timeout() {
  Harness h;
  h.driver.becomes_ready = false;
  Result<void> opened = h.companion.open(ConnectionConfig::forTcp("host", 5000), h.options);
  TEST_ASSERT(!opened.has_value());
  TEST_ASSERT(opened.error().code == ErrorCode::PROTOCOL_TIMEOUT);
  TEST_ASSERT(h.driver.lastSent("connect") == nullptr);
}

static void test_connect_failure_reported() {
  Harness h;
  h.driver.scriptError("connect", "Device not responding");
  Result<void> opened = h.companion.open(ConnectionConfig::forTcp("host", 5000), h.options);
  TEST_ASSERT(!opened.has_value());
  TEST_ASSERT(opened.error().code == ErrorCode::PROTOCOL);
  TEST_ASSERT_EQ_STR(opened.error().message.c_str(), "Device not responding");
}

static void test_self_info_parsed() {
  Harness h;
  TEST_ASSERT(h.openTcp());
  h.driver.script("get_self_info",
                  "{\"public_key\":\"ab12\",\"name\":\"Base\",\"adv_type\":1,\"tx_power\":22,"
                  "\"radio_freq\":869.525,\"radio_bw\":250.0,\"radio_sf\":11,\"radio_cr\":5,"
                  "\"latitude\":0.0,\"longitude\":0.0}");
  Node node;
  TEST_ASSERT(h.companion.getSelfInfo(1000, node).has_value());
  TEST_ASSERT_EQ_STR(node.public_key.c_str(), "ab12");
  TEST_ASSERT_EQ_STR(node.name.c_str(), "Base");
  TEST_ASSERT(node.device_type == DeviceType::COMPANION);
  TEST_ASSERT_EQ_UINT(*node.tx_power, 22);
  TEST_ASSERT_EQ_UINT(*node.radio.sf, 11);
  TEST_ASSERT(!node.position.has_value());
}

static void test_self_info_defaults() {
  Harness h;
  TEST_ASSERT(h.openTcp());
  h.driver.script("get_self_info", "{\"public_key\":\"ab12\"}");
  Node node;
  TEST_ASSERT(h.companion.getSelfInfo(1000, node).has_value());
  TEST_ASSERT_EQ_STR(node.name.c_str(), "Unknown");
  TEST_ASSERT(node.device_type == DeviceType::COMPANION);
  TEST_ASSERT(!node.tx_power.has_value());
}

static void test_contacts_parsed() {
  Harness h;
  TEST_ASSERT(h.openTcp());
  h.driver.script("get_contacts",
                  "[{\"public_key\":\"aa01\",\"adv_name\":\"Alpha\",\"adv_type\":2,\"rssi\":-70,"
                  "\"latitude\":51.5,\"longitude\":-0.12},"
                  "{\"adv_name\":\"No Key\"},"
                  "{\"public_key\":\"bb02\",\"name\":\"Bravo\"}]");
  ContactList contacts;
  TEST_ASSERT(h.companion.getContacts(1000, 777, contacts).has_value());
  TEST_ASSERT_EQ_UINT(contacts.size(), 2);
  TEST_ASSERT_EQ_STR(contacts[0].adv_name.c_str(), "Alpha");
  TEST_ASSERT(contacts[0].adv_type == DeviceType::REPEATER);
  TEST_ASSERT(contacts[0].position.has_value());
  TEST_ASSERT_EQ_UINT(contacts[0].last_seen_ms, 777);
  TEST_ASSERT(contacts[1].adv_type == DeviceType::UNKNOWN);
}

static void test_contacts_require_list() {
  Harness h;
  TEST_ASSERT(h.openTcp());
  h.driver.script("get_contacts", "{\"count\":3}");
  ContactList contacts;
  Result<void> result = h.companion.getContacts(1000, 0, contacts);
  TEST_ASSERT(result.error().code == ErrorCode::PROTOCOL);
}

static void test_send_message_params() {
  Harness h;
  TEST_ASSERT(h.openTcp());
  h.driver.script("send_message", "{\"sent\":true}");

  TEST_ASSERT(h.companion.sendMessage("hello", nullptr, 1000).has_value());
  TEST_ASSERT(params_contain(h.driver.lastSent("send_message"), "\"to\":null"));

  PublicKeyHex to("cafe");
  TEST_ASSERT(h.companion.sendMessage("direct", &to, 1000).has_value());
  TEST_ASSERT(params_contain(h.driver.lastSent("send_message"), "\"to\":\"cafe\""));
  TEST_ASSERT(params_contain(h.driver.lastSent("send_message"), "\"text\":\"direct\""));
}

static void test_silent_status_times_out() {
  Harness h;
  TEST_ASSERT(h.openTcp());
  NodeStatus status;
  const uint32_t before = h.clock.now_ms;
  Result<void> result = h.companion.getStatus("aa01", 1500, status);
  TEST_ASSERT(result.error().code == ErrorCode::PROTOCOL_TIMEOUT);
  TEST_ASSERT_EQ_STR(result.error().message.c_str(), "Command timeout: get_status");
  TEST_ASSERT(h.clock.now_ms - before >= 1500);
  TEST_ASSERT_EQ_UINT(h.driver.pendingCount(), 0);
}

static void test_status_parsed() {
  Harness h;
  TEST_ASSERT(h.openTcp());
  h.driver.script("get_status", "{\"bat_mv\":4012,\"up_secs\":3600}");
  NodeStatus status;
  TEST_ASSERT(h.companion.getStatus("aa01", 1500, status).has_value());
  TEST_ASSERT_EQ_UINT(*status.battery_mv, 4012);
  TEST_ASSERT_EQ_UINT(*status.uptime_secs, 3600);
  TEST_ASSERT(!status.tx_power.has_value());
}

static void test_close_sends_shutdown() {
  Harness h;
  TEST_ASSERT(h.openTcp());
  h.driver.script("shutdown", "{}");
  h.companion.close(h.options);
  TEST_ASSERT(h.driver.lastSent("shutdown") != nullptr);
  TEST_ASSERT_EQ_UINT(h.driver.stops, 1);
  TEST_ASSERT(!h.driver.running());
}

int main() {
  RUN_TEST(test_open_tcp_sends_connect);
  RUN_TEST(test_open_serial_sends_port_and_baud);
  RUN_TEST(test_ready_timeout);
  RUN_TEST(test_connect_failure_reported);
  RUN_TEST(test_self_info_parsed);
  RUN_TEST(test_self_info_defaults);
  RUN_TEST(test_contacts_parsed);
  RUN_TEST(test_contacts_require_list);
  RUN_TEST(test_send_message_params);
  RUN_TEST(test_silent_status_times_out);
  RUN_TEST(test_status_parsed);
  RUN_TEST(test_close_sends_shutdown);
  return 0;
}
