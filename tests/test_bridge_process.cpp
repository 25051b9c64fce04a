#include <poll.h>
#include <string.h>

#include <ArduinoJson.h>

#include "transport/BridgeProcess.h"
#include "util/Clock.h"
#include "test_support.h"

#ifndef MESHLINK_FAKE_BRIDGE_PATH
#error "MESHLINK_FAKE_BRIDGE_PATH must name the fake_companion_bridge executable"
#endif

using namespace meshlink;

namespace {

BridgeCommandLine fake_bridge(const char* flags) {
  BridgeCommandLine command("\"" MESHLINK_FAKE_BRIDGE_PATH "\" ");
  command.append(flags);
  return command;
}

void pump(BridgeProcess& bridge, uint32_t wait_ms) {
  struct pollfd fds[4];
  const size_t count = bridge.pollFds(fds, 4);
  if (count > 0) {
    ::poll(fds, static_cast<nfds_t>(count), static_cast<int>(wait_ms));
  }
  bridge.process();
}

bool wait_ready(BridgeProcess& bridge, uint32_t timeout_ms) {
  const Clock& clock = SystemClock::instance();
  const uint32_t deadline = clock.millis() + timeout_ms;
  while (!bridge.ready() && bridge.running() && millis_until(deadline, clock.millis()) > 0) {
    pump(bridge, 20);
  }
  return bridge.ready();
}

void wait_settled(BridgeProcess& bridge, BridgeReplySlot& reply) {
  while (reply.pending()) {
    pump(bridge, 20);
  }
}

struct ExitRecorder {
  ExitRecorder() : calls(0), status(-1) {}
  void onExit(int s) {
    ++calls;
    status = s;
  }
  unsigned calls;
  int status;
};

}  // namespace

static void test_not_running_is_transport_error() {
  BridgeProcess bridge(SystemClock::instance(), fake_bridge(""));
  BridgeReplySlot reply;
  Result<void> sent = bridge.sendCommand("ping", JsonObjectConst(), 1000, reply);
  TEST_ASSERT(sent.error().code == ErrorCode::TRANSPORT);
}

static void test_commands_refused_until_ready() {
  BridgeProcess bridge(SystemClock::instance(), fake_bridge("--ready-delay-ms 300"));
  TEST_ASSERT(bridge.start().has_value());

  BridgeReplySlot early;
  Result<void> refused = bridge.sendCommand("ping", JsonObjectConst(), 1000, early);
  TEST_ASSERT(refused.error().code == ErrorCode::NOT_READY);
  TEST_ASSERT(!early.pending());

  TEST_ASSERT(wait_ready(bridge, 5000));
  TEST_ASSERT(bridge.protocolAvailable());
  TEST_ASSERT(bridge.tcpAvailable());

  BridgeReplySlot reply;
  TEST_ASSERT(bridge.sendCommand("ping", JsonObjectConst(), 2000, reply).has_value());
  wait_settled(bridge, reply);
  TEST_ASSERT(reply.ok());
  bridge.stop(1000);
  TEST_ASSERT(!bridge.running());
}

static void test_missing_library_reported() {
  BridgeProcess bridge(SystemClock::instance(), fake_bridge("--no-meshcore"));
  TEST_ASSERT(bridge.start().has_value());
  TEST_ASSERT(wait_ready(bridge, 5000));
  TEST_ASSERT(!bridge.protocolAvailable());
  bridge.stop(1000);
}

static void test_data_and_errors_delivered() {
  BridgeProcess bridge(SystemClock::instance(), fake_bridge("--stderr-noise"));
  TEST_ASSERT(bridge.start().has_value());
  TEST_ASSERT(wait_ready(bridge, 5000));

  BridgeReplySlot info;
  TEST_ASSERT(bridge.sendCommand("get_self_info", JsonObjectConst(), 2000, info).has_value());
  BridgeReplySlot bogus;
  TEST_ASSERT(bridge.sendCommand("bogus", JsonObjectConst(), 2000, bogus).has_value());
  TEST_ASSERT_EQ_UINT(bridge.pendingCount(), 2);

  wait_settled(bridge, info);
  wait_settled(bridge, bogus);
  TEST_ASSERT(info.ok());
  TEST_ASSERT_EQ_STR(info.value().data()["name"].as<const char*>(), "Fake Companion");
  TEST_ASSERT(bogus.error().code == ErrorCode::PROTOCOL);
  TEST_ASSERT_EQ_STR(bogus.error().message.c_str(), "Unknown command: bogus");
  bridge.stop(1000);
}

static void test_exit_rejects_pending_immediately() {
  BridgeProcess bridge(SystemClock::instance(), fake_bridge("--exit-on get_status"));
  ExitRecorder recorder;
  bridge.onExit(BridgeProcess::ExitHandler::create<ExitRecorder, &ExitRecorder::onExit>(recorder));
  TEST_ASSERT(bridge.start().has_value());
  TEST_ASSERT(wait_ready(bridge, 5000));

  const uint32_t started = SystemClock::instance().millis();
  BridgeReplySlot status;
  TEST_ASSERT(bridge.sendCommand("get_status", JsonObjectConst(), 10000, status).has_value());
  wait_settled(bridge, status);
  const uint32_t elapsed = SystemClock::instance().millis() - started;

  TEST_ASSERT(status.error().code == ErrorCode::TRANSPORT);
  TEST_ASSERT(elapsed < 5000);
  TEST_ASSERT_EQ_UINT(recorder.calls, 1);
  TEST_ASSERT(!bridge.ready());
  bridge.stop(1000);
  TEST_ASSERT(!bridge.running());
}

static void test_late_response_discarded() {
  BridgeProcess bridge(SystemClock::instance(),
                       fake_bridge("--slow get_self_info --slow-ms 400"));
  TEST_ASSERT(bridge.start().has_value());
  TEST_ASSERT(wait_ready(bridge, 5000));

  BridgeReplySlot slow;
  TEST_ASSERT(bridge.sendCommand("get_self_info", JsonObjectConst(), 100, slow).has_value());
  const uint32_t slow_id = slow.id();
  wait_settled(bridge, slow);
  TEST_ASSERT(slow.error().code == ErrorCode::PROTOCOL_TIMEOUT);
  TEST_ASSERT(!bridge.hasPending(slow_id));

  // The bridge answers the next command only after the slow one.
  BridgeReplySlot ping;
  TEST_ASSERT(bridge.sendCommand("ping", JsonObjectConst(), 3000, ping).has_value());
  wait_settled(bridge, ping);
  TEST_ASSERT(ping.ok());
  TEST_ASSERT_EQ_UINT(bridge.lateResponses(), 1);
  TEST_ASSERT_EQ_UINT(bridge.timeouts(), 1);
  bridge.stop(1000);
}

static void test_full_contact_table_fits_one_frame() {
  BridgeProcess bridge(SystemClock::instance(), fake_bridge("--contacts 350"));
  TEST_ASSERT(bridge.start().has_value());
  TEST_ASSERT(wait_ready(bridge, 5000));

  BridgeReplySlot contacts;
  TEST_ASSERT(bridge.sendCommand("get_contacts", JsonObjectConst(), 5000, contacts).has_value());
  wait_settled(bridge, contacts);
  TEST_ASSERT(contacts.ok());
  TEST_ASSERT_EQ_UINT(contacts.value().data().as<JsonArrayConst>().size(), 350);
  TEST_ASSERT_EQ_UINT(bridge.lineOverflows(), 0);
  bridge.stop(1000);
}

static void test_oversized_response_fails_fast() {
  BridgeProcess bridge(SystemClock::instance(), fake_bridge("--contacts 1800"));
  TEST_ASSERT(bridge.start().has_value());
  TEST_ASSERT(wait_ready(bridge, 5000));

  const uint32_t started = SystemClock::instance().millis();
  BridgeReplySlot contacts;
  TEST_ASSERT(bridge.sendCommand("get_contacts", JsonObjectConst(), 10000, contacts).has_value());
  wait_settled(bridge, contacts);
  const uint32_t elapsed = SystemClock::instance().millis() - started;

  TEST_ASSERT(contacts.error().code == ErrorCode::PROTOCOL);
  TEST_ASSERT(strstr(contacts.error().message.c_str(), "exceeds") != nullptr);
  TEST_ASSERT(elapsed < 5000);
  TEST_ASSERT_EQ_UINT(bridge.lineOverflows(), 1);
  TEST_ASSERT_EQ_UINT(bridge.timeouts(), 0);

  // The framer resynchronizes on the next newline.
  BridgeReplySlot ping;
  TEST_ASSERT(bridge.sendCommand("ping", JsonObjectConst(), 3000, ping).has_value());
  wait_settled(bridge, ping);
  TEST_ASSERT(ping.ok());
  TEST_ASSERT_EQ_UINT(bridge.lateResponses(), 0);
  bridge.stop(1000);
}

static void test_never_ready_child_is_killed() {
  BridgeProcess bridge(SystemClock::instance(), fake_bridge("--never-ready"));
  TEST_ASSERT(bridge.start().has_value());
  TEST_ASSERT(!wait_ready(bridge, 300));
  TEST_ASSERT(bridge.running());
  bridge.stop(200);
  TEST_ASSERT(!bridge.running());
}

static void test_spawn_failure() {
  BridgeProcess bridge(SystemClock::instance(), BridgeCommandLine("/nonexistent/meshcore-bridge"));
  Result<void> started = bridge.start();
  if (started) {
    // Some libcs report exec failure only through the exit status.
    TEST_ASSERT(!wait_ready(bridge, 2000));
    bridge.stop(200);
  } else {
    TEST_ASSERT(started.error().code == ErrorCode::TRANSPORT);
  }
  TEST_ASSERT(!bridge.running());
}

int main() {
  RUN_TEST(test_not_running_is_transport_error);
  RUN_TEST(test_commands_refused_until_ready);
  RUN_TEST(test_missing_library_reported);
  RUN_TEST(test_data_and_errors_delivered);
  RUN_TEST(test_exit_rejects_pending_immediately);
  RUN_TEST(test_late_response_discarded);
  RUN_TEST(test_full_contact_table_fits_one_frame);
  RUN_TEST(test_oversized_response_fails_fast);
  RUN_TEST(test_never_ready_child_is_killed);
  RUN_TEST(test_spawn_failure);
  return 0;
}
