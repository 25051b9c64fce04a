#include "events/link_events.h"
#include "fsm/link_fsm.h"
#include "test_support.h"

using namespace meshlink;
using meshlink::fsm::LinkFsm;

namespace {

class CountingObserver : public ILinkObserver {
 public:
  CountingObserver() : connected(0), disconnected(0), messages(0), lines(0), router(nullptr) {}

  void onConnected(const Node& node) override {
    ++connected;
    last_name = node.name;
  }
  void onDisconnected() override {
    ++disconnected;
    if (router != nullptr) {
      router->unsubscribe(*this);
    }
  }
  void onMessage(const Message&) override { ++messages; }
  void onSerialLine(etl::string_view) override { ++lines; }

  unsigned connected;
  unsigned disconnected;
  unsigned messages;
  unsigned lines;
  NodeName last_name;
  EventRouter* router;
};

}  // namespace

static void test_starts_disconnected() {
  LinkFsm fsm;
  fsm.begin();
  TEST_ASSERT(fsm.isDisconnected());
  TEST_ASSERT(!fsm.isConnected());
  TEST_ASSERT_EQ_STR(fsm.stateName(), "Disconnected");
}

static void test_repeater_path() {
  LinkFsm fsm;
  fsm.begin();
  fsm.connectRequested();
  TEST_ASSERT(fsm.isConnecting());
  fsm.transportOpened();
  TEST_ASSERT(fsm.isDetecting());
  fsm.repeaterReady();
  TEST_ASSERT(fsm.isConnected());
  TEST_ASSERT_EQ_STR(fsm.stateName(), "ConnectedRepeater");
  fsm.disconnectRequested();
  TEST_ASSERT(fsm.isDisconnecting());
  fsm.teardownComplete();
  TEST_ASSERT(fsm.isDisconnected());
}

static void test_companion_path() {
  LinkFsm fsm;
  fsm.begin();
  fsm.connectRequested();
  fsm.transportOpened();
  fsm.companionReady();
  TEST_ASSERT_EQ_STR(fsm.stateName(), "ConnectedCompanion");
}

static void test_out_of_order_events_ignored() {
  LinkFsm fsm;
  fsm.begin();
  fsm.repeaterReady();
  fsm.teardownComplete();
  fsm.disconnectRequested();
  TEST_ASSERT(fsm.isDisconnected());

  fsm.connectRequested();
  fsm.companionReady();
  TEST_ASSERT(fsm.isConnecting());

  // Abort during connect.
  fsm.disconnectRequested();
  TEST_ASSERT(fsm.isDisconnecting());
  fsm.connectRequested();
  TEST_ASSERT(fsm.isDisconnecting());
}

static void test_router_fans_out_in_order() {
  EventRouter router;
  CountingObserver first;
  CountingObserver second;
  TEST_ASSERT(router.subscribe(first));
  TEST_ASSERT(router.subscribe(second));
  TEST_ASSERT(router.subscribe(first));
  TEST_ASSERT_EQ_UINT(router.observerCount(), 2);

  Node node;
  node.name = "Base";
  router.receive(events::EvConnected(node));
  Message message;
  router.receive(events::EvMessage(message));
  router.receive(events::EvSerialLine("OK"));

  TEST_ASSERT_EQ_UINT(first.connected, 1);
  TEST_ASSERT_EQ_STR(second.last_name.c_str(), "Base");
  TEST_ASSERT_EQ_UINT(second.messages, 1);
  TEST_ASSERT_EQ_UINT(first.lines, 1);
}

static void test_observer_may_unsubscribe_during_delivery() {
  EventRouter router;
  CountingObserver leaving;
  CountingObserver staying;
  leaving.router = &router;
  router.subscribe(leaving);
  router.subscribe(staying);

  router.receive(events::EvDisconnected());
  TEST_ASSERT_EQ_UINT(leaving.disconnected, 1);
  TEST_ASSERT_EQ_UINT(staying.disconnected, 1);
  TEST_ASSERT_EQ_UINT(router.observerCount(), 1);

  router.receive(events::EvDisconnected());
  TEST_ASSERT_EQ_UINT(leaving.disconnected, 1);
  TEST_ASSERT_EQ_UINT(staying.disconnected, 2);
  TEST_ASSERT(!router.unsubscribe(leaving));
}

static void test_observer_table_bounded() {
  EventRouter router;
  CountingObserver observers[MESHLINK_MAX_OBSERVERS + 1];
  for (size_t i = 0; i < MESHLINK_MAX_OBSERVERS; ++i) {
    TEST_ASSERT(router.subscribe(observers[i]));
  }
  TEST_ASSERT(!router.subscribe(observers[MESHLINK_MAX_OBSERVERS]));
}

int main() {
  RUN_TEST(test_starts_disconnected);
  RUN_TEST(test_repeater_path);
  RUN_TEST(test_companion_path);
  RUN_TEST(test_out_of_order_events_ignored);
  RUN_TEST(test_router_fans_out_in_order);
  RUN_TEST(test_observer_may_unsubscribe_during_delivery);
  RUN_TEST(test_observer_table_bounded);
  return 0;
}
