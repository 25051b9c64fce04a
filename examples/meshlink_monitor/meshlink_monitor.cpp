/*
 * meshlink_monitor - connect to a MeshCore node and print its traffic.
 *
 * Configuration comes from the environment:
 *   MESHCORE_SERIAL_PORT / MESHCORE_BAUD_RATE    serial device
 *   MESHCORE_TCP_HOST / MESHCORE_TCP_PORT        TCP device (via bridge)
 *   MESHCORE_BRIDGE_COMMAND                      bridge command line
 *   MESHLINK_LOG_LEVEL                           debug|info|warn|error|off
 *
 * Any command line arguments are sent as one broadcast message once connected.
 */
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <etl/string.h>

#include "MeshLink.h"
#include "util/log.h"
#include "util/string_utils.h"

using namespace meshlink;

namespace {

volatile sig_atomic_t g_stop = 0;

void on_signal(int) { g_stop = 1; }

class PrintingObserver : public ILinkObserver {
 public:
  void onConnected(const Node& node) override {
    printf("connected: %s (%s) key=%s\n", node.name.c_str(), device_type_name(node.device_type),
           node.public_key.c_str());
  }

  void onDisconnected() override { printf("disconnected\n"); }

  void onMessage(const Message& message) override {
    printf("[%s] %s: %s\n", message.id.c_str(), message.from_public_key.c_str(),
           message.text.c_str());
  }

  void onSerialLine(etl::string_view line) override {
    printf("serial: %.*s\n", static_cast<int>(line.size()), line.data());
  }
};

void print_nodes(const ConnectionCoordinator& link) {
  static NodeList nodes;
  link.getAllNodes(nodes);
  for (size_t i = 0; i < nodes.size(); ++i) {
    printf("  %-32s %-12s %s\n", nodes[i].name.c_str(), device_type_name(nodes[i].device_type),
           nodes[i].public_key.c_str());
  }
}

}  // namespace

int main(int argc, char** argv) {
  const char* level_text = getenv("MESHLINK_LOG_LEVEL");
  log::Level level = log::Level::INFO;
  if (level_text != nullptr && !log::parseLevel(level_text, level)) {
    fprintf(stderr, "meshlink_monitor: unknown log level '%s'\n", level_text);
  }
  log::setLevel(level);
  log::installEtlErrorHook();

  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = on_signal;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);

  static ConnectionCoordinator link(LinkOptions::fromEnvironment());
  PrintingObserver observer;
  link.subscribe(observer);

  if (!link.connect()) {
    fprintf(stderr, "meshlink_monitor: connection failed\n");
    return 1;
  }
  print_nodes(link);

  if (argc > 1) {
    MessageText text;
    for (int i = 1; i < argc; ++i) {
      if (i > 1) {
        text.push_back(' ');
      }
      text.append(argv[i]);
    }
    if (!link.sendMessage(view_of(text))) {
      fprintf(stderr, "meshlink_monitor: send failed\n");
    }
  }

  while (!g_stop) {
    link.process(100);
  }

  link.disconnect();
  link.unsubscribe(observer);
  return 0;
}
