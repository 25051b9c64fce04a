// Companion bridge emulator for host tests. Speaks the JSON-lines protocol
// on stdio the way the real bridge does, with knobs for failure modes:
//
//   --no-meshcore        ready frame reports the library missing
//   --ready-delay-ms N   wait before announcing ready
//   --never-ready        never send the ready frame
//   --exit-after-ready   exit right after the ready frame
//   --exit-on CMD        exit without answering CMD
//   --silent CMD         never answer CMD
//   --slow CMD           answer CMD after --slow-ms (default 300)
//   --fail-connect       reject the connect command
//   --stderr-noise       chatter on stderr
//   --contacts N         answer get_contacts with N generated entries

#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include <ArduinoJson.h>

namespace {

struct Options {
  bool meshcore;
  unsigned ready_delay_ms;
  bool never_ready;
  bool exit_after_ready;
  const char* exit_on;
  const char* silent;
  const char* slow;
  unsigned slow_ms;
  bool fail_connect;
  bool stderr_noise;
  unsigned contacts;
};

char g_name[33] = "Fake Companion";

void sleep_ms(unsigned ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>((ms % 1000U) * 1000000UL);
  nanosleep(&ts, nullptr);
}

void emit(const JsonDocument& doc) {
  serializeJson(doc, stdout);
  fputc('\n', stdout);
  fflush(stdout);
}

void respond(JsonVariantConst id, const JsonDocument& data) {
  JsonDocument reply;
  reply["id"] = id;
  reply["success"] = true;
  reply["data"] = data;
  emit(reply);
}

void fail(JsonVariantConst id, const char* error) {
  JsonDocument reply;
  reply["id"] = id;
  reply["success"] = false;
  reply["error"] = error;
  emit(reply);
}

bool same(const char* a, const char* b) { return a != nullptr && b != nullptr && strcmp(a, b) == 0; }

bool parse_args(int argc, char** argv, Options& opts) {
  opts.meshcore = true;
  opts.ready_delay_ms = 0;
  opts.never_ready = false;
  opts.exit_after_ready = false;
  opts.exit_on = nullptr;
  opts.silent = nullptr;
  opts.slow = nullptr;
  opts.slow_ms = 300;
  opts.fail_connect = false;
  opts.stderr_noise = false;
  opts.contacts = 0;

  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    const char* next = i + 1 < argc ? argv[i + 1] : nullptr;
    if (same(arg, "--no-meshcore")) {
      opts.meshcore = false;
    } else if (same(arg, "--never-ready")) {
      opts.never_ready = true;
    } else if (same(arg, "--exit-after-ready")) {
      opts.exit_after_ready = true;
    } else if (same(arg, "--fail-connect")) {
      opts.fail_connect = true;
    } else if (same(arg, "--stderr-noise")) {
      opts.stderr_noise = true;
    } else if (next != nullptr && same(arg, "--ready-delay-ms")) {
      opts.ready_delay_ms = static_cast<unsigned>(atoi(next));
      ++i;
    } else if (next != nullptr && same(arg, "--contacts")) {
      opts.contacts = static_cast<unsigned>(atoi(next));
      ++i;
    } else if (next != nullptr && same(arg, "--slow-ms")) {
      opts.slow_ms = static_cast<unsigned>(atoi(next));
      ++i;
    } else if (next != nullptr && same(arg, "--exit-on")) {
      opts.exit_on = next;
      ++i;
    } else if (next != nullptr && same(arg, "--silent")) {
      opts.silent = next;
      ++i;
    } else if (next != nullptr && same(arg, "--slow")) {
      opts.slow = next;
      ++i;
    } else {
      fprintf(stderr, "unknown argument: %s\n", arg);
      return false;
    }
  }
  return true;
}

void fill_self_info(JsonDocument& data) {
  data["public_key"] = "f00dfeedf00dfeedf00dfeedf00dfeedf00dfeedf00dfeedf00dfeedf00dfeed";
  data["name"] = g_name;
  data["adv_type"] = 1;
  data["tx_power"] = 20;
  data["max_tx_power"] = 22;
  data["radio_freq"] = 869.525;
  data["radio_bw"] = 250.0;
  data["radio_sf"] = 11;
  data["radio_cr"] = 5;
  data["latitude"] = 0.0;
  data["longitude"] = 0.0;
}

// Fully populated entries, sized like the real bridge's output.
void fill_generated_contacts(JsonDocument& data, unsigned count) {
  JsonArray list = data.to<JsonArray>();
  for (unsigned i = 0; i < count; ++i) {
    char key[65];
    char name[32];
    snprintf(key, sizeof(key), "%08x%056x", i, 0U);
    snprintf(name, sizeof(name), "Node %04u", i);
    JsonObject entry = list.add<JsonObject>();
    entry["public_key"] = key;
    entry["adv_name"] = name;
    entry["name"] = name;
    entry["rssi"] = -90;
    entry["snr"] = 7.25;
    entry["adv_type"] = 1;
    entry["latitude"] = 47.376887;
    entry["longitude"] = 8.541694;
  }
}

void fill_contacts(JsonDocument& data) {
  JsonArray list = data.to<JsonArray>();
  JsonObject alpha = list.add<JsonObject>();
  alpha["public_key"] = "aa01aa01aa01aa01";
  alpha["adv_name"] = "Alpha";
  alpha["adv_type"] = 1;
  alpha["rssi"] = -71;
  alpha["snr"] = 9.5;
  JsonObject relay = list.add<JsonObject>();
  relay["public_key"] = "bb02bb02bb02bb02";
  relay["adv_name"] = "Hill Relay";
  relay["adv_type"] = 2;
  relay["latitude"] = 47.37;
  relay["longitude"] = 8.54;
}

// Returns false when the emulator should exit.
bool handle(const Options& opts, const JsonDocument& request) {
  JsonVariantConst id = request["id"];
  const char* cmd = request["cmd"] | "";

  if (opts.stderr_noise) {
    fprintf(stderr, "handling %s\n", cmd);
  }
  if (same(cmd, opts.exit_on)) {
    return false;
  }
  if (same(cmd, opts.silent)) {
    return true;
  }
  if (same(cmd, opts.slow)) {
    sleep_ms(opts.slow_ms);
  }

  JsonDocument data;
  data.to<JsonObject>();
  if (same(cmd, "connect")) {
    if (opts.fail_connect) {
      fail(id, "Failed to connect to MeshCore device");
      return true;
    }
    data["connected"] = true;
  } else if (same(cmd, "get_self_info")) {
    fill_self_info(data);
  } else if (same(cmd, "get_contacts")) {
    if (opts.contacts > 0) {
      fill_generated_contacts(data, opts.contacts);
    } else {
      fill_contacts(data);
    }
  } else if (same(cmd, "send_message")) {
    data["sent"] = true;
  } else if (same(cmd, "login")) {
    if (!same(request["password"] | "", "secret")) {
      fail(id, "Login failed");
      return true;
    }
    data["logged_in"] = true;
  } else if (same(cmd, "get_status")) {
    data["bat_mv"] = 4100;
    data["up_secs"] = 86400;
    data["tx_power"] = 20;
  } else if (same(cmd, "set_name")) {
    const char* name = request["name"] | "";
    strncpy(g_name, name, sizeof(g_name) - 1);
    g_name[sizeof(g_name) - 1] = '\0';
  } else if (same(cmd, "set_radio") || same(cmd, "send_advert") || same(cmd, "ping") ||
             same(cmd, "disconnect")) {
    // acknowledged with an empty object
  } else if (same(cmd, "shutdown")) {
    respond(id, data);
    return false;
  } else {
    char error[96];
    snprintf(error, sizeof(error), "Unknown command: %s", cmd);
    fail(id, error);
    return true;
  }
  respond(id, data);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  Options opts;
  if (!parse_args(argc, argv, opts)) {
    return 2;
  }

  if (opts.stderr_noise) {
    fprintf(stderr, "fake bridge starting\n");
  }
  if (opts.never_ready) {
    // Hold the pipes open until the parent gives up.
    char sink[256];
    while (fgets(sink, sizeof(sink), stdin) != nullptr) {
    }
    return 0;
  }
  sleep_ms(opts.ready_delay_ms);

  JsonDocument ready;
  ready["type"] = "ready";
  ready["meshcore_available"] = opts.meshcore;
  ready["tcp_available"] = true;
  emit(ready);
  if (opts.exit_after_ready) {
    return 3;
  }

  static char line[65536];
  while (fgets(line, sizeof(line), stdin) != nullptr) {
    JsonDocument request;
    if (deserializeJson(request, line) != DeserializationError::Ok) {
      fprintf(stderr, "bad request: %s", line);
      continue;
    }
    if (!handle(opts, request)) {
      return 0;
    }
  }
  return 0;
}
