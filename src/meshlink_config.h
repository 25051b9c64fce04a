#pragma once

// Compile-time configuration for the meshlink library.
//
// Capacities bound every container the link keeps in memory. Timeouts are the
// defaults copied into LinkOptions; hosts may still override them at runtime.

// --- Capacities ---

#ifndef MESHLINK_MAX_MESSAGE_HISTORY
#define MESHLINK_MAX_MESSAGE_HISTORY 500U
#endif

#ifndef MESHLINK_MAX_CONTACTS
#define MESHLINK_MAX_CONTACTS 350U
#endif

#ifndef MESHLINK_MAX_PENDING_COMMANDS
#define MESHLINK_MAX_PENDING_COMMANDS 16U
#endif

#ifndef MESHLINK_MAX_OBSERVERS
#define MESHLINK_MAX_OBSERVERS 8U
#endif

// Maximum accepted length of a single line from the Repeater CLI.
#ifndef MESHLINK_SERIAL_LINE_MAX
#define MESHLINK_SERIAL_LINE_MAX 512U
#endif

// Accumulated CLI reply (all lines up to the terminal marker).
#ifndef MESHLINK_CLI_REPLY_MAX
#define MESHLINK_CLI_REPLY_MAX 1024U
#endif

// A get_contacts response is the largest bridge frame: a full companion
// contact table (350 entries) serializes to roughly 75 KiB.
#ifndef MESHLINK_BRIDGE_LINE_MAX
#define MESHLINK_BRIDGE_LINE_MAX 262144U
#endif

#ifndef MESHLINK_BRIDGE_REQUEST_MAX
#define MESHLINK_BRIDGE_REQUEST_MAX 1024U
#endif

#ifndef MESHLINK_MAX_MESSAGE_TEXT
#define MESHLINK_MAX_MESSAGE_TEXT 256U
#endif

// Messages and serial lines queued during one I/O pass before delivery.
#ifndef MESHLINK_EVENT_QUEUE_DEPTH
#define MESHLINK_EVENT_QUEUE_DEPTH 32U
#endif

// --- Timeouts (milliseconds) ---

#ifndef MESHLINK_DETECT_TIMEOUT_MS
#define MESHLINK_DETECT_TIMEOUT_MS 2000U
#endif

#ifndef MESHLINK_REPEATER_COMMAND_TIMEOUT_MS
#define MESHLINK_REPEATER_COMMAND_TIMEOUT_MS 5000U
#endif

#ifndef MESHLINK_BRIDGE_READY_TIMEOUT_MS
#define MESHLINK_BRIDGE_READY_TIMEOUT_MS 10000U
#endif

#ifndef MESHLINK_BRIDGE_CONNECT_TIMEOUT_MS
#define MESHLINK_BRIDGE_CONNECT_TIMEOUT_MS 30000U
#endif

#ifndef MESHLINK_BRIDGE_COMMAND_TIMEOUT_MS
#define MESHLINK_BRIDGE_COMMAND_TIMEOUT_MS 10000U
#endif

// Remote status travels over the mesh and needs a longer budget.
#ifndef MESHLINK_STATUS_TIMEOUT_MS
#define MESHLINK_STATUS_TIMEOUT_MS 15000U
#endif

#ifndef MESHLINK_BRIDGE_SHUTDOWN_TIMEOUT_MS
#define MESHLINK_BRIDGE_SHUTDOWN_TIMEOUT_MS 2000U
#endif

#ifndef MESHLINK_BRIDGE_KILL_GRACE_MS
#define MESHLINK_BRIDGE_KILL_GRACE_MS 1000U
#endif

// --- Transport defaults ---

#ifndef MESHLINK_DEFAULT_BAUDRATE
#define MESHLINK_DEFAULT_BAUDRATE 115200U
#endif

#ifndef MESHLINK_DEFAULT_TCP_PORT
#define MESHLINK_DEFAULT_TCP_PORT 4403U
#endif

#ifndef MESHLINK_DEFAULT_BRIDGE_COMMAND
#define MESHLINK_DEFAULT_BRIDGE_COMMAND "python3 scripts/meshcore-bridge.py"
#endif
