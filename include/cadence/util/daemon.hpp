#pragma once

#include <atomic>

namespace cadence {

extern std::atomic<bool> g_shutdown_requested;

[[nodiscard]] auto daemonize() -> bool;
// SIGINT/SIGTERM request shutdown; SIGPIPE is ignored so a closed socket
// surfaces as an error return instead of killing the process.
void setup_signal_handlers();
void wait_for_shutdown();

}  // namespace cadence
