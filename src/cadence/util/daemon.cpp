#include "cadence/util/daemon.hpp"

#include <csignal>
#include <cstdio>
#include <unistd.h>

namespace cadence {

std::atomic<bool> g_shutdown_requested{false};

namespace {

void on_shutdown_signal(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_one();
}

}  // namespace

auto daemonize() -> bool {
  pid_t pid = fork();
  if (pid < 0)
    return false;
  if (pid > 0)
    _exit(0);

  if (setsid() < 0)
    return false;

  pid = fork();
  if (pid < 0)
    return false;
  if (pid > 0)
    _exit(0);

  // The log file stays open; only the terminal streams are detached.
  return std::freopen("/dev/null", "r", stdin) != nullptr &&
         std::freopen("/dev/null", "w", stdout) != nullptr &&
         std::freopen("/dev/null", "w", stderr) != nullptr;
}

void setup_signal_handlers() {
  std::signal(SIGINT, on_shutdown_signal);
  std::signal(SIGTERM, on_shutdown_signal);
  std::signal(SIGPIPE, SIG_IGN);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

}  // namespace cadence
