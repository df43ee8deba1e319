#include "termination.h"

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <tuple>

namespace {

std::atomic_bool g_requested{ false };

static_assert(std::atomic_bool::is_always_lock_free);

void signal_handler(int sig) {
  if (!g_requested.exchange(true)) {
    constexpr char kMessage[]{ "\nInterrupted; canceling running builds\n" };
    std::ignore = write(STDERR_FILENO, kMessage, sizeof(kMessage) - 1);
    return;
  }
  _exit(128 + sig);
}

}  // namespace

namespace dbuild {

void termination_handler_install() {
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

bool termination_requested() { return g_requested.load(); }

}  // namespace dbuild
