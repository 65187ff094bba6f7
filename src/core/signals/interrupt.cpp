#include "core/signals/interrupt.hpp"

namespace binpost::core::signals {

namespace {

volatile std::sig_atomic_t g_interrupt_signal = 0;

void RecordInterrupt(int signum) {
  g_interrupt_signal = signum;
}

} // namespace

bool InterruptRequested() {
  return g_interrupt_signal != 0;
}

int LastInterruptSignal() {
  return static_cast<int>(g_interrupt_signal);
}

void ResetInterruptFlag() {
  g_interrupt_signal = 0;
}

#if defined(_WIN32)

ScopedInterruptHandler::ScopedInterruptHandler() {
  const bool int_ok = std::signal(SIGINT, RecordInterrupt) != SIG_ERR;
  const bool term_ok = std::signal(SIGTERM, RecordInterrupt) != SIG_ERR;
  installed_ = int_ok && term_ok;
}

ScopedInterruptHandler::~ScopedInterruptHandler() {
  (void)std::signal(SIGINT, SIG_DFL);
  (void)std::signal(SIGTERM, SIG_DFL);
}

#else

ScopedInterruptHandler::ScopedInterruptHandler() {
  struct sigaction sa {};
  sa.sa_handler = RecordInterrupt;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  const bool int_ok = sigaction(SIGINT, &sa, &previous_int_) == 0;
  const bool term_ok = sigaction(SIGTERM, &sa, &previous_term_) == 0;
  installed_ = int_ok && term_ok;
}

ScopedInterruptHandler::~ScopedInterruptHandler() {
  (void)sigaction(SIGINT, &previous_int_, nullptr);
  (void)sigaction(SIGTERM, &previous_term_, nullptr);
}

#endif

} // namespace binpost::core::signals
