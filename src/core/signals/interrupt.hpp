#pragma once

#include <csignal>

namespace binpost::core::signals {

// True once SIGINT or SIGTERM arrived while a ScopedInterruptHandler was
// installed. The flag stays set until ResetInterruptFlag().
bool InterruptRequested();

// Signal number that set the flag, or 0.
int LastInterruptSignal();

void ResetInterruptFlag();

// Installs flag-setting handlers for SIGINT and SIGTERM for the lifetime of
// the object and restores the previous dispositions on destruction. The
// handler only records the signal; the pipeline polls the flag between stages.
class ScopedInterruptHandler {
public:
  ScopedInterruptHandler();
  ~ScopedInterruptHandler();

  ScopedInterruptHandler(const ScopedInterruptHandler&) = delete;
  ScopedInterruptHandler& operator=(const ScopedInterruptHandler&) = delete;

  bool Installed() const {
    return installed_;
  }

private:
  bool installed_ = false;
#if !defined(_WIN32)
  struct sigaction previous_int_ {};
  struct sigaction previous_term_ {};
#endif
};

} // namespace binpost::core::signals
