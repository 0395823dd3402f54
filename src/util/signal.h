#pragma once

#include <csignal>
#include <optional>

namespace util {

// Catches SIGINT and SIGTERM while in scope, and restores the previous
// handlers when destroyed.
// The handlers are one shot: a second signal terminates the process.
class signal_catcher {
  public:
    signal_catcher();
    ~signal_catcher();

    signal_catcher(const signal_catcher&) = delete;
    signal_catcher& operator=(const signal_catcher&) = delete;

    // the signal caught since the last call, if any
    std::optional<int> caught();

  private:
    struct sigaction previous_int_ {};
    struct sigaction previous_term_ {};
};

} // namespace util
