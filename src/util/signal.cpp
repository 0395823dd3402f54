#include <atomic>
#include <csignal>
#include <optional>

#include <util/signal.h>

namespace util {

namespace {
// 0 when no signal has been caught
std::atomic<int> caught_signal{0};

void on_signal(int signal) {
    caught_signal.store(signal);
}
} // namespace

signal_catcher::signal_catcher() {
    caught_signal.store(0);
    struct sigaction h {};
    h.sa_handler = on_signal;
    sigemptyset(&h.sa_mask);
    h.sa_flags = SA_RESETHAND;
    sigaction(SIGINT, &h, &previous_int_);
    sigaction(SIGTERM, &h, &previous_term_);
}

signal_catcher::~signal_catcher() {
    sigaction(SIGINT, &previous_int_, nullptr);
    sigaction(SIGTERM, &previous_term_, nullptr);
}

std::optional<int> signal_catcher::caught() {
    if (const int s = caught_signal.exchange(0); s != 0) {
        return s;
    }
    return std::nullopt;
}

} // namespace util
