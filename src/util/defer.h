#pragma once

#include <type_traits>
#include <utility>

namespace util {

// Calls a function when it goes out of scope, unless released.
// Used to pair C resource acquisition (curl handles, file descriptors) with
// its cleanup.
template <typename F>
    requires std::is_nothrow_move_constructible_v<F>
class [[nodiscard]] scope_exit {
    F fn_;
    bool active_ = true;

  public:
    explicit scope_exit(F fn) noexcept : fn_(std::move(fn)) {
    }

    scope_exit(scope_exit&& other) noexcept
        : fn_(std::move(other.fn_)), active_(other.active_) {
        other.release();
    }

    scope_exit(const scope_exit&) = delete;
    scope_exit& operator=(const scope_exit&) = delete;

    void release() noexcept {
        active_ = false;
    }

    ~scope_exit() {
        if (active_) {
            fn_();
        }
    }
};

template <typename F> auto defer(F&& f) {
    return scope_exit<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace util
