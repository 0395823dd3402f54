#include <atomic>

#include <stdio.h>
#include <unistd.h>

#include <util/color.h>
#include <util/envvars.h>

namespace color {

namespace impl {
// read from the progress and signal watcher threads
std::atomic<bool> use{true};
} // namespace impl

bool default_color(const envvars::state& calling_env) {
    if (calling_env.get("NO_COLOR")) {
        return false;
    }
    if (auto force = calling_env.get("CLICOLOR_FORCE");
        force && !force->empty() && *force != "0") {
        return true;
    }
    if (calling_env.get("TERM") == "dumb") {
        return false;
    }
    return isatty(fileno(stdout));
}

void set_color(bool v) {
    impl::use = v;
}

bool use_color() {
    return impl::use;
}

} // namespace color
