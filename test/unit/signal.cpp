#include <csignal>

#include <catch2/catch_all.hpp>

#include <util/signal.h>

TEST_CASE("signal catcher", "[signal]") {
    {
        util::signal_catcher catcher;
        REQUIRE(!catcher.caught());
        std::raise(SIGINT);
        REQUIRE(catcher.caught() == SIGINT);
        // each signal is reported once
        REQUIRE(!catcher.caught());
    }
    {
        util::signal_catcher catcher;
        std::raise(SIGTERM);
        REQUIRE(catcher.caught() == SIGTERM);
    }
}

TEST_CASE("signal catcher restores handlers", "[signal]") {
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    struct sigaction original {};
    sigaction(SIGTERM, &ignore, &original);

    { util::signal_catcher catcher; }

    struct sigaction restored {};
    sigaction(SIGTERM, nullptr, &restored);
    REQUIRE(restored.sa_handler == SIG_IGN);
    sigaction(SIGTERM, &original, nullptr);
}
