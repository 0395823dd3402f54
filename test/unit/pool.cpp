#include <atomic>
#include <chrono>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_all.hpp>
#include <fmt/core.h>

#include <rex/error.h>
#include <rex/pool.h>

using namespace std::chrono_literals;
using rex::error_kind;

TEST_CASE("results are in input order", "[pool]") {
    const std::size_t n = 50;
    rex::cancel_token cancel;

    // random latency, so that tasks complete out of order
    std::vector<std::chrono::milliseconds> delays;
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> dist(0, 10);
    for (std::size_t i = 0; i < n; ++i) {
        delays.push_back(std::chrono::milliseconds(dist(gen)));
    }

    std::atomic<unsigned> running{0};
    std::atomic<unsigned> peak{0};
    auto task = [&](std::size_t i) -> util::expected<std::string, rex::error> {
        auto now = ++running;
        unsigned p = peak.load();
        while (now > p && !peak.compare_exchange_weak(p, now)) {
        }
        std::this_thread::sleep_for(delays[i]);
        --running;
        return fmt::format("item-{}", i);
    };

    auto results = rex::parallel_map<std::string>(n, 8, task, cancel);
    REQUIRE(results.size() == n);
    for (std::size_t i = 0; i < n; ++i) {
        REQUIRE(results[i]);
        REQUIRE(*results[i] == fmt::format("item-{}", i));
    }
    // no more than concurrency tasks run at once
    REQUIRE(peak.load() <= 8u);
}

TEST_CASE("empty input", "[pool]") {
    rex::cancel_token cancel;
    unsigned calls = 0;
    auto results = rex::parallel_map<int>(
        0, 4,
        [&](std::size_t) -> util::expected<int, rex::error> {
            ++calls;
            return 0;
        },
        cancel);
    REQUIRE(results.empty());
    REQUIRE(calls == 0u);
}

TEST_CASE("partial failure", "[pool]") {
    rex::cancel_token cancel;
    auto task = [](std::size_t i) -> util::expected<int, rex::error> {
        if (i == 3) {
            return util::unexpected(rex::make_error(
                error_kind::not_found, "task {} not found", i));
        }
        return int(i * 10);
    };

    for (unsigned concurrency : {1u, 2u, 8u}) {
        auto results = rex::parallel_map<int>(5, concurrency, task, cancel);
        REQUIRE(results.size() == 5u);
        for (std::size_t i = 0; i < 5; ++i) {
            if (i == 3) {
                REQUIRE(!results[i]);
                REQUIRE(results[i].error().kind == error_kind::not_found);
            } else {
                REQUIRE(results[i]);
                REQUIRE(*results[i] == int(i * 10));
            }
        }
    }
}

TEST_CASE("cancellation", "[pool]") {
    rex::cancel_token cancel;
    std::atomic<unsigned> calls{0};
    const std::size_t n = 20;

    // the token is cancelled by the third task: tasks that have not started
    // are reported as cancelled
    auto task = [&](std::size_t i) -> util::expected<std::size_t, rex::error> {
        ++calls;
        if (i == 2) {
            cancel.cancel();
        }
        return i;
    };

    auto results = rex::parallel_map<std::size_t>(n, 1, task, cancel);
    REQUIRE(results.size() == n);
    REQUIRE(calls.load() == 3u);
    for (std::size_t i = 0; i < n; ++i) {
        if (i < 3) {
            REQUIRE(results[i]);
            REQUIRE(*results[i] == i);
        } else {
            REQUIRE(!results[i]);
            REQUIRE(results[i].error().kind == error_kind::cancelled);
        }
    }
}

TEST_CASE("cancelled before start", "[pool]") {
    rex::cancel_token cancel;
    auto copy = cancel;
    copy.cancel();
    REQUIRE(cancel.cancelled());

    std::atomic<unsigned> calls{0};
    auto results = rex::parallel_map<int>(
        10, 4,
        [&](std::size_t) -> util::expected<int, rex::error> {
            ++calls;
            return 1;
        },
        cancel);
    REQUIRE(calls.load() == 0u);
    for (auto& r : results) {
        REQUIRE(!r);
        REQUIRE(r.error().kind == error_kind::cancelled);
    }
}

TEST_CASE("unauthorized failures stop the group", "[pool]") {
    rex::cancel_token cancel;
    std::atomic<unsigned> calls{0};

    // tasks 0-4 are in group "a", 5-9 in group "b"
    auto group = [](std::size_t i) { return i < 5 ? "a" : "b"; };
    auto task = [&](std::size_t i) -> util::expected<std::size_t, rex::error> {
        ++calls;
        if (i == 1) {
            return util::unexpected(
                rex::error{error_kind::unauthorized, "denied"});
        }
        return i;
    };

    auto results = rex::parallel_map<std::size_t>(10, 1, task, cancel, group);
    REQUIRE(results.size() == 10u);
    // tasks 2, 3 and 4 are not run
    REQUIRE(calls.load() == 7u);
    REQUIRE(results[0]);
    for (std::size_t i = 1; i < 5; ++i) {
        REQUIRE(!results[i]);
        REQUIRE(results[i].error().kind == error_kind::unauthorized);
    }
    for (std::size_t i = 5; i < 10; ++i) {
        REQUIRE(results[i]);
    }
}

TEST_CASE("exceptions become errors", "[pool]") {
    rex::cancel_token cancel;
    auto task = [](std::size_t i) -> util::expected<int, rex::error> {
        if (i == 1) {
            throw std::runtime_error("wombat");
        }
        return 1;
    };
    auto results = rex::parallel_map<int>(3, 2, task, cancel);
    REQUIRE(results[0]);
    REQUIRE(!results[1]);
    REQUIRE(results[1].error().kind == error_kind::protocol);
    REQUIRE(results[1].error().message.find("wombat") != std::string::npos);
    REQUIRE(results[2]);
}

TEST_CASE("progress", "[pool]") {
    rex::cancel_token cancel;
    std::vector<std::size_t> reports;
    std::size_t total = 0;
    auto progress = [&](std::size_t done, std::size_t n) {
        reports.push_back(done);
        total = n;
    };
    auto results = rex::parallel_map<int>(
        12, 4,
        [](std::size_t) -> util::expected<int, rex::error> { return 1; },
        cancel, {}, progress);
    REQUIRE(results.size() == 12u);
    REQUIRE(total == 12u);
    REQUIRE(reports.size() == 12u);
    // progress is reported under a lock, so the counts are increasing
    for (std::size_t i = 0; i < reports.size(); ++i) {
        REQUIRE(reports[i] == i + 1);
    }
}

TEST_CASE("cancel_token sleep", "[pool]") {
    rex::cancel_token cancel;
    REQUIRE(cancel.sleep_for(1ms));

    std::jthread canceller([cancel]() {
        std::this_thread::sleep_for(20ms);
        cancel.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    REQUIRE(!cancel.sleep_for(10s));
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
}
