#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include <util/expected.h>

#include <rex/error.h>

namespace rex {

// a cancellation flag shared between the caller and the tasks of a batch.
// copies refer to the same flag.
class cancel_token {
  public:
    cancel_token() : flag_(std::make_shared<std::atomic<bool>>(false)) {
    }

    void cancel() const {
        flag_->store(true);
    }

    bool cancelled() const {
        return flag_->load();
    }

    // sleep for duration, waking early if the token is cancelled.
    // returns false if the token was cancelled.
    bool sleep_for(std::chrono::milliseconds duration) const {
        using namespace std::chrono_literals;
        const auto deadline = std::chrono::steady_clock::now() + duration;
        while (!cancelled()) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return true;
            }
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                              20ms));
        }
        return false;
    }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// called with (completed, total) after each task finishes
using progress_fn = std::function<void(std::size_t, std::size_t)>;

// returns the group of task i: an unauthorized failure stops the tasks of
// the same group that have not started yet
using group_fn = std::function<std::string(std::size_t)>;

// Run task(i) for every i in [0, n) on at most concurrency threads, and
// return the outcomes in input order.
//
// Every task contributes exactly one outcome:
// - tasks that have not started when the token is cancelled fail with
//   error_kind::cancelled;
// - tasks in a group that has seen an unauthorized failure fail with
//   error_kind::unauthorized without being run;
// - an exception thrown by a task is converted to an error.
template <typename T, typename F>
std::vector<util::expected<T, error>>
parallel_map(std::size_t n, unsigned concurrency, F&& task,
             const cancel_token& cancel, const group_fn& group = {},
             const progress_fn& progress = {}) {
    std::vector<std::optional<util::expected<T, error>>> slots(n);
    std::atomic<std::size_t> next{0};
    std::mutex mtx;
    std::set<std::string> blocked;
    std::size_t completed = 0;

    auto run_one = [&](std::size_t i) -> util::expected<T, error> {
        if (cancel.cancelled()) {
            return util::unexpected(
                error{error_kind::cancelled, "the request was cancelled"});
        }
        std::optional<std::string> g;
        if (group) {
            g = group(i);
            std::lock_guard<std::mutex> _(mtx);
            if (blocked.contains(*g)) {
                return util::unexpected(make_error(
                    error_kind::unauthorized,
                    "skipped after an earlier request for {} was unauthorized",
                    *g));
            }
        }
        util::expected<T, error> result = util::unexpected(
            error{error_kind::protocol, "the task produced no result"});
        try {
            result = task(i);
        } catch (std::exception& e) {
            spdlog::error("parallel_map: task {} threw an exception: {}", i,
                          e.what());
            result = util::unexpected(
                make_error(error_kind::protocol, "internal error: {}", e.what()));
        }
        if (!result && result.error().kind == error_kind::unauthorized && g) {
            std::lock_guard<std::mutex> _(mtx);
            blocked.insert(*g);
        }
        return result;
    };

    auto worker = [&]() {
        for (std::size_t i = next++; i < n; i = next++) {
            slots[i] = run_one(i);
            if (progress) {
                std::lock_guard<std::mutex> _(mtx);
                progress(++completed, n);
            }
        }
    };

    const auto nthreads =
        std::min<std::size_t>(std::max(concurrency, 1u), n);
    spdlog::debug("parallel_map: {} tasks on {} threads", n, nthreads);
    {
        std::vector<std::jthread> threads;
        threads.reserve(nthreads);
        for (std::size_t t = 0; t < nthreads; ++t) {
            threads.emplace_back(worker);
        }
        // the jthreads join when they go out of scope
    }

    std::vector<util::expected<T, error>> results;
    results.reserve(n);
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    return results;
}

} // namespace rex
