#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <barkeep/barkeep.h>

#include <rex/fetcher.h>
#include <rex/pool.h>
#include <util/signal.h>

#include "rex.h"

namespace rex {

// create a fetcher for the configured registry.
// prints an error and returns nullptr if no registry is configured.
std::unique_ptr<metadata_fetcher> make_fetcher(const global_settings& settings);

// cancel a token when SIGINT or SIGTERM is raised, for as long as the watcher
// is in scope
class signal_watcher {
  public:
    explicit signal_watcher(cancel_token token);

  private:
    // declared before thread_, so that the thread is joined first
    std::unique_ptr<util::signal_catcher> catcher_;
    std::jthread thread_;
};

// a progress bar on stderr for a batch of fetches. the bar is created by the
// first update, when the total is known.
class progress_display {
  public:
    // a disabled display prints nothing
    progress_display(std::string message, std::string unit, bool enabled);

    // called with (completed, total) after each task finishes
    void update(std::size_t done, std::size_t total);

    // a progress_fn that updates this display
    progress_fn callback() {
        return [this](std::size_t done, std::size_t total) {
            update(done, total);
        };
    }

    void done();

  private:
    using bar_type = decltype(barkeep::ProgressBar(
        std::declval<std::atomic<std::size_t>*>()));

    std::string message_;
    std::string unit_;
    bool enabled_;
    std::atomic<std::size_t> completed_{0};
    bar_type bar_;
    std::once_flag flag_;
};

// the exit code of a command that produced failures
int report_failures(const std::vector<fetch_failure>& failures,
                    bool cancelled);

} // namespace rex
