#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <stop_token>
#include <thread>

#include <barkeep/barkeep.h>
#include <spdlog/spdlog.h>

#include <rex/fetcher.h>
#include <rex/pool.h>
#include <rex/print.h>
#include <rex/settings.h>
#include <util/color.h>
#include <util/signal.h>

#include "terminal.h"
#include "util.h"

namespace rex {

std::unique_ptr<metadata_fetcher> make_fetcher(const global_settings& settings) {
    if (!settings.config.registry) {
        term::error("no registry: use the --registry flag or set registry in "
                    "the configuration file");
        return nullptr;
    }
    return std::make_unique<metadata_fetcher>(
        make_fetch_settings(settings.config, settings.credentials));
}

signal_watcher::signal_watcher(cancel_token token)
    : catcher_(std::make_unique<util::signal_catcher>()) {
    using namespace std::chrono_literals;
    thread_ = std::jthread([token, catcher = catcher_.get()](
                               std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (auto s = catcher->caught()) {
                spdlog::info("signal {} raised: cancelling requests", *s);
                token.cancel();
                return;
            }
            std::this_thread::sleep_for(50ms);
        }
    });
}

progress_display::progress_display(std::string message, std::string unit,
                                   bool enabled)
    : message_(std::move(message)), unit_(std::move(unit)), enabled_(enabled) {
}

void progress_display::update(std::size_t done, std::size_t total) {
    if (!enabled_) {
        return;
    }
    namespace bk = barkeep;
    std::call_once(flag_, [&]() {
        bar_ = bk::ProgressBar(
            &completed_,
            {
                .out = &std::cerr,
                .total = total,
                .message = message_,
                .speed = 0.1,
                .speed_unit = unit_,
                .style = color::use_color() ? bk::ProgressBarStyle::Rich
                                            : bk::ProgressBarStyle::Bars,
                .no_tty = !isatty(fileno(stderr)),
            });
    });
    completed_ = done;
}

void progress_display::done() {
    if (bar_) {
        bar_->done();
    }
}

int report_failures(const std::vector<fetch_failure>& failures,
                    bool cancelled) {
    if (cancelled) {
        term::warn("interrupted: the results are incomplete");
    }
    if (failures.empty()) {
        return cancelled ? 130 : 0;
    }
    fmt::print(stderr, "{}", format_failures(failures));
    return 1;
}

} // namespace rex
