// vim: ts=4 sts=4 sw=4 et
#include <unistd.h>

#include <cstdio>
#include <iostream>
#include <string>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <rex/cache.h>
#include <rex/fetcher.h>
#include <rex/print.h>
#include <util/expected.h>
#include <util/strings.h>

#include "cache.h"
#include "help.h"
#include "terminal.h"
#include "util.h"

namespace rex {

std::string cache_footer();

void cache_args::add_cli(CLI::App& cli,
                         [[maybe_unused]] global_settings& settings) {
    auto* cache_cli =
        cli.add_subcommand("cache", "manage the local metadata cache");

    // add the `rex cache stats` command
    auto* stats_cli = cache_cli->add_subcommand(
        "stats", "print the number and size of the cached entries");
    stats_cli->add_flag("--json", stats_args.json, "output in json format");
    stats_cli->callback(
        [&settings]() { settings.mode = rex::cli_mode::cache_stats; });

    // add the `rex cache prune` command
    auto* prune_cli = cache_cli->add_subcommand(
        "prune", "remove expired and unreadable entries");
    prune_cli->callback(
        [&settings]() { settings.mode = rex::cli_mode::cache_prune; });

    // add the `rex cache clear` command
    auto* clear_cli =
        cache_cli->add_subcommand("clear", "remove every cached entry");
    clear_cli->add_flag("-y,--yes", clear_args.yes,
                        "do not ask for confirmation");
    clear_cli->callback(
        [&settings]() { settings.mode = rex::cli_mode::cache_clear; });

    // add the `rex cache sync` command
    auto* sync_cli = cache_cli->add_subcommand(
        "sync", "fetch the catalog and every tag list into the cache");
    sync_cli->add_flag("--manifests", sync_args.manifests,
                       "also fetch the manifest and configuration of every tag");
    sync_cli->add_flag("--json", sync_args.json, "output in json format");
    sync_cli->callback(
        [&settings]() { settings.mode = rex::cli_mode::cache_sync; });

    cache_cli->require_subcommand(1);
    cache_cli->footer(cache_footer);
}

namespace {
util::expected<cache_store, error> open_cache(const global_settings& settings) {
    spdlog::info("using cache {}", settings.config.cache);
    return cache_store::open(settings.config.cache,
                             settings.config.staleness);
}
} // namespace

int cache_statistics(const cache_stats_args& args,
                     const global_settings& settings) {
    auto cache = open_cache(settings);
    if (!cache) {
        term::error("unable to open the cache: {}", cache.error());
        return 1;
    }
    auto stats = cache->stats();
    if (!stats) {
        term::error("unable to read the cache: {}", stats.error());
        return 1;
    }

    if (args.json) {
        nlohmann::json j = {
            {"path", settings.config.cache.string()},
            {"content", stats->content_entries},
            {"listing", stats->listing_entries},
            {"bytes", stats->bytes},
        };
        term::msg("{}", j.dump());
        return 0;
    }
    term::msg("{:<18}{}", "path", settings.config.cache);
    term::raw(format_cache_stats(*stats));
    return 0;
}

int cache_prune(const global_settings& settings) {
    auto cache = open_cache(settings);
    if (!cache) {
        term::error("unable to open the cache: {}", cache.error());
        return 1;
    }
    auto removed = cache->prune();
    if (!removed) {
        term::error("unable to prune the cache: {}", removed.error());
        return 1;
    }
    term::msg("removed {} entries", *removed);
    return 0;
}

int cache_clear(const cache_clear_args& args, const global_settings& settings) {
    auto cache = open_cache(settings);
    if (!cache) {
        term::error("unable to open the cache: {}", cache.error());
        return 1;
    }

    if (!args.yes && isatty(fileno(stdin))) {
        fmt::print("remove every entry in {}? [y/N] ", settings.config.cache);
        std::fflush(stdout);
        std::string answer;
        std::getline(std::cin, answer);
        if (util::to_lower(util::strip(answer)) != "y") {
            term::msg("the cache was not cleared");
            return 0;
        }
    }

    if (auto r = cache->clear(); !r) {
        term::error("unable to clear the cache: {}", r.error());
        return 1;
    }
    term::msg("cleared {}", settings.config.cache);
    return 0;
}

int cache_sync(const cache_sync_args& args, const global_settings& settings) {
    auto fetcher = make_fetcher(settings);
    if (!fetcher) {
        return 1;
    }
    cancel_token cancel;
    signal_watcher watcher(cancel);

    progress_display tag_progress("fetching tag lists", "repo/s", !args.json);
    progress_display manifest_progress("fetching manifests", "tag/s",
                                       !args.json);
    auto stats = fetcher->sync({.manifests = args.manifests,
                                .tag_progress = tag_progress.callback(),
                                .manifest_progress =
                                    manifest_progress.callback()},
                               cancel);
    tag_progress.done();
    manifest_progress.done();
    if (!stats) {
        term::error("unable to sync the cache: {}", stats.error());
        return 1;
    }

    if (args.json) {
        auto cache = open_cache(settings);
        if (!cache) {
            term::error("unable to open the cache: {}", cache.error());
            return 1;
        }
        auto entries = cache->stats();
        if (!entries) {
            term::error("unable to read the cache: {}", entries.error());
            return 1;
        }
        term::msg("{}", format_sync_stats_json(*stats, *entries));
        return stats->cancelled ? 130 : (stats->failures.empty() ? 0 : 1);
    }

    term::raw(format_sync_stats(*stats));
    return report_failures(stats->failures, stats->cancelled);
}

std::string cache_footer() {
    using enum help::block::admonition;
    using help::lst;
    std::vector<help::item> items{
        // clang-format off
        help::block{none, "Manage the cache of registry metadata." },
        help::linebreak{},
        help::block{none, "Manifests and configurations are cached by digest and never expire. Catalogs and tag lists expire after the staleness threshold."},
        help::linebreak{},
        help::block{xmpl, "remove expired entries"},
        help::block{code,   "rex cache prune"},
        help::linebreak{},
        help::block{xmpl, "fill the cache with every tag list and manifest before working offline"},
        help::block{code,   "rex cache sync --manifests"},
        help::linebreak{},
        help::block{note, fmt::format("the cache location is set with {} or the {} configuration parameter.", lst("--cache"), lst("cache"))},
        // clang-format on
    };

    return fmt::format("{}", fmt::join(items, "\n"));
}

} // namespace rex
