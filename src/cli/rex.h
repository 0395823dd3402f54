// vim: ts=4 sts=4 sw=4 et
#pragma once

#include <cstdint>
#include <optional>

#include <CLI/CLI.hpp>

#include <rex/client.h>
#include <rex/settings.h>
#include <util/envvars.h>
#include <util/expected.h>

namespace rex {

enum class cli_mode : std::uint32_t {
    unset,
    image_ls,
    image_tags,
    image_inspect,
    cache_stats,
    cache_prune,
    cache_clear,
    cache_sync,
    registry_check,
    search,
};

struct global_settings {
    global_settings();

    // the environment variables that were set when the application is started.
    const envvars::state calling_environment;

    // the verbosity level: used to set spdlog level
    int verbose = 0;

    // the command mode
    using enum cli_mode;
    cli_mode mode = unset;

    // configuration options: merged from config file, CLI options and defaults
    configuration config;

    // from --username/--password, --token or REX_USERNAME/REX_PASSWORD,
    // REX_TOKEN
    std::optional<rex::credentials> credentials;
};

} // namespace rex

#include <fmt/core.h>

template <> class fmt::formatter<rex::cli_mode> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(rex::cli_mode mode, FmtContext& ctx) const {
        using enum rex::cli_mode;
        switch (mode) {
        case unset:
            return format_to(ctx.out(), "unset");
        case image_ls:
            return format_to(ctx.out(), "image-ls");
        case image_tags:
            return format_to(ctx.out(), "image-tags");
        case image_inspect:
            return format_to(ctx.out(), "image-inspect");
        case cache_stats:
            return format_to(ctx.out(), "cache-stats");
        case cache_prune:
            return format_to(ctx.out(), "cache-prune");
        case cache_clear:
            return format_to(ctx.out(), "cache-clear");
        case cache_sync:
            return format_to(ctx.out(), "cache-sync");
        case registry_check:
            return format_to(ctx.out(), "registry-check");
        case search:
            return format_to(ctx.out(), "search");
        }
        return format_to(ctx.out(), "unknown");
    }
};

template <> class fmt::formatter<rex::global_settings> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(rex::global_settings const& opts,
                          FmtContext& ctx) const {
        return fmt::format_to(
            ctx.out(),
            "global_settings(mode {}, verbose {}, registry {}, cache {}, "
            "concurrency {}, credentials {})",
            opts.mode, opts.verbose, opts.config.registry.value_or("none"),
            opts.config.cache.string(), opts.config.concurrency,
            opts.credentials ? fmt::format("{}", *opts.credentials) : "none");
    }
};
