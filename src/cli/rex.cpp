// vim: ts=4 sts=4 sw=4 et
#include <unistd.h>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <rex/client.h>
#include <rex/log.h>
#include <rex/settings.h>
#include <util/color.h>
#include <util/envvars.h>
#include <util/expected.h>

#include "cache.h"
#include "help.h"
#include "image.h"
#include "registry.h"
#include "rex.h"
#include "search.h"
#include "terminal.h"

std::string help_footer();

rex::global_settings::global_settings() : calling_environment(environ) {
}

int main(int argc, char** argv) {
    rex::config_base cli_config;
    rex::global_settings settings;
    bool print_version = false;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> token;

    CLI::App cli(fmt::format("rex {}", REX_VERSION));
    cli.add_flag("-v,--verbose", settings.verbose, "enable verbose output");
    cli.add_flag_callback(
        "--no-color", [&cli_config]() -> void { cli_config.color = false; },
        "disable color output");
    cli.add_flag_callback(
        "--color", [&cli_config]() -> void { cli_config.color = true; },
        "enable color output");
    cli.add_flag("--version", print_version, "print version");
    cli.add_option("--registry", cli_config.registry, "the registry URL");
    cli.add_option("--cache", cli_config.cache, "the cache directory");
    cli.add_option("-j,--concurrency", cli_config.concurrency,
                   "the maximum number of simultaneous registry requests")
        ->check(CLI::PositiveNumber);
    cli.add_option("--username", username, "the registry user name")
        ->envname("REX_USERNAME");
    cli.add_option("--password", password, "the registry password")
        ->envname("REX_PASSWORD");
    cli.add_option("--token", token, "a registry bearer token")
        ->envname("REX_TOKEN");

    cli.footer(help_footer);

    rex::image_args image;
    rex::cache_args cache;
    rex::registry_args registry;
    rex::search_args search;

    image.add_cli(cli, settings);
    search.add_cli(cli, settings);
    registry.add_cli(cli, settings);
    cache.add_cli(cli, settings);

    CLI11_PARSE(cli, argc, argv);

    // By default there is no logging to the console
    //   user-friendly logging of errors and warnings is handled using
    //   term::error and term::warn
    // The level of logging is increased by adding --verbose
    spdlog::level::level_enum console_log_level = spdlog::level::off;
    if (settings.verbose == 1) {
        console_log_level = spdlog::level::info;
    } else if (settings.verbose == 2) {
        console_log_level = spdlog::level::debug;
    } else if (settings.verbose >= 3) {
        console_log_level = spdlog::level::trace;
    }
    rex::init_log(console_log_level);

    // print the version and exit if the --version flag was passed
    if (print_version) {
        term::msg("{}", REX_VERSION);
        return 0;
    }

    // set the configuration according to defaults, cli options and config
    // files.
    auto full_config =
        rex::load_config(cli_config, settings.calling_environment);
    auto config = rex::generate_configuration(full_config);
    if (!config) {
        term::error("invalid configuration: {}", config.error());
        return 1;
    }
    settings.config = *config;

    if (token) {
        if (username || password) {
            term::error("the --token and --username/--password options can "
                        "not be used at the same time");
            return 1;
        }
        settings.credentials = rex::bearer_token{*token};
    } else if (username) {
        settings.credentials =
            rex::basic_credentials{*username, password.value_or("")};
    } else if (password) {
        term::error("--password requires --username");
        return 1;
    }

    // toggle whether to use color output
    spdlog::info("color output is {}",
                 (settings.config.color ? "enabled" : "disabled"));
    color::set_color(settings.config.color);

    spdlog::info("{}", settings);

    switch (settings.mode) {
    case settings.image_ls:
        return rex::image_ls(image.ls_args, settings);
    case settings.image_tags:
        return rex::image_tags(image.tags_args, settings);
    case settings.image_inspect:
        return rex::image_inspect(image.inspect_args, settings);
    case settings.cache_stats:
        return rex::cache_statistics(cache.stats_args, settings);
    case settings.cache_prune:
        return rex::cache_prune(settings);
    case settings.cache_clear:
        return rex::cache_clear(cache.clear_args, settings);
    case settings.cache_sync:
        return rex::cache_sync(cache.sync_args, settings);
    case settings.registry_check:
        return rex::registry_check(registry.check_args, settings);
    case settings.search:
        return rex::search(search, settings);
    case settings.unset:
        term::msg("rex version {}", REX_VERSION);
        term::msg("call '{} --help' for help", argv[0]);
        return 0;
    default:
        term::error("internal error, missing implementation for mode {}",
                    settings.mode);
        return 1;
    }

    return 0;
}

std::string help_footer() {
    using enum help::block::admonition;
    using help::lst;

    // clang-format off
    std::vector<help::item> items{
        help::block{none, "Use the --help flag in with sub-commands for more information."},
        help::linebreak{},
        help::block{xmpl, fmt::format("use the {} flag to generate more verbose output", lst("-v"))},
        help::block{code,   "rex -v  image ls    # info level logging"},
        help::block{code,   "rex -vv image ls    # debug level logging"},
        help::linebreak{},
        help::block{xmpl, "list the tags of a repository with 16 parallel requests"},
        help::block{code,   "rex -j16 image tags team/app"},
        help::linebreak{},
        help::block{xmpl, "find the images with a name like ubuntu"},
        help::block{code,   "rex search ubuntu"},
        help::linebreak{},
        help::block{note, fmt::format("credentials can be set with {}, {} and {}.", lst("REX_USERNAME"), lst("REX_PASSWORD"), lst("REX_TOKEN"))},
    };
    // clang-format on

    return fmt::format("{}", fmt::join(items, "\n"));
}
