// vim: ts=4 sts=4 sw=4 et
#include <string>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <rex/fetcher.h>
#include <rex/print.h>

#include "help.h"
#include "registry.h"
#include "terminal.h"
#include "util.h"

namespace rex {

std::string registry_footer();

void registry_args::add_cli(CLI::App& cli,
                            [[maybe_unused]] global_settings& settings) {
    auto* registry_cli =
        cli.add_subcommand("registry", "query the configured registry");

    // add the `rex registry check` command
    auto* check_cli = registry_cli->add_subcommand(
        "check", "check that the registry is reachable and supports the API");
    check_cli->add_flag("--json", check_args.json, "format output as JSON.");
    check_cli->callback(
        [&settings]() { settings.mode = rex::cli_mode::registry_check; });

    registry_cli->require_subcommand(1);
    registry_cli->footer(registry_footer);
}

int registry_check(const registry_check_args& args,
                   const global_settings& settings) {
    auto fetcher = make_fetcher(settings);
    if (!fetcher) {
        return 1;
    }

    const auto status = fetcher->check();
    spdlog::info("registry check: online {} auth_required {}", status.online,
                 status.auth_required);
    if (args.json) {
        term::msg("{}", format_registry_status_json(status));
    } else {
        term::raw(format_registry_status(status));
    }

    // a registry that denies access without credentials is reachable
    if (!status.online) {
        return 1;
    }
    return status.auth_required && status.authenticated ? 1 : 0;
}

std::string registry_footer() {
    using enum help::block::admonition;
    using help::lst;
    std::vector<help::item> items{
        // clang-format off
        help::block{none, "Query the registry that is configured with --registry or the configuration file."},
        help::linebreak{},
        help::block{xmpl, "check that the registry is online"},
        help::block{code,   "rex registry check"},
        help::linebreak{},
        help::block{xmpl, "check a registry with credentials"},
        help::block{code,   "REX_TOKEN=... rex --registry=https://ghcr.io registry check"},
        help::linebreak{},
        help::block{note, fmt::format("the exit code is non-zero if the registry can not be reached, or if it rejects the credentials. use {} for details.", lst("-vv"))},
        // clang-format on
    };

    return fmt::format("{}", fmt::join(items, "\n"));
}

} // namespace rex
