// vim: ts=4 sts=4 sw=4 et
#include <chrono>
#include <string>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <rex/fetcher.h>
#include <rex/print.h>
#include <util/expected.h>

#include "help.h"
#include "image.h"
#include "terminal.h"
#include "util.h"

namespace rex {

std::string image_ls_footer();

void image_ls_args::add_cli(CLI::App& cli,
                            [[maybe_unused]] global_settings& settings) {
    auto* ls_cli =
        cli.add_subcommand("ls", "list the repositories in the registry");
    ls_cli->add_flag("--no-header", no_header,
                     "print only the matching records, with no header.");
    ls_cli->add_flag("--json", json, "format output as JSON.");
    ls_cli->callback(
        [&settings]() { settings.mode = rex::cli_mode::image_ls; });

    ls_cli->footer(image_ls_footer);
}

int image_ls(const image_ls_args& args, const global_settings& settings) {
    const auto format = get_output_format(args.no_header, args.json);
    if (!format) {
        term::error("{}", format.error());
        return 1;
    }

    auto fetcher = make_fetcher(settings);
    if (!fetcher) {
        return 1;
    }
    cancel_token cancel;
    signal_watcher watcher(cancel);

    progress_display progress("fetching repositories", "repo/s", !args.json);
    auto result = fetcher->fetch_repositories(progress.callback(), cancel);
    progress.done();
    if (!result) {
        term::error("unable to list repositories: {}", result.error());
        return 1;
    }

    const auto now = std::chrono::system_clock::now();
    switch (*format) {
    case output_format::json:
        term::msg("{}", format_repositories_json(result->items));
        break;
    case output_format::table:
    case output_format::table_no_header:
        term::raw(format_repositories_table(
            result->items, now, *format == output_format::table_no_header));
        break;
    }

    return report_failures(result->failures, result->cancelled);
}

std::string image_ls_footer() {
    using enum help::block::admonition;
    using help::lst;
    std::vector<help::item> items{
        // clang-format off
        help::block{none, "List the repositories in the registry, with the number of tags and the size and date of the most recent tag."},
        help::linebreak{},
        help::block{xmpl, "list all repositories"},
        help::block{code,   "rex image ls"},
        help::linebreak{},
        help::block{xmpl, "list repositories in a registry that is not the default"},
        help::block{code,   "rex --registry=https://registry.example.com image ls"},
        help::linebreak{},
        help::block{xmpl, "print the list as JSON"},
        help::block{code,   "rex image ls --json"},
        help::linebreak{},
        help::block{note, fmt::format("results are cached: use {} to force a refresh.", lst("rex cache clear"))},
        // clang-format on
    };

    return fmt::format("{}", fmt::join(items, "\n"));
}

} // namespace rex
