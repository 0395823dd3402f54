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

std::string image_tags_footer();

void image_tags_args::add_cli(CLI::App& cli,
                              [[maybe_unused]] global_settings& settings) {
    auto* tags_cli =
        cli.add_subcommand("tags", "list the tags of a repository");
    tags_cli->add_option("repository", repository, "the repository.")
        ->required();
    tags_cli->add_flag("--no-header", no_header,
                       "print only the matching records, with no header.");
    tags_cli->add_flag("--json", json, "format output as JSON.");
    tags_cli->callback(
        [&settings]() { settings.mode = rex::cli_mode::image_tags; });

    tags_cli->footer(image_tags_footer);
}

int image_tags(const image_tags_args& args, const global_settings& settings) {
    spdlog::info("image tags {}", args);

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

    auto result = fetcher->fetch_tags(args.repository, cancel);
    if (!result) {
        term::error("unable to list the tags of {}: {}", args.repository,
                    result.error());
        return 1;
    }

    const auto now = std::chrono::system_clock::now();
    switch (*format) {
    case output_format::json:
        term::msg("{}", format_tags_json(result->items));
        break;
    case output_format::table:
    case output_format::table_no_header:
        term::raw(format_tags_table(result->items, now,
                                    *format == output_format::table_no_header));
        break;
    }

    return report_failures(result->failures, result->cancelled);
}

std::string image_tags_footer() {
    using enum help::block::admonition;
    using help::lst;
    std::vector<help::item> items{
        // clang-format off
        help::block{none, "List the tags of a repository, with the digest, size, creation date and platforms of each tag."},
        help::linebreak{},
        help::block{xmpl, "list the tags of a repository"},
        help::block{code,   "rex image tags team/app"},
        help::linebreak{},
        help::block{xmpl, fmt::format("list the tags of an official Docker Hub image (requires {})", lst("dockerhub-compat = true"))},
        help::block{code,   "rex image tags alpine"},
        help::linebreak{},
        help::block{note, "tags that can not be fetched are reported on stderr, and the exit code is non-zero."},
        // clang-format on
    };

    return fmt::format("{}", fmt::join(items, "\n"));
}

} // namespace rex
