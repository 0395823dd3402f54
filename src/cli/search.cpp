// vim: ts=4 sts=4 sw=4 et
#include <string>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <rex/fetcher.h>
#include <rex/print.h>
#include <rex/search.h>

#include "help.h"
#include "search.h"
#include "terminal.h"
#include "util.h"

namespace rex {

std::string search_footer();

void search_args::add_cli(CLI::App& cli,
                          [[maybe_unused]] global_settings& settings) {
    auto* search_cli = cli.add_subcommand(
        "search", "fuzzy search for repositories and tags");
    search_cli->add_option("query", query, "the search query.")->required();
    search_cli->add_option("-l,--limit", limit,
                           "the maximum number of results of each kind.")
        ->check(CLI::PositiveNumber);
    search_cli->add_flag("--json", json, "format output as JSON.");
    search_cli->callback(
        [&settings]() { settings.mode = rex::cli_mode::search; });

    search_cli->footer(search_footer);
}

int search(const search_args& args, const global_settings& settings) {
    spdlog::info("search '{}'", args.query);

    auto fetcher = make_fetcher(settings);
    if (!fetcher) {
        return 1;
    }
    cancel_token cancel;
    signal_watcher watcher(cancel);

    auto catalog = fetcher->fetch_catalog(cancel);
    if (!catalog) {
        term::error("unable to list repositories: {}", catalog.error());
        return 1;
    }

    // tag lists are only needed for the repositories that match the
    // repository part of the query
    const auto repo_query = args.query.substr(0, args.query.find(':'));
    std::vector<std::string> candidates;
    for (auto& r : search_repositories(repo_query, *catalog)) {
        candidates.push_back(r.value);
    }
    spdlog::info("search: {} candidate repositories", candidates.size());

    progress_display progress("fetching tags", "repo/s", !args.json);
    auto lists = fetcher->fetch_tag_lists(candidates, progress.callback(),
                                          cancel);
    progress.done();
    if (!lists) {
        term::error("unable to list tags: {}", lists.error());
        return 1;
    }
    for (auto& f : lists->failures) {
        term::warn("unable to list the tags of {}: {}", f.item, f.error);
    }

    std::unordered_map<std::string, std::vector<std::string>> tags;
    for (auto& r : lists->items) {
        tags[r.name] = std::move(r.tags);
    }

    auto repositories = search_repositories(args.query, *catalog);
    auto images = search_images(args.query, *catalog, tags);
    if (args.limit) {
        if (repositories.size() > *args.limit) {
            repositories.resize(*args.limit);
        }
        if (images.size() > *args.limit) {
            images.resize(*args.limit);
        }
    }

    if (args.json) {
        term::msg("{}", format_search_json(args.query, repositories, images));
    } else {
        term::raw(format_search(repositories, images));
    }

    if (lists->cancelled) {
        term::warn("interrupted: the results are incomplete");
        return 130;
    }
    return 0;
}

std::string search_footer() {
    using enum help::block::admonition;
    using help::lst;
    std::vector<help::item> items{
        // clang-format off
        help::block{none, "Fuzzy search the repositories and tags of the registry."},
        help::block{none, "The characters of the query must appear in order, not necessarily next to each other."},
        help::linebreak{},
        help::block{xmpl, "find repositories and images with a name like alpine"},
        help::block{code,   "rex search alp"},
        help::linebreak{},
        help::block{xmpl, fmt::format("search the tags of matching repositories with {}", lst("repository:tag"))},
        help::block{code,   "rex search alp:3.19"},
        help::linebreak{},
        help::block{xmpl, "print the ten best matches as JSON"},
        help::block{code,   "rex search --limit 10 --json ubuntu"},
        help::linebreak{},
        help::block{note, "the query is case sensitive only if it contains an upper case letter."},
        // clang-format on
    };

    return fmt::format("{}", fmt::join(items, "\n"));
}

} // namespace rex
