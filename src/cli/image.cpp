// vim: ts=4 sts=4 sw=4 et
#include <string>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "help.h"
#include "image.h"

namespace rex {

std::string image_footer();

void image_args::add_cli(CLI::App& cli,
                         [[maybe_unused]] global_settings& settings) {
    auto* image_cli =
        cli.add_subcommand("image", "query the images in a registry");

    // add the `rex image ls` command
    ls_args.add_cli(*image_cli, settings);

    // add the `rex image tags` command
    tags_args.add_cli(*image_cli, settings);

    // add the `rex image inspect` command
    inspect_args.add_cli(*image_cli, settings);

    image_cli->require_subcommand(1);
    image_cli->footer(image_footer);
}

std::string image_footer() {
    using enum help::block::admonition;
    using help::lst;
    std::vector<help::item> items{
        // clang-format off
        help::block{none, "Query the repositories, tags and manifests of a registry." },
        help::linebreak{},
        help::block{none, fmt::format("For more information on how to use individual commands use the {} flag.", lst("--help")) },
        help::linebreak{},
        help::block{xmpl, fmt::format("get help on the {} command", lst("tags"))},
        help::block{code,   "rex image tags --help"},
        // clang-format on
    };

    return fmt::format("{}", fmt::join(items, "\n"));
}

} // namespace rex
