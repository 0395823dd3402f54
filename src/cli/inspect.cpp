// vim: ts=4 sts=4 sw=4 et
#include <chrono>
#include <optional>
#include <string>
#include <variant>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <rex/fetcher.h>
#include <rex/manifest.h>
#include <rex/parse.h>
#include <rex/print.h>
#include <util/expected.h>

#include "help.h"
#include "image.h"
#include "terminal.h"
#include "util.h"

namespace rex {

std::string image_inspect_footer();

void image_inspect_args::add_cli(CLI::App& cli,
                                 [[maybe_unused]] global_settings& settings) {
    auto* inspect_cli = cli.add_subcommand(
        "inspect", "print the manifest and configuration of an image.");
    inspect_cli->add_option("reference", reference, "the image to inspect.")
        ->required();
    inspect_cli->add_option(
        "--platform", platform,
        "select an image from a multi-platform index, e.g. linux/arm64.");
    inspect_cli->add_flag("--json", json, "format output as JSON.");
    inspect_cli->callback(
        [&settings]() { settings.mode = rex::cli_mode::image_inspect; });

    inspect_cli->footer(image_inspect_footer);
}

int image_inspect(const image_inspect_args& args,
                  const global_settings& settings) {
    spdlog::info("image inspect {}", args.reference);

    auto ref = parse_reference(args.reference);
    if (!ref) {
        auto e = ref.error();
        e.description = "invalid image reference";
        term::error("{}", e.message());
        return 1;
    }

    std::optional<rex::platform> platform;
    if (args.platform) {
        auto p = parse_platform(*args.platform);
        if (!p) {
            auto e = p.error();
            e.description = "invalid --platform argument";
            term::error("{}", e.message());
            return 1;
        }
        platform = *p;
    }

    auto fetcher = make_fetcher(settings);
    if (!fetcher) {
        return 1;
    }
    cancel_token cancel;
    signal_watcher watcher(cancel);

    auto manifest = fetcher->fetch_manifest(*ref, platform, cancel);
    if (!manifest) {
        term::error("unable to fetch {}: {}", *ref, manifest.error());
        return 1;
    }

    // the configuration is only available for image manifests
    std::optional<image_config> config;
    if (auto image = std::get_if<image_manifest>(&manifest->document)) {
        auto blob = fetcher->fetch_config(ref->repository(),
                                          image->config.digest, cancel);
        if (!blob) {
            term::warn("unable to fetch the configuration of {}: {}", *ref,
                       blob.error());
        } else if (auto c = parse_image_config(*blob)) {
            config = *c;
        } else {
            term::warn("invalid configuration for {}: {}", *ref, c.error());
        }
    }

    if (args.json) {
        term::msg("{}", format_manifest_json(*manifest, config));
    } else {
        term::raw(format_manifest(*manifest, config,
                                  std::chrono::system_clock::now()));
    }

    return 0;
}

std::string image_inspect_footer() {
    using enum help::block::admonition;
    using help::lst;
    std::vector<help::item> items{
        // clang-format off
        help::block{none, "Print the manifest of an image, and the platform and creation date from its configuration."},
        help::linebreak{},
        help::block{xmpl, "inspect the latest tag of a repository"},
        help::block{code,   "rex image inspect team/app"},
        help::linebreak{},
        help::block{xmpl, "inspect an image by digest"},
        help::block{code,   "rex image inspect team/app@sha256:7173b809ca12ec5dee4506cd86be934c4596dd234ee82c0662eac04a8c2c71dc"},
        help::linebreak{},
        help::block{xmpl, "select the arm64 image of a multi-platform image"},
        help::block{code,   "rex image inspect team/app:v1.2 --platform linux/arm64"},
        help::linebreak{},
        help::block{note, fmt::format("the platform can also be set with {} in the configuration file.", lst("platform"))},
        // clang-format on
    };

    return fmt::format("{}", fmt::join(items, "\n"));
}

} // namespace rex
