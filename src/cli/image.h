// vim: ts=4 sts=4 sw=4 et
#pragma once

#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "rex.h"

namespace rex {

struct image_ls_args {
    bool no_header = false;
    bool json = false;
    void add_cli(CLI::App&, global_settings& settings);
};

struct image_tags_args {
    std::string repository;
    bool no_header = false;
    bool json = false;
    void add_cli(CLI::App&, global_settings& settings);
};

struct image_inspect_args {
    std::string reference;
    std::optional<std::string> platform;
    bool json = false;
    void add_cli(CLI::App&, global_settings& settings);
};

struct image_args {
    image_ls_args ls_args;
    image_tags_args tags_args;
    image_inspect_args inspect_args;
    void add_cli(CLI::App&, global_settings& settings);
};

int image_ls(const image_ls_args& args, const global_settings& settings);
int image_tags(const image_tags_args& args, const global_settings& settings);
int image_inspect(const image_inspect_args& args,
                  const global_settings& settings);

} // namespace rex

#include <fmt/core.h>

template <> class fmt::formatter<rex::image_tags_args> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(rex::image_tags_args const& opts,
                          FmtContext& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{repository: '{}', json: {}, no_header: {}}}",
                              opts.repository, opts.json, opts.no_header);
    }
};
