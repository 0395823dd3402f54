// vim: ts=4 sts=4 sw=4 et
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "rex.h"

namespace rex {

struct search_args {
    std::string query;
    // the maximum number of results in each section
    std::optional<std::size_t> limit;
    bool json = false;
    void add_cli(CLI::App&, global_settings& settings);
};

int search(const search_args& args, const global_settings& settings);

} // namespace rex
