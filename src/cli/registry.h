// vim: ts=4 sts=4 sw=4 et
#pragma once

#include <CLI/CLI.hpp>

#include "rex.h"

namespace rex {

struct registry_check_args {
    bool json = false;
};

struct registry_args {
    registry_check_args check_args;

    void add_cli(CLI::App&, global_settings& settings);
};

int registry_check(const registry_check_args& args,
                   const global_settings& settings);

} // namespace rex
