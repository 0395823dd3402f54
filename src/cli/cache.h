// vim: ts=4 sts=4 sw=4 et
#pragma once

#include <CLI/CLI.hpp>

#include "rex.h"

namespace rex {

struct cache_stats_args {
    // print output in json format
    bool json = false;
};
struct cache_clear_args {
    // do not ask for confirmation
    bool yes = false;
};

struct cache_sync_args {
    // also fetch the manifest and configuration of every tag
    bool manifests = false;
    bool json = false;
};

struct cache_args {
    cache_stats_args stats_args;
    cache_clear_args clear_args;
    cache_sync_args sync_args;

    void add_cli(CLI::App&, global_settings& settings);
};

int cache_statistics(const cache_stats_args& args,
                     const global_settings& settings);
int cache_prune(const global_settings& settings);
int cache_clear(const cache_clear_args& args, const global_settings& settings);
int cache_sync(const cache_sync_args& args, const global_settings& settings);

} // namespace rex
