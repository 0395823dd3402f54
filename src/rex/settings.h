#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <util/envvars.h>
#include <util/expected.h>

#include <rex/client.h>
#include <rex/fetcher.h>
#include <rex/oci.h>

namespace rex {

// settings as they are read from the command line and configuration files:
// every field is optional, and unset fields are filled from lower priority
// sources by merge.
struct config_base {
    std::optional<std::string> registry;
    std::optional<std::string> cache;
    std::optional<unsigned> concurrency;
    std::optional<unsigned> tag_ttl;
    std::optional<unsigned> catalog_ttl;
    std::optional<unsigned> timeout;
    std::optional<unsigned> retries;
    std::optional<bool> color;
    std::optional<bool> dockerhub_compat;
    std::optional<std::string> platform;
};

// load config: the cli settings take precedence over the user config file,
// which takes precedence over the system config file.
config_base load_config(const config_base& cli_config,
                        const envvars::state& calling_env);

// get the default configuration
config_base default_config(const envvars::state& calling_env);

// if both have the same field set, choose the lhs value
config_base merge(const config_base& lhs, const config_base& rhs);

// the location of the user configuration file, if HOME or XDG_CONFIG_HOME is
// set
std::optional<std::filesystem::path>
user_config_path(const envvars::state& calling_env);

// the default cache location: $XDG_CACHE_HOME/rex or $HOME/.cache/rex
std::optional<std::filesystem::path>
default_cache_path(const envvars::state& calling_env);

struct configuration {
    std::optional<std::string> registry;
    std::filesystem::path cache;
    unsigned concurrency;
    cache_policy staleness;
    retry_policy retry;
    std::chrono::milliseconds timeout;
    bool color;
    bool dockerhub_compat;
    std::optional<rex::platform> platform;
};

// validate the merged settings
util::expected<configuration, std::string>
generate_configuration(const config_base& base);

// the engine settings for a validated configuration
fetch_settings make_fetch_settings(const configuration& config,
                                   std::optional<rex::credentials> credentials);

namespace impl {
util::expected<config_base, std::string>
read_config_file(const std::filesystem::path& path,
                 const envvars::state& calling_env);
}

} // namespace rex
