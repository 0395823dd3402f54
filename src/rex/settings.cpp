#include <charconv>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unordered_map>

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <util/color.h>
#include <util/envvars.h>
#include <util/expected.h>
#include <util/strings.h>

#include <rex/parse.h>
#include <rex/settings.h>

namespace rex {

namespace fs = std::filesystem;

const std::string config_file_default =
    R"(
# rex configuration file
# lines starting with '#' are comments

# the registry to explore
#registry = https://registry.example.com

# the cache directory: ${VAR} is replaced by the environment variable VAR
#cache = ${HOME}/.cache/rex

# the maximum number of simultaneous requests to the registry
#concurrency = 8

# the number of seconds that tag lists and the catalog are cached for
#tag-ttl = 1800
#catalog-ttl = 3600

# the timeout of registry requests in seconds
#timeout = 30

# the number of attempts made when the registry rate limits requests
#retries = 3

# add library/ to single component repository names, as Docker Hub does
#dockerhub-compat = false

# the platform used to select images from multi-platform indexes
#platform = linux/amd64

# by default rex will choose whether to use color based on your environment.
#color=true
#color=false
)";

template <typename T>
std::optional<T> pick(const std::optional<T>& lhs, const std::optional<T>& rhs) {
    return lhs ? lhs : rhs;
}

config_base merge(const config_base& lhs, const config_base& rhs) {
    return {.registry = pick(lhs.registry, rhs.registry),
            .cache = pick(lhs.cache, rhs.cache),
            .concurrency = pick(lhs.concurrency, rhs.concurrency),
            .tag_ttl = pick(lhs.tag_ttl, rhs.tag_ttl),
            .catalog_ttl = pick(lhs.catalog_ttl, rhs.catalog_ttl),
            .timeout = pick(lhs.timeout, rhs.timeout),
            .retries = pick(lhs.retries, rhs.retries),
            .color = pick(lhs.color, rhs.color),
            .dockerhub_compat = pick(lhs.dockerhub_compat, rhs.dockerhub_compat),
            .platform = pick(lhs.platform, rhs.platform)};
}

std::optional<fs::path> user_config_path(const envvars::state& env) {
    if (auto xdg = env.get("XDG_CONFIG_HOME")) {
        return fs::path(*xdg) / "rex" / "config";
    }
    if (auto home = env.get("HOME")) {
        return fs::path(*home) / ".config" / "rex" / "config";
    }
    return std::nullopt;
}

std::optional<fs::path> default_cache_path(const envvars::state& env) {
    if (auto xdg = env.get("XDG_CACHE_HOME")) {
        return fs::path(*xdg) / "rex";
    }
    if (auto home = env.get("HOME")) {
        return fs::path(*home) / ".cache" / "rex";
    }
    return std::nullopt;
}

config_base default_config(const envvars::state& env) {
    const auto cache = default_cache_path(env);
    return {
        .registry = std::nullopt,
        .cache = cache ? std::optional<std::string>(cache->string())
                       : std::nullopt,
        .concurrency = 8,
        .tag_ttl = 1800,
        .catalog_ttl = 3600,
        .timeout = 30,
        .retries = 3,
        .color = color::default_color(env),
        .dockerhub_compat = false,
        .platform = std::nullopt,
    };
}

util::expected<configuration, std::string>
generate_configuration(const config_base& base) {
    using std::chrono::seconds;

    configuration config;

    if (base.registry) {
        auto url = util::strip(*base.registry);
        if (url.empty()) {
            return util::unexpected("the registry URL is empty");
        }
        config.registry = url;
    }

    if (!base.cache || base.cache->empty()) {
        return util::unexpected(
            "no cache directory: set cache in the configuration file, or set "
            "HOME or XDG_CACHE_HOME");
    }
    config.cache = fs::absolute(*base.cache);

    config.concurrency = base.concurrency.value_or(8);
    if (config.concurrency == 0) {
        return util::unexpected("concurrency must be at least 1");
    }

    config.staleness.tag_list_ttl = seconds(base.tag_ttl.value_or(1800));
    config.staleness.tag_digest_ttl = config.staleness.tag_list_ttl;
    config.staleness.catalog_ttl = seconds(base.catalog_ttl.value_or(3600));

    config.timeout = std::chrono::milliseconds(
        seconds(base.timeout.value_or(30)));
    if (config.timeout.count() == 0) {
        return util::unexpected("timeout must be at least 1 second");
    }

    config.retry.max_attempts = base.retries.value_or(3);
    if (config.retry.max_attempts == 0) {
        return util::unexpected("retries must be at least 1");
    }

    config.color = base.color.value_or(false);
    config.dockerhub_compat = base.dockerhub_compat.value_or(false);

    if (base.platform) {
        auto p = parse_platform(*base.platform);
        if (!p) {
            auto e = p.error();
            e.description = "invalid platform";
            return util::unexpected(e.message());
        }
        config.platform = *p;
    }

    return config;
}

fetch_settings make_fetch_settings(const configuration& config,
                                   std::optional<rex::credentials> credentials) {
    return {.registry_url = config.registry.value_or(""),
            .cache_dir = config.cache,
            .credentials = std::move(credentials),
            .concurrency = config.concurrency,
            .cache = config.staleness,
            .retry = config.retry,
            .timeout = config.timeout,
            .platform = config.platform,
            .dockerhub_compat = config.dockerhub_compat,
            .page_size = std::nullopt};
}

// read configuration from the user configuration file
// a default configuration file is created if none exists
util::expected<config_base, std::string>
load_user_config(const envvars::state& calling_env) {
    const auto config_file = user_config_path(calling_env);
    // return an empty config if no configuration path can be determined
    if (!config_file) {
        spdlog::warn("unable to find default configuration location, neither "
                     "HOME nor XDG_CONFIG_HOME are defined.");
        return config_base{};
    }
    const auto config_path = config_file->parent_path();

    if (!fs::exists(*config_file)) {
        std::error_code ec;
        fs::create_directories(config_path, ec);
        if (ec) {
            spdlog::error("load_user_config: unable to create config path {}: {}",
                          config_path, ec.message());
            return config_base{};
        }
        spdlog::debug("load_user_config: creating configuration file {}",
                      *config_file);
        auto fid = std::ofstream(*config_file);
        fid << config_file_default << std::endl;
        return config_base{};
    }

    spdlog::debug("load_user_config: opening {}", *config_file);
    auto result = impl::read_config_file(*config_file, calling_env);
    if (!result) {
        return util::unexpected{fmt::format(
            "error opening '{}': {}", config_file->string(), result.error())};
    }

    spdlog::info("load_user_config: loaded {}", *config_file);
    return *result;
}

// read configuration from /etc
util::expected<config_base, std::string>
load_system_config(const envvars::state& calling_env) {
    const auto config_path = fs::path(
        calling_env.get("REX_SYSTEM_CONFIG").value_or("/etc/rex/config"));
    spdlog::trace("load_system_config: using {}", config_path);

    if (!fs::exists(config_path)) {
        return util::unexpected(
            fmt::format("path {} does not exist", config_path));
    }

    auto result = impl::read_config_file(config_path, calling_env);
    if (!result) {
        return util::unexpected{
            fmt::format("error reading {}: {}", config_path, result.error())};
    }

    spdlog::info("load_system_config: loaded {}", config_path);
    return result;
}

config_base load_config(const config_base& cli_config,
                        const envvars::state& calling_env) {
    auto config = default_config(calling_env);
    if (auto sys = load_system_config(calling_env)) {
        config = merge(*sys, config);
    } else {
        spdlog::info("load_config: did not load system config file: {}",
                     sys.error());
    }
    if (auto usr = load_user_config(calling_env)) {
        config = merge(*usr, config);
    } else {
        spdlog::warn("load_config: did not load user config: {}", usr.error());
    }
    return merge(cli_config, config);
}

namespace impl {

util::expected<bool, std::string> parse_bool(const std::string& key,
                                             const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    return util::unexpected(fmt::format(
        "invalid configuration value '{}={}': {} must be true or false", key,
        value, key));
}

util::expected<unsigned, std::string> parse_unsigned(const std::string& key,
                                                     const std::string& value) {
    unsigned result = 0;
    const auto* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, result);
    if (ec != std::errc{} || ptr != end || value.empty()) {
        return util::unexpected(fmt::format(
            "invalid configuration value '{}={}': {} must be a non-negative "
            "integer",
            key, value, key));
    }
    return result;
}

util::expected<config_base, std::string>
read_config_file(const fs::path& path, const envvars::state& calling_env) {
    if (!fs::exists(path) || !fs::is_regular_file(path)) {
        return util::unexpected{"file does not exist or is not a regular file"};
    }

    std::ifstream fid(path);
    if (!fid.is_open()) {
        return util::unexpected{"unable to open file"};
    }

    // parse the file line by line into a table of (key, value) strings
    std::string line;
    std::unordered_map<std::string, std::string> settings;
    unsigned lineno = 1;
    while (std::getline(fid, line)) {
        if (const auto result = parse_config_line(line)) {
            if (*result) {
                if (settings.contains(result->key)) {
                    spdlog::warn(
                        "the configuration parameter {} is defined more than "
                        "once (line {})",
                        result->key, lineno);
                }
                settings[result->key] = result->value;
            }
        } else {
            return util::unexpected{fmt::format("{}:{}\n  {}", lineno, line,
                                                result.error().message())};
        }
        ++lineno;
    }

#define CONFIG_VALUE(FIELD, PARSER)                                            \
    if (auto v = PARSER(key, value)) {                                         \
        config.FIELD = *v;                                                     \
    } else {                                                                   \
        return util::unexpected(v.error());                                    \
    }

    config_base config;
    for (auto& [key, value] : settings) {
        if (key == "registry") {
            config.registry = value;
        } else if (key == "cache") {
            config.cache = calling_env.expand(value);
        } else if (key == "platform") {
            config.platform = value;
        } else if (key == "concurrency") {
            CONFIG_VALUE(concurrency, parse_unsigned)
        } else if (key == "tag-ttl") {
            CONFIG_VALUE(tag_ttl, parse_unsigned)
        } else if (key == "catalog-ttl") {
            CONFIG_VALUE(catalog_ttl, parse_unsigned)
        } else if (key == "timeout") {
            CONFIG_VALUE(timeout, parse_unsigned)
        } else if (key == "retries") {
            CONFIG_VALUE(retries, parse_unsigned)
        } else if (key == "color") {
            CONFIG_VALUE(color, parse_bool)
        } else if (key == "dockerhub-compat") {
            CONFIG_VALUE(dockerhub_compat, parse_bool)
        } else {
            return util::unexpected(
                fmt::format("invalid configuration parameter '{}'", key));
        }
    }
#undef CONFIG_VALUE

    return config;
}

} // namespace impl

} // namespace rex
