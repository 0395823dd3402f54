#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include <util/color.h>
#include <util/expected.h>
#include <util/strings.h>

#include <rex/fetcher.h>
#include <rex/manifest.h>
#include <rex/print.h>
#include <rex/search.h>

namespace rex {

using json = nlohmann::json;

util::expected<output_format, std::string> get_output_format(bool no_header,
                                                             bool json) {
    if (json && no_header) {
        return util::unexpected(
            "the --json and --no-header options are incompatible and can not "
            "be used at the same time");
    }
    if (json) {
        return output_format::json;
    }
    return no_header ? output_format::table_no_header : output_format::table;
}

std::string format_size(std::uint64_t bytes) {
    constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = bytes;
    unsigned unit = 0;
    while (value >= 1024 && unit < std::size(units) - 1) {
        value /= 1024;
        ++unit;
    }
    auto number = fmt::format("{:.2f}", value);
    // 5.00 -> 5, 1.50 -> 1.5
    while (number.back() == '0') {
        number.pop_back();
    }
    if (number.back() == '.') {
        number.pop_back();
    }
    return fmt::format("{} {}", number, units[unit]);
}

std::string format_relative_time(timestamp t, timestamp now) {
    using namespace std::chrono;
    const auto delta = duration_cast<seconds>(now - t).count();
    if (delta < 0) {
        return "in the future";
    }
    if (delta < 60) {
        return "just now";
    }

    auto ago = [](std::int64_t n, std::string_view one, std::string_view unit) {
        return n == 1 ? fmt::format("{} ago", one)
                      : fmt::format("{} {}s ago", n, unit);
    };
    constexpr std::int64_t minute = 60;
    constexpr std::int64_t hour = 60 * minute;
    constexpr std::int64_t day = 24 * hour;
    if (delta < hour) {
        return ago(delta / minute, "a minute", "minute");
    }
    if (delta < day) {
        return ago(delta / hour, "an hour", "hour");
    }
    if (delta < 30 * day) {
        return ago(delta / day, "a day", "day");
    }
    if (delta < 365 * day) {
        return ago(delta / (30 * day), "a month", "month");
    }
    return ago(delta / (365 * day), "a year", "year");
}

std::string format_timestamp(timestamp t) {
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}",
                       fmt::gmtime(std::chrono::system_clock::to_time_t(t)));
}

namespace {

std::string short_digest(const std::optional<rex::digest>& d) {
    if (!d) {
        return "-";
    }
    return fmt::format("{}:{}", d->algorithm(), d->hex().substr(0, 12));
}

std::string optional_size(const std::optional<std::uint64_t>& s) {
    return s ? format_size(*s) : "-";
}

std::string optional_time(const std::optional<timestamp>& t, timestamp now) {
    return t ? format_relative_time(*t, now) : "-";
}

json optional_json(const std::optional<timestamp>& t) {
    return t ? json(format_timestamp(*t)) : json(nullptr);
}

} // namespace

std::string format_tags_table(const std::vector<tag_info>& tags, timestamp now,
                              bool no_header) {
    if (tags.empty()) {
        return no_header ? "" : "no tags\n";
    }

    std::size_t w_name = std::string_view("tag").size();
    std::size_t w_digest = std::string_view("sha256:").size() + 12;
    std::size_t w_size = std::string_view("size").size();
    std::size_t w_date = std::string_view("created").size();
    for (auto& t : tags) {
        w_name = std::max(w_name, t.name.size());
        w_size = std::max(w_size, optional_size(t.size).size());
        w_date = std::max(w_date, optional_time(t.last_modified, now).size());
    }
    w_name += 2;
    w_digest += 2;
    w_size += 2;
    w_date += 2;

    std::string result;
    if (!no_header) {
        auto header = fmt::format("{:<{}}{:<{}}{:<{}}{:<{}}{}", "tag", w_name,
                                  "digest", w_digest, "size", w_size,
                                  "created", w_date, "platform");
        result += fmt::format("{}\n", color::yellow(header));
    }
    for (auto& t : tags) {
        result += fmt::format(
            "{:<{}}{:<{}}{:<{}}{:<{}}{}\n", t.name, w_name,
            short_digest(t.digest), w_digest, optional_size(t.size), w_size,
            optional_time(t.last_modified, now), w_date,
            t.platforms.empty() ? "-" : util::join(",", t.platforms));
    }
    return result;
}

std::string format_tags_json(const std::vector<tag_info>& tags) {
    std::vector<json> records;
    for (auto& t : tags) {
        records.push_back(json{
            {"name", t.name},
            {"digest", t.digest ? json(t.digest->string()) : json(nullptr)},
            {"size", t.size ? json(*t.size) : json(nullptr)},
            {"created", optional_json(t.last_modified)},
            {"platforms", t.platforms},
        });
    }
    return json{{"tags", records}}.dump();
}

std::string
format_repositories_table(const std::vector<repository_item>& repositories,
                          timestamp now, bool no_header) {
    if (repositories.empty()) {
        return no_header ? "" : "no repositories\n";
    }

    auto count = [](const repository_item& r) {
        return r.tag_count ? fmt::format("{}", *r.tag_count) : "-";
    };

    std::size_t w_name = std::string_view("repository").size();
    std::size_t w_tags = std::string_view("tags").size();
    std::size_t w_size = std::string_view("size").size();
    for (auto& r : repositories) {
        w_name = std::max(w_name, r.name.size());
        w_tags = std::max(w_tags, count(r).size());
        w_size = std::max(w_size, optional_size(r.size).size());
    }
    w_name += 2;
    w_tags += 2;
    w_size += 2;

    std::string result;
    if (!no_header) {
        auto header = fmt::format("{:<{}}{:<{}}{:<{}}{}", "repository", w_name,
                                  "tags", w_tags, "size", w_size, "updated");
        result += fmt::format("{}\n", color::yellow(header));
    }
    for (auto& r : repositories) {
        result += fmt::format("{:<{}}{:<{}}{:<{}}{}\n", r.name, w_name,
                              count(r), w_tags, optional_size(r.size), w_size,
                              optional_time(r.last_updated, now));
    }
    return result;
}

std::string
format_repositories_json(const std::vector<repository_item>& repositories) {
    std::vector<json> records;
    for (auto& r : repositories) {
        records.push_back(json{
            {"name", r.name},
            {"tags", r.tag_count ? json(*r.tag_count) : json(nullptr)},
            {"size", r.size ? json(*r.size) : json(nullptr)},
            {"updated", optional_json(r.last_updated)},
        });
    }
    return json{{"repositories", records}}.dump();
}

std::string format_manifest(const fetched_manifest& manifest,
                            const std::optional<image_config>& config,
                            timestamp now) {
    std::string result;
    auto field = [&result](std::string_view name, const std::string& value) {
        result += fmt::format("{:<12}{}\n", color::white(name), value);
    };

    field("digest", manifest.digest.string());
    if (manifest.index) {
        field("index", manifest.index->string());
    }
    field("type", manifest.media_type.empty() ? "-" : manifest.media_type);

    if (auto idx = std::get_if<image_index>(&manifest.document)) {
        field("size", format_size(idx->size()));
        result += fmt::format("{}\n", color::yellow("manifests"));
        for (auto& m : idx->manifests) {
            result += fmt::format(
                "  {}  {:<20}{}\n", m.digest.string(),
                m.platform ? m.platform->string() : std::string("-"),
                format_size(m.size));
        }
        return result;
    }

    auto& image = std::get<image_manifest>(manifest.document);
    field("size", format_size(image.size()));
    if (config) {
        field("platform", config->platform().string());
        if (config->created) {
            field("created",
                  fmt::format("{} ({})", format_timestamp(*config->created),
                              format_relative_time(*config->created, now)));
        }
    }
    field("config", image.config.digest.string());
    result += fmt::format("{}\n", color::yellow("layers"));
    for (auto& l : image.layers) {
        result += fmt::format("  {}  {}\n", l.digest.string(),
                              format_size(l.size));
    }
    return result;
}

std::string format_manifest_json(const fetched_manifest& manifest,
                                 const std::optional<image_config>& config) {
    auto descriptor_json = [](const descriptor& d) {
        json j{{"mediaType", d.media_type},
               {"digest", d.digest.string()},
               {"size", d.size}};
        if (d.platform) {
            j["platform"] = d.platform->string();
        }
        return j;
    };

    json result{{"digest", manifest.digest.string()},
                {"mediaType", manifest.media_type}};
    if (manifest.index) {
        result["index"] = manifest.index->string();
    }
    if (auto idx = std::get_if<image_index>(&manifest.document)) {
        std::vector<json> children;
        for (auto& m : idx->manifests) {
            children.push_back(descriptor_json(m));
        }
        result["size"] = idx->size();
        result["manifests"] = children;
    } else {
        auto& image = std::get<image_manifest>(manifest.document);
        std::vector<json> layers;
        for (auto& l : image.layers) {
            layers.push_back(descriptor_json(l));
        }
        result["size"] = image.size();
        result["config"] = descriptor_json(image.config);
        result["layers"] = layers;
    }
    if (config) {
        result["platform"] = config->platform().string();
        result["created"] = optional_json(config->created);
    }
    return result.dump();
}

std::string format_failures(const std::vector<fetch_failure>& failures) {
    std::string result;
    for (auto& f : failures) {
        result += fmt::format("{} {}: {}\n", color::red("failed"), f.item,
                              f.error);
    }
    return result;
}

std::string format_cache_stats(const cache_stats& stats) {
    return fmt::format("{:<18}{}\n{:<18}{}\n{:<18}{}\n",
                       "content entries", stats.content_entries,
                       "listing entries", stats.listing_entries, "size",
                       format_size(stats.bytes));
}

std::string format_search(const std::vector<search_result>& repositories,
                          const std::vector<search_result>& images) {
    if (repositories.empty() && images.empty()) {
        return "no results found\n";
    }
    std::string result;
    if (!repositories.empty()) {
        result += fmt::format("{}\n", color::yellow("images"));
        for (auto& r : repositories) {
            result += fmt::format("  {}\n", r.value);
        }
    }
    if (!images.empty()) {
        if (!repositories.empty()) {
            result += "\n";
        }
        result += fmt::format("{}\n", color::yellow("tags"));
        for (auto& i : images) {
            result += fmt::format("  {}\n", i.value);
        }
    }
    return result;
}

std::string format_search_json(std::string_view query,
                               const std::vector<search_result>& repositories,
                               const std::vector<search_result>& images) {
    std::vector<json> names;
    for (auto& r : repositories) {
        names.push_back(json{{"name", r.value}});
    }
    std::vector<json> tags;
    for (auto& i : images) {
        const auto colon = i.value.find(':');
        tags.push_back(json{
            {"image", i.value.substr(0, colon)},
            {"tag", colon == std::string::npos ? ""
                                               : i.value.substr(colon + 1)},
            {"reference", i.value},
        });
    }
    json result;
    result["query"] = std::string(query);
    result["images"] =
        json{{"total_results", names.size()}, {"results", names}};
    result["tags"] = json{{"total_results", tags.size()}, {"results", tags}};
    return result.dump();
}

std::string format_registry_status(const registry_status& status) {
    std::string result;
    auto field = [&result](std::string_view name, const std::string& value) {
        result += fmt::format("{:<16}{}\n", color::white(name), value);
    };
    field("url", status.url);
    field("status", status.online ? color::green("online")
                                  : color::red("offline"));
    field("api version", status.api_version.value_or("-"));
    if (status.auth_required) {
        field("authentication",
              status.authenticated ? "required, credentials were rejected"
                                   : "required, no credentials provided");
    } else {
        field("authentication", status.authenticated ? "accepted" : "none");
    }
    if (status.error && !status.auth_required) {
        field("error", status.error->message);
    }
    return result;
}

std::string format_registry_status_json(const registry_status& status) {
    return json{
        {"url", status.url},
        {"online", status.online},
        {"auth_required", status.auth_required},
        {"authenticated", status.authenticated},
        {"api_version",
         status.api_version ? json(*status.api_version) : json(nullptr)},
        {"error", status.error ? json(status.error->message) : json(nullptr)},
    }
        .dump();
}

std::string format_sync_stats(const sync_stats& stats) {
    return fmt::format("{:<18}{}\n{:<18}{}\n{:<18}{}\n{:<18}{}\n",
                       "repositories", stats.repositories, "tags", stats.tags,
                       "manifests", stats.manifests, "failures",
                       stats.failures.size());
}

std::string format_sync_stats_json(const sync_stats& stats,
                                   const cache_stats& cache) {
    std::vector<json> failures;
    for (auto& f : stats.failures) {
        failures.push_back(json{{"item", f.item}, {"error", f.error.message}});
    }
    return json{
        {"repositories", stats.repositories},
        {"tags", stats.tags},
        {"manifests", stats.manifests},
        {"cancelled", stats.cancelled},
        {"failures", failures},
        {"cache", json{{"content_entries", cache.content_entries},
                       {"listing_entries", cache.listing_entries},
                       {"size", cache.bytes}}},
    }
        .dump();
}

} // namespace rex
