#include <chrono>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>

#include <rex/fetcher.h>
#include <rex/parse.h>
#include <rex/manifest.h>
#include <rex/print.h>
#include <util/color.h>
#include <util/strings.h>

using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {
const rex::timestamp now =
    std::chrono::sys_days{std::chrono::year{2024} / 6 / 1} + 12h;

rex::digest sha(char c) {
    return rex::digest::parse("sha256:" + std::string(64, c)).value();
}
} // namespace

TEST_CASE("format_size", "[print]") {
    REQUIRE(rex::format_size(0) == "0 B");
    REQUIRE(rex::format_size(512) == "512 B");
    REQUIRE(rex::format_size(1023) == "1023 B");
    REQUIRE(rex::format_size(1024) == "1 KiB");
    REQUIRE(rex::format_size(5 * 1024) == "5 KiB");
    REQUIRE(rex::format_size(1536) == "1.5 KiB");
    REQUIRE(rex::format_size(1572864) == "1.5 MiB");
    REQUIRE(rex::format_size(1234567) == "1.18 MiB");
    REQUIRE(rex::format_size(3ull << 30) == "3 GiB");
    REQUIRE(rex::format_size(1ull << 40) == "1 TiB");
}

TEST_CASE("format_relative_time", "[print]") {
    using rex::format_relative_time;
    REQUIRE(format_relative_time(now + 1h, now) == "in the future");
    REQUIRE(format_relative_time(now, now) == "just now");
    REQUIRE(format_relative_time(now - 59s, now) == "just now");
    REQUIRE(format_relative_time(now - 60s, now) == "a minute ago");
    REQUIRE(format_relative_time(now - 5min, now) == "5 minutes ago");
    REQUIRE(format_relative_time(now - 1h, now) == "an hour ago");
    REQUIRE(format_relative_time(now - 3h, now) == "3 hours ago");
    REQUIRE(format_relative_time(now - 24h, now) == "a day ago");
    REQUIRE(format_relative_time(now - 24h * 6, now) == "6 days ago");
    REQUIRE(format_relative_time(now - 24h * 30, now) == "a month ago");
    REQUIRE(format_relative_time(now - 24h * 95, now) == "3 months ago");
    REQUIRE(format_relative_time(now - 24h * 365, now) == "a year ago");
    REQUIRE(format_relative_time(now - 24h * 365 * 4, now) == "4 years ago");
}

TEST_CASE("format_timestamp", "[print]") {
    REQUIRE(rex::format_timestamp(now) == "2024-06-01T12:00:00Z");
}

TEST_CASE("output format", "[print]") {
    REQUIRE(rex::get_output_format(false, false).value() ==
            rex::output_format::table);
    REQUIRE(rex::get_output_format(true, false).value() ==
            rex::output_format::table_no_header);
    REQUIRE(rex::get_output_format(false, true).value() ==
            rex::output_format::json);
    REQUIRE(!rex::get_output_format(true, true));
}

TEST_CASE("tags table", "[print]") {
    color::set_color(false);

    std::vector<rex::tag_info> tags{
        {.name = "latest",
         .digest = sha('a'),
         .size = 5 * 1024,
         .last_modified = now - 3h,
         .platforms = {"linux/amd64", "linux/arm64"}},
        {.name = "v1.0-rc1",
         .digest = std::nullopt,
         .size = std::nullopt,
         .last_modified = std::nullopt,
         .platforms = {}},
    };

    const auto table = rex::format_tags_table(tags, now);
    const auto lines = util::split(table, '\n', true);
    REQUIRE(lines.size() == 3u);
    REQUIRE(lines[0].starts_with("tag"));
    REQUIRE(lines[0].find("digest") != std::string::npos);
    REQUIRE(lines[1].starts_with("latest "));
    REQUIRE(lines[1].find("sha256:aaaaaaaaaaaa ") != std::string::npos);
    REQUIRE(lines[1].find("5 KiB") != std::string::npos);
    REQUIRE(lines[1].find("3 hours ago") != std::string::npos);
    REQUIRE(lines[1].ends_with("linux/amd64,linux/arm64"));
    REQUIRE(lines[2].starts_with("v1.0-rc1 "));
    REQUIRE(lines[2].ends_with("-"));

    // the columns are aligned
    REQUIRE(lines[1].find("sha256") == lines[2].find(" -") + 1);

    const auto no_header = rex::format_tags_table(tags, now, true);
    REQUIRE(util::split(no_header, '\n', true).size() == 2u);

    REQUIRE(rex::format_tags_table({}, now) == "no tags\n");
    REQUIRE(rex::format_tags_table({}, now, true) == "");
}

TEST_CASE("tags json", "[print]") {
    std::vector<rex::tag_info> tags{
        {.name = "latest",
         .digest = sha('a'),
         .size = 100,
         .last_modified = now,
         .platforms = {"linux/amd64"}},
        {.name = "old",
         .digest = std::nullopt,
         .size = std::nullopt,
         .last_modified = std::nullopt,
         .platforms = {}},
    };
    const auto raw = json::parse(rex::format_tags_json(tags));
    REQUIRE(raw["tags"].size() == 2u);
    auto& t = raw["tags"][0];
    REQUIRE(t["name"] == "latest");
    REQUIRE(t["digest"] == sha('a').string());
    REQUIRE(t["size"] == 100);
    REQUIRE(t["created"] == "2024-06-01T12:00:00Z");
    REQUIRE(t["platforms"][0] == "linux/amd64");
    REQUIRE(raw["tags"][1]["digest"].is_null());
    REQUIRE(raw["tags"][1]["created"].is_null());
}

TEST_CASE("repositories", "[print]") {
    color::set_color(false);

    std::vector<rex::repository_item> repos{
        {.name = "library/ubuntu",
         .tag_count = 12,
         .size = 1572864,
         .last_updated = now - 24h * 2},
        {.name = "empty",
         .tag_count = 0,
         .size = std::nullopt,
         .last_updated = std::nullopt},
    };
    const auto lines =
        util::split(rex::format_repositories_table(repos, now), '\n', true);
    REQUIRE(lines.size() == 3u);
    REQUIRE(lines[0].starts_with("repository"));
    REQUIRE(lines[1].starts_with("library/ubuntu "));
    REQUIRE(lines[1].find("12") != std::string::npos);
    REQUIRE(lines[1].find("1.5 MiB") != std::string::npos);
    REQUIRE(lines[1].ends_with("2 days ago"));
    REQUIRE(lines[2].ends_with("-"));

    REQUIRE(rex::format_repositories_table({}, now) == "no repositories\n");

    const auto raw = json::parse(rex::format_repositories_json(repos));
    REQUIRE(raw["repositories"][0]["name"] == "library/ubuntu");
    REQUIRE(raw["repositories"][0]["tags"] == 12);
    REQUIRE(raw["repositories"][1]["size"].is_null());
}

TEST_CASE("manifest", "[print]") {
    color::set_color(false);

    rex::image_manifest image{
        .media_type = std::string(rex::media_type::oci_manifest),
        .config = {.media_type = std::string(rex::media_type::oci_config),
                   .digest = sha('c'),
                   .size = 100,
                   .platform = std::nullopt},
        .layers = {{.media_type = "layer",
                    .digest = sha('1'),
                    .size = 1024,
                    .platform = std::nullopt},
                   {.media_type = "layer",
                    .digest = sha('2'),
                    .size = 2048,
                    .platform = std::nullopt}},
    };
    rex::fetched_manifest fetched{.digest = sha('d'),
                                  .media_type = image.media_type,
                                  .document = image,
                                  .index = sha('e')};
    rex::image_config config{.created = now - 1h,
                             .os = "linux",
                             .architecture = "arm64",
                             .variant = "v8"};

    const auto text = rex::format_manifest(fetched, config, now);
    REQUIRE(text.find(sha('d').string()) != std::string::npos);
    REQUIRE(text.find(sha('e').string()) != std::string::npos);
    REQUIRE(text.find("3 KiB") != std::string::npos);
    REQUIRE(text.find("linux/arm64/v8") != std::string::npos);
    REQUIRE(text.find("an hour ago") != std::string::npos);
    REQUIRE(text.find(sha('2').string()) != std::string::npos);

    const auto raw = json::parse(rex::format_manifest_json(fetched, config));
    REQUIRE(raw["digest"] == sha('d').string());
    REQUIRE(raw["index"] == sha('e').string());
    REQUIRE(raw["size"] == 3072);
    REQUIRE(raw["layers"].size() == 2u);
    REQUIRE(raw["config"]["digest"] == sha('c').string());
    REQUIRE(raw["platform"] == "linux/arm64/v8");

    // without a config
    const auto plain = json::parse(rex::format_manifest_json(fetched, {}));
    REQUIRE(!plain.contains("platform"));
}

TEST_CASE("failures and stats", "[print]") {
    color::set_color(false);

    std::vector<rex::fetch_failure> failures{
        {.item = "v1",
         .error = {rex::error_kind::not_found, "manifest unknown"}},
    };
    REQUIRE(rex::format_failures(failures) ==
            "failed v1: not found: manifest unknown\n");
    REQUIRE(rex::format_failures({}) == "");

    rex::cache_stats stats{.content_entries = 3,
                           .listing_entries = 2,
                           .bytes = 2048,
                           .memory_entries = 0};
    const auto text = rex::format_cache_stats(stats);
    REQUIRE(text.find("content entries   3") != std::string::npos);
    REQUIRE(text.find("2 KiB") != std::string::npos);
}

TEST_CASE("search results", "[print]") {
    color::set_color(false);

    const std::vector<rex::search_result> repos{{"alpine", 72}};
    const std::vector<rex::search_result> images{{"alpine:latest", 72},
                                                 {"alpine:3.19", 60}};
    REQUIRE(rex::format_search(repos, images) ==
            "images\n  alpine\n\ntags\n  alpine:latest\n  alpine:3.19\n");
    REQUIRE(rex::format_search({}, images) ==
            "tags\n  alpine:latest\n  alpine:3.19\n");
    REQUIRE(rex::format_search({}, {}) == "no results found\n");

    const auto raw =
        json::parse(rex::format_search_json("alp", repos, images));
    REQUIRE(raw["query"] == "alp");
    REQUIRE(raw["images"]["total_results"] == 1);
    REQUIRE(raw["images"]["results"][0]["name"] == "alpine");
    REQUIRE(raw["tags"]["total_results"] == 2);
    REQUIRE(raw["tags"]["results"][1]["image"] == "alpine");
    REQUIRE(raw["tags"]["results"][1]["tag"] == "3.19");
    REQUIRE(raw["tags"]["results"][1]["reference"] == "alpine:3.19");
}

TEST_CASE("registry status", "[print]") {
    color::set_color(false);

    rex::registry_status online{.url = "https://registry.test",
                                .online = true,
                                .auth_required = false,
                                .authenticated = false,
                                .api_version = "registry/2.0",
                                .error = std::nullopt};
    auto text = rex::format_registry_status(online);
    REQUIRE(text.find("online") != std::string::npos);
    REQUIRE(text.find("registry/2.0") != std::string::npos);

    rex::registry_status denied{
        .url = "https://registry.test",
        .online = true,
        .auth_required = true,
        .authenticated = false,
        .api_version = std::nullopt,
        .error = rex::error{rex::error_kind::unauthorized, "denied"}};
    text = rex::format_registry_status(denied);
    REQUIRE(text.find("no credentials provided") != std::string::npos);

    auto raw = json::parse(rex::format_registry_status_json(denied));
    REQUIRE(raw["online"] == true);
    REQUIRE(raw["auth_required"] == true);
    REQUIRE(raw["authenticated"] == false);
    REQUIRE(raw["api_version"].is_null());
    REQUIRE(raw["error"] == "denied");
}

TEST_CASE("sync stats", "[print]") {
    color::set_color(false);

    rex::sync_stats stats;
    stats.repositories = 2;
    stats.tags = 5;
    stats.manifests = 4;
    stats.failures.push_back(
        {.item = "app:v1",
         .error = {rex::error_kind::unauthorized, "denied"}});

    const auto text = rex::format_sync_stats(stats);
    REQUIRE(text.find("repositories      2") != std::string::npos);
    REQUIRE(text.find("failures          1") != std::string::npos);

    rex::cache_stats cache{.content_entries = 8,
                           .listing_entries = 3,
                           .bytes = 4096,
                           .memory_entries = 0};
    const auto raw = json::parse(rex::format_sync_stats_json(stats, cache));
    REQUIRE(raw["tags"] == 5);
    REQUIRE(raw["manifests"] == 4);
    REQUIRE(raw["failures"][0]["item"] == "app:v1");
    REQUIRE(raw["cache"]["content_entries"] == 8);
    REQUIRE(raw["cache"]["size"] == 4096);
}
