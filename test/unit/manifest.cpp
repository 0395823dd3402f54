#include <string>
#include <variant>

#include <catch2/catch_all.hpp>
#include <fmt/core.h>

#include <rex/manifest.h>
#include <rex/oci.h>

namespace {

std::string sha(char c) {
    return "sha256:" + std::string(64, c);
}

const std::string image_json = fmt::format(
    R"({{
  "schemaVersion": 2,
  "mediaType": "application/vnd.oci.image.manifest.v1+json",
  "config": {{
    "mediaType": "application/vnd.oci.image.config.v1+json",
    "digest": "{}",
    "size": 1469
  }},
  "layers": [
    {{"mediaType": "application/vnd.oci.image.layer.v1.tar+gzip",
      "digest": "{}", "size": 3000000}},
    {{"mediaType": "application/vnd.oci.image.layer.v1.tar+gzip",
      "digest": "{}", "size": 1024}}
  ]
}})",
    sha('c'), sha('a'), sha('b'));

const std::string index_json = fmt::format(
    R"({{
  "schemaVersion": 2,
  "mediaType": "application/vnd.oci.image.index.v1+json",
  "manifests": [
    {{"mediaType": "application/vnd.oci.image.manifest.v1+json",
      "digest": "{}", "size": 500,
      "platform": {{"os": "linux", "architecture": "amd64"}}}},
    {{"mediaType": "application/vnd.oci.image.manifest.v1+json",
      "digest": "{}", "size": 600,
      "platform": {{"os": "linux", "architecture": "arm64", "variant": "v8"}}}},
    {{"mediaType": "application/vnd.oci.image.manifest.v1+json",
      "digest": "{}", "size": 700,
      "platform": {{"os": "unknown", "architecture": "unknown"}}}}
  ]
}})",
    sha('1'), sha('2'), sha('3'));

} // namespace

TEST_CASE("image manifest", "[manifest]") {
    auto result = rex::parse_manifest(image_json);
    REQUIRE(result);
    auto* image = std::get_if<rex::image_manifest>(&*result);
    REQUIRE(image);
    REQUIRE(image->media_type == rex::media_type::oci_manifest);
    REQUIRE(image->config.digest.string() == sha('c'));
    REQUIRE(image->config.size == 1469u);
    REQUIRE(image->layers.size() == 2u);
    REQUIRE(image->layers[0].digest.string() == sha('a'));
    REQUIRE(!image->layers[0].platform);
    // the size of an image is the sum of its layers
    REQUIRE(image->size() == 3001024u);
}

TEST_CASE("image index", "[manifest]") {
    auto result = rex::parse_manifest(index_json);
    REQUIRE(result);
    auto* index = std::get_if<rex::image_index>(&*result);
    REQUIRE(index);
    REQUIRE(index->manifests.size() == 3u);
    REQUIRE(index->size() == 1800u);

    auto platforms = index->platforms();
    REQUIRE(platforms.size() == 3u);
    REQUIRE(platforms[0].string() == "linux/amd64");
    REQUIRE(platforms[1].string() == "linux/arm64/v8");
}

TEST_CASE("document type detection", "[manifest]") {
    const auto layers = fmt::format(
        R"("config": {{"digest": "{}", "size": 1}}, "layers": [])", sha('c'));

    {
        // no mediaType: the content type of the response is used
        auto result = rex::parse_manifest(
            fmt::format(R"({{"schemaVersion": 2, {}}})", layers),
            "application/vnd.docker.distribution.manifest.v2+json");
        REQUIRE(result);
        REQUIRE(std::holds_alternative<rex::image_manifest>(*result));
    }
    {
        // parameters of the content type are ignored
        auto result = rex::parse_manifest(
            R"({"manifests": []})",
            "application/vnd.docker.distribution.manifest.list.v2+json; "
            "charset=utf-8");
        REQUIRE(result);
        REQUIRE(std::holds_alternative<rex::image_index>(*result));
    }
    {
        // no type information: the fields decide
        auto result = rex::parse_manifest(R"({"manifests": []})");
        REQUIRE(result);
        REQUIRE(std::holds_alternative<rex::image_index>(*result));

        result = rex::parse_manifest(fmt::format("{{{}}}", layers),
                                     "application/json");
        REQUIRE(result);
        REQUIRE(std::holds_alternative<rex::image_manifest>(*result));
    }
}

TEST_CASE("invalid manifests", "[manifest]") {
    using enum rex::error_kind;
    auto kind = [](const std::string& body) {
        auto result = rex::parse_manifest(body);
        REQUIRE(!result);
        return result.error().kind;
    };

    REQUIRE(kind("") == protocol);
    REQUIRE(kind("{") == protocol);
    REQUIRE(kind("[]") == protocol);
    REQUIRE(kind(R"({"mediaType": "application/vnd.example+json"})") ==
            protocol);
    // a descriptor without a size
    REQUIRE(kind(fmt::format(R"({{"config": {{"digest": "{}"}}, "layers": []}})",
                             sha('c'))) == protocol);
    // a descriptor with an invalid digest
    REQUIRE(kind(R"({"config": {"digest": "sha256:invalid-digest", "size": 1},
                     "layers": []})") == validation);
    REQUIRE(kind(fmt::format(R"({{"manifests": [{{"digest": "{}", "size": 1,
                     "platform": {{"os": "linux"}}}}]}})",
                             sha('1'))) == protocol);
}

TEST_CASE("image config", "[manifest]") {
    {
        auto result = rex::parse_image_config(
            R"({"created": "2024-01-15T10:30:00Z", "os": "linux",
                "architecture": "arm64", "variant": "v8", "config": {}})");
        REQUIRE(result);
        REQUIRE(result->created);
        REQUIRE(result->platform().string() == "linux/arm64/v8");
    }
    {
        auto result = rex::parse_image_config(R"({"os": "linux"})");
        REQUIRE(result);
        REQUIRE(!result->created);
        REQUIRE(result->architecture == "unknown");
    }
    {
        // an invalid date is dropped
        auto result = rex::parse_image_config(
            R"({"created": "last tuesday", "os": "linux",
                "architecture": "amd64"})");
        REQUIRE(result);
        REQUIRE(!result->created);
        REQUIRE(result->platform().string() == "linux/amd64");
    }
    REQUIRE(!rex::parse_image_config("not json"));
    REQUIRE(!rex::parse_image_config("42"));
}

TEST_CASE("select platform", "[manifest]") {
    auto result = rex::parse_manifest(index_json);
    REQUIRE(result);
    auto& index = std::get<rex::image_index>(*result);

    auto select = [&index](rex::platform p) {
        return rex::select_platform(index, p);
    };

    {
        auto d = select({"linux", "amd64", std::nullopt});
        REQUIRE(d);
        REQUIRE(d->digest.string() == sha('1'));
    }
    {
        // a selector without a variant matches any variant
        auto d = select({"linux", "arm64", std::nullopt});
        REQUIRE(d);
        REQUIRE(d->digest.string() == sha('2'));
    }
    {
        auto d = select({"linux", "arm64", "v8"});
        REQUIRE(d);
        REQUIRE(d->digest.string() == sha('2'));
    }
    {
        auto d = select({"linux", "arm64", "v7"});
        REQUIRE(!d);
        REQUIRE(d.error().kind == rex::error_kind::not_found);
    }
    REQUIRE(!select({"windows", "amd64", std::nullopt}));
}

TEST_CASE("platform matches", "[manifest]") {
    const rex::platform amd64{"linux", "amd64", std::nullopt};
    const rex::platform arm64v8{"linux", "arm64", "v8"};
    REQUIRE(amd64.matches(amd64));
    REQUIRE(!amd64.matches(arm64v8));
    REQUIRE(rex::platform{"linux", "arm64", std::nullopt}.matches(arm64v8));
    REQUIRE(!arm64v8.matches({"linux", "arm64", std::nullopt}));
    REQUIRE(fmt::format("{}", arm64v8) == "linux/arm64/v8");
}
