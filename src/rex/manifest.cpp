#include <numeric>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <util/expected.h>

#include <rex/error.h>
#include <rex/manifest.h>
#include <rex/parse.h>

namespace rex {

using json = nlohmann::json;

std::uint64_t image_manifest::size() const {
    return std::accumulate(
        layers.begin(), layers.end(), std::uint64_t{0},
        [](std::uint64_t sum, const descriptor& d) { return sum + d.size; });
}

std::uint64_t image_index::size() const {
    return std::accumulate(
        manifests.begin(), manifests.end(), std::uint64_t{0},
        [](std::uint64_t sum, const descriptor& d) { return sum + d.size; });
}

std::vector<rex::platform> image_index::platforms() const {
    std::vector<rex::platform> result;
    for (auto& m : manifests) {
        if (m.platform) {
            result.push_back(*m.platform);
        }
    }
    return result;
}

rex::platform image_config::platform() const {
    return {.os = os, .architecture = architecture, .variant = variant};
}

namespace {

std::optional<std::string> optional_string(const json& raw,
                                           const char* field) {
    if (raw.contains(field) && raw[field].is_string()) {
        return raw[field].get<std::string>();
    }
    return std::nullopt;
}

util::expected<descriptor, error> parse_descriptor(const json& raw) {
    if (!raw.is_object()) {
        return util::unexpected(
            error{error_kind::protocol, "descriptor is not an object"});
    }

    const auto digest_string = raw.at("digest").get<std::string>();
    auto d = parse_digest(digest_string);
    if (!d) {
        return util::unexpected(make_error(error_kind::validation,
                                           "invalid descriptor digest: {}",
                                           d.error().message()));
    }

    descriptor result{
        .media_type = optional_string(raw, "mediaType").value_or(""),
        .digest = *d,
        .size = raw.at("size").get<std::uint64_t>(),
        .platform = std::nullopt,
    };

    if (raw.contains("platform") && raw["platform"].is_object()) {
        auto& p = raw["platform"];
        result.platform = rex::platform{
            .os = p.at("os").get<std::string>(),
            .architecture = p.at("architecture").get<std::string>(),
            .variant = optional_string(p, "variant"),
        };
    }

    return result;
}

enum class document_kind { manifest, index, unknown };

document_kind classify(const json& raw, std::string_view content_type) {
    std::string type = optional_string(raw, "mediaType").value_or("");
    if (type.empty()) {
        // strip parameters, e.g. "application/json; charset=utf-8"
        type = std::string(content_type.substr(0, content_type.find(';')));
    }
    if (media_type::is_index(type)) {
        return document_kind::index;
    }
    if (media_type::is_manifest(type)) {
        return document_kind::manifest;
    }
    if (raw.contains("manifests")) {
        return document_kind::index;
    }
    if (raw.contains("layers") && raw.contains("config")) {
        return document_kind::manifest;
    }
    return document_kind::unknown;
}

} // namespace

util::expected<manifest_document, error>
parse_manifest(std::string_view body, std::string_view content_type) {
    try {
        const auto raw = json::parse(body);
        if (!raw.is_object()) {
            return util::unexpected(
                error{error_kind::protocol, "manifest is not a JSON object"});
        }
        const auto media = optional_string(raw, "mediaType").value_or("");

        switch (classify(raw, content_type)) {
        case document_kind::manifest: {
            auto config = parse_descriptor(raw.at("config"));
            if (!config) {
                return util::unexpected(std::move(config.error()));
            }
            image_manifest result{.media_type = media,
                                  .config = std::move(*config),
                                  .layers = {}};
            for (auto& layer : raw.at("layers")) {
                auto d = parse_descriptor(layer);
                if (!d) {
                    return util::unexpected(std::move(d.error()));
                }
                result.layers.push_back(std::move(*d));
            }
            spdlog::trace("parse_manifest: image manifest with {} layers",
                          result.layers.size());
            return result;
        }
        case document_kind::index: {
            image_index result{.media_type = media, .manifests = {}};
            for (auto& child : raw.at("manifests")) {
                auto d = parse_descriptor(child);
                if (!d) {
                    return util::unexpected(std::move(d.error()));
                }
                result.manifests.push_back(std::move(*d));
            }
            spdlog::trace("parse_manifest: image index with {} manifests",
                          result.manifests.size());
            return result;
        }
        case document_kind::unknown:
            break;
        }
        return util::unexpected(make_error(
            error_kind::protocol, "unsupported manifest type '{}'",
            media.empty() ? std::string(content_type) : media));
    } catch (json::exception& e) {
        return util::unexpected(
            make_error(error_kind::protocol, "invalid manifest: {}", e.what()));
    }
}

util::expected<image_config, error> parse_image_config(std::string_view body) {
    try {
        const auto raw = json::parse(body);
        if (!raw.is_object()) {
            return util::unexpected(error{error_kind::protocol,
                                          "image config is not a JSON object"});
        }
        image_config result{
            .created = std::nullopt,
            .os = optional_string(raw, "os").value_or("unknown"),
            .architecture =
                optional_string(raw, "architecture").value_or("unknown"),
            .variant = optional_string(raw, "variant"),
        };
        if (auto created = optional_string(raw, "created")) {
            if (auto t = parse_timestamp(*created)) {
                result.created = *t;
            } else {
                // a missing date is not fatal for listings
                spdlog::warn("image config has an invalid created date: {}",
                             t.error().message());
            }
        }
        return result;
    } catch (json::exception& e) {
        return util::unexpected(make_error(
            error_kind::protocol, "invalid image config: {}", e.what()));
    }
}

util::expected<descriptor, error>
select_platform(const image_index& index, const rex::platform& selector) {
    for (auto& m : index.manifests) {
        if (m.platform && selector.matches(*m.platform)) {
            spdlog::debug("select_platform: {} -> {}", selector, m.digest);
            return m;
        }
    }
    return util::unexpected(make_error(
        error_kind::not_found, "no manifest for platform {} in index", selector));
}

} // namespace rex
