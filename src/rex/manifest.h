#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <util/expected.h>

#include <rex/digest.h>
#include <rex/error.h>
#include <rex/oci.h>

namespace rex {

// a reference to content in a manifest: a config, a layer or, in an index,
// a child manifest
struct descriptor {
    std::string media_type;
    rex::digest digest;
    std::uint64_t size;
    // only set for the children of an index
    std::optional<rex::platform> platform;
};

struct image_manifest {
    std::string media_type;
    descriptor config;
    std::vector<descriptor> layers;

    // the compressed size of the image: the sum of its layers
    std::uint64_t size() const;
};

struct image_index {
    std::string media_type;
    std::vector<descriptor> manifests;

    std::uint64_t size() const;
    std::vector<rex::platform> platforms() const;
};

struct image_config {
    std::optional<timestamp> created;
    std::string os;
    std::string architecture;
    std::optional<std::string> variant;

    rex::platform platform() const;
};

using manifest_document = std::variant<image_manifest, image_index>;

// parse a manifest or an index.
// the type is taken from the mediaType field of the document, then from the
// content type of the response, then from the fields that are present.
util::expected<manifest_document, error>
parse_manifest(std::string_view body, std::string_view content_type = "");

util::expected<image_config, error> parse_image_config(std::string_view body);

// find the child manifest of an index that matches the platform selector
util::expected<descriptor, error> select_platform(const image_index& index,
                                                  const rex::platform& selector);

} // namespace rex
