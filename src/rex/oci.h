#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace rex {

using timestamp = std::chrono::system_clock::time_point;

namespace media_type {
constexpr std::string_view oci_manifest =
    "application/vnd.oci.image.manifest.v1+json";
constexpr std::string_view oci_index = "application/vnd.oci.image.index.v1+json";
constexpr std::string_view oci_config = "application/vnd.oci.image.config.v1+json";
constexpr std::string_view docker_manifest =
    "application/vnd.docker.distribution.manifest.v2+json";
constexpr std::string_view docker_manifest_list =
    "application/vnd.docker.distribution.manifest.list.v2+json";
constexpr std::string_view docker_config =
    "application/vnd.docker.container.image.v1+json";

// the value of the Accept header sent with manifest requests
constexpr std::string_view manifest_accept =
    "application/vnd.oci.image.manifest.v1+json, "
    "application/vnd.oci.image.index.v1+json, "
    "application/vnd.docker.distribution.manifest.v2+json, "
    "application/vnd.docker.distribution.manifest.list.v2+json";

bool is_index(std::string_view type);
bool is_manifest(std::string_view type);
} // namespace media_type

// the platform that an image was built for, e.g. linux/arm64/v8
struct platform {
    std::string os;
    std::string architecture;
    std::optional<std::string> variant;

    // returns true if other satisfies this platform selector.
    // the variant is only compared when the selector has one.
    bool matches(const platform& other) const;

    std::string string() const;

    bool operator==(const platform&) const = default;
};

} // namespace rex

#include <fmt/core.h>

template <> class fmt::formatter<rex::platform> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(rex::platform const& p, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", p.string());
    }
};
