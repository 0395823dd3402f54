#include <string>
#include <string_view>

#include <fmt/core.h>

#include <rex/oci.h>

namespace rex {

namespace media_type {

bool is_index(std::string_view type) {
    return type == oci_index || type == docker_manifest_list;
}

bool is_manifest(std::string_view type) {
    return type == oci_manifest || type == docker_manifest;
}

} // namespace media_type

bool platform::matches(const platform& other) const {
    if (os != other.os || architecture != other.architecture) {
        return false;
    }
    return !variant || variant == other.variant;
}

std::string platform::string() const {
    if (variant) {
        return fmt::format("{}/{}/{}", os, architecture, *variant);
    }
    return fmt::format("{}/{}", os, architecture);
}

} // namespace rex
