#include <string>

#include <fmt/core.h>

#include <util/expected.h>

#include <rex/parse.h>
#include <rex/reference.h>

namespace rex {

util::expected<reference, parse_error> reference::parse(const std::string& in) {
    return parse_reference(in);
}

std::string reference::qualified_repository(bool dockerhub_compat) const {
    if (dockerhub_compat && repository_.find('/') == std::string::npos) {
        return "library/" + repository_;
    }
    return repository_;
}

std::string reference::api_reference() const {
    if (digest_) {
        return digest_->string();
    }
    return tag_.value_or("latest");
}

std::string reference::string() const {
    auto result = fmt::format("{}/{}", registry_, repository_);
    if (tag_) {
        result += ":" + *tag_;
    }
    if (digest_) {
        result += "@" + digest_->string();
    }
    return result;
}

bool reference::operator==(const reference& other) const {
    return registry_ == other.registry_ && repository_ == other.repository_ &&
           tag_ == other.tag_ && digest_ == other.digest_;
}

} // namespace rex
