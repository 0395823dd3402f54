#include <string>
#include <string_view>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <util/expected.h>
#include <util/hash.h>

#include <rex/digest.h>
#include <rex/error.h>
#include <rex/parse.h>

namespace rex {

unsigned digest_length(std::string_view algorithm) {
    if (algorithm == "sha256") {
        return 64;
    }
    if (algorithm == "sha512") {
        return 128;
    }
    return 0;
}

util::expected<digest, parse_error> digest::parse(const std::string& in) {
    return parse_digest(in);
}

util::expected<digest, error> digest::compute(std::string_view payload,
                                             util::hash_algorithm algorithm) {
    auto hex = util::hex_hash(payload, algorithm);
    if (!hex) {
        return util::unexpected(
            make_error(error_kind::validation, "unable to hash payload: {}",
                       hex.error()));
    }
    // the hash is validated like any other digest
    const char* name =
        algorithm == util::hash_algorithm::sha512 ? "sha512" : "sha256";
    auto result = parse_digest(fmt::format("{}:{}", name, *hex));
    if (!result) {
        return util::unexpected(make_error(error_kind::validation,
                                           "invalid computed digest: {}",
                                           result.error().message()));
    }
    return *result;
}

bool digest::verify(std::string_view payload) const {
    const auto algorithm = algorithm_ == "sha512" ? util::hash_algorithm::sha512
                                                  : util::hash_algorithm::sha256;
    auto hex = util::hex_hash(payload, algorithm);
    if (!hex) {
        spdlog::error("digest::verify unable to hash payload: {}", hex.error());
        return false;
    }
    return *hex == hex_;
}

} // namespace rex
