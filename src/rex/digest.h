#pragma once

#include <string>
#include <string_view>

#include <util/expected.h>
#include <util/hash.h>

#include <rex/error.h>

namespace rex {

struct parse_error;

// a validated content digest of the form algorithm:hex, e.g.
//   sha256:7173b809ca12ec5dee4506cd86be934c4596dd234ee82c0662eac04a8c2c71dc
//
// digests can only be created by parsing or by hashing a payload, so a digest
// value is always well formed.
class digest {
  public:
    static util::expected<digest, parse_error> parse(const std::string& in);

    // the digest of payload
    static util::expected<digest, error>
    compute(std::string_view payload,
            util::hash_algorithm algorithm = util::hash_algorithm::sha256);

    // returns true if payload hashes to this digest
    bool verify(std::string_view payload) const;

    const std::string& algorithm() const {
        return algorithm_;
    }
    const std::string& hex() const {
        return hex_;
    }
    std::string string() const {
        return algorithm_ + ":" + hex_;
    }

    bool operator==(const digest&) const = default;
    auto operator<=>(const digest&) const = default;

  private:
    digest(std::string algorithm, std::string hex)
        : algorithm_(std::move(algorithm)), hex_(std::move(hex)) {
    }

    std::string algorithm_;
    std::string hex_;

    friend util::expected<digest, parse_error>
    parse_digest(const std::string& in);
};

// the number of hex characters in a digest of a supported algorithm, or 0 if
// the algorithm is not supported
unsigned digest_length(std::string_view algorithm);

} // namespace rex

#include <fmt/core.h>

template <> class fmt::formatter<rex::digest> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(rex::digest const& d, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}:{}", d.algorithm(), d.hex());
    }
};
