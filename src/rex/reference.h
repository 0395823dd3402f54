#pragma once

#include <optional>
#include <string>

#include <util/expected.h>

#include <rex/digest.h>

namespace rex {

struct parse_error;

// the registry used when a reference does not name one
constexpr const char* default_registry = "docker.io";

// a validated image reference:
//
//   [registry/]repository[:tag][@digest]
//
// e.g.
//   alpine
//   ghcr.io/org/tool:v1.2
//   localhost:5000/team/app@sha256:...
class reference {
  public:
    static util::expected<reference, parse_error> parse(const std::string& in);

    const std::string& registry() const {
        return registry_;
    }
    const std::string& repository() const {
        return repository_;
    }
    const std::optional<std::string>& tag() const {
        return tag_;
    }
    const std::optional<rex::digest>& digest() const {
        return digest_;
    }

    // true if the input named the registry explicitly
    bool has_registry() const {
        return explicit_registry_;
    }

    // the repository path used in API requests.
    // Docker Hub stores official images under library/, which users omit.
    std::string qualified_repository(bool dockerhub_compat) const;

    // the reference used in a manifest request: the digest if present,
    // otherwise the tag, otherwise "latest"
    std::string api_reference() const;

    // the normalized string form: registry/repository[:tag][@digest]
    std::string string() const;

    // compares registry, repository, tag and digest
    bool operator==(const reference&) const;

  private:
    reference() = default;

    std::string registry_ = default_registry;
    std::string repository_;
    std::optional<std::string> tag_;
    std::optional<rex::digest> digest_;
    bool explicit_registry_ = false;

    friend util::expected<reference, parse_error>
    parse_reference(const std::string& in);
};

} // namespace rex

#include <fmt/core.h>

template <> class fmt::formatter<rex::reference> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(rex::reference const& r, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", r.string());
    }
};
