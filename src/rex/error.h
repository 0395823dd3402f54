#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace rex {

enum class error_kind {
    validation,      // a digest, reference or document failed validation
    unauthorized,    // 401 or 403 from the registry
    not_found,       // 404 from the registry, or no matching platform
    rate_limited,    // 429 from the registry
    transport,       // connection, DNS, timeout and 5xx server errors
    protocol,        // malformed responses and unexpected status codes
    cache_io,        // the cache could not be read or written
    cache_corrupt,   // a cache entry could not be decoded
    cache_integrity, // a payload does not match its digest
    cancelled,       // the task was not run because the batch was cancelled
};

struct error {
    error_kind kind;
    std::string message;
    // the delay requested by the registry in a Retry-After header
    std::optional<std::chrono::seconds> retry_after = std::nullopt;
    // the HTTP status, when the error was generated from a response
    std::optional<long> status = std::nullopt;
};

template <typename... T>
error make_error(error_kind kind, fmt::format_string<T...> fmt, T&&... args) {
    return error{kind, fmt::format(fmt, std::forward<T>(args)...)};
}

} // namespace rex

template <> class fmt::formatter<rex::error_kind> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(rex::error_kind k, FmtContext& ctx) const {
        using enum rex::error_kind;
        switch (k) {
        case validation:
            return fmt::format_to(ctx.out(), "validation");
        case unauthorized:
            return fmt::format_to(ctx.out(), "unauthorized");
        case not_found:
            return fmt::format_to(ctx.out(), "not found");
        case rate_limited:
            return fmt::format_to(ctx.out(), "rate limited");
        case transport:
            return fmt::format_to(ctx.out(), "transport");
        case protocol:
            return fmt::format_to(ctx.out(), "protocol");
        case cache_io:
            return fmt::format_to(ctx.out(), "cache io");
        case cache_corrupt:
            return fmt::format_to(ctx.out(), "cache corrupt");
        case cache_integrity:
            return fmt::format_to(ctx.out(), "cache integrity");
        case cancelled:
            return fmt::format_to(ctx.out(), "cancelled");
        }
        return fmt::format_to(ctx.out(), "unknown");
    }
};

template <> class fmt::formatter<rex::error> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(rex::error const& e, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}: {}", e.kind, e.message);
    }
};
