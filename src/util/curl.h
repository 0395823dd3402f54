#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <util/expected.h>

#include <curl/curl.h>
#include <curl/easy.h>

namespace util {
namespace curl {

struct error {
    CURLcode code;
    std::string message;
};

struct request {
    std::string url;
    // extra request headers of the form "Name: value"
    std::vector<std::string> headers;
    // basic authentication
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds timeout{30000};
};

struct response {
    long status = 0;
    std::string body;
    // header names are stored in lower case
    std::unordered_map<std::string, std::string> headers;

    std::optional<std::string> header(std::string_view name) const;
};

// perform a GET request.
// an HTTP error status is not an error: the caller inspects response::status.
expected<response, error> get(const request& req);

// parse an HTTP date, e.g. "Wed, 21 Oct 2015 07:28:00 GMT"
std::optional<std::chrono::system_clock::time_point>
parse_http_date(const std::string& date);

} // namespace curl
} // namespace util

#include <fmt/core.h>

template <> class fmt::formatter<util::curl::error> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(util::curl::error const& e, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "curl error {}: {}",
                              static_cast<int>(e.code), e.message);
    }
};
