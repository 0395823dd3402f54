#include <chrono>
#include <string>

#include <catch2/catch_all.hpp>
#include <fmt/core.h>

#include <rex/client.h>
#include <util/curl.h>

using namespace std::chrono_literals;

TEST_CASE("normalize_url", "[client]") {
    REQUIRE(rex::normalize_url("registry.example.com") ==
            "http://registry.example.com");
    REQUIRE(rex::normalize_url("localhost:5000/") == "http://localhost:5000");
    REQUIRE(rex::normalize_url("https://ghcr.io") == "https://ghcr.io");
    REQUIRE(rex::normalize_url(" https://ghcr.io// ") == "https://ghcr.io");

    rex::http_client client("https://registry.example.com/");
    REQUIRE(client.url() == "https://registry.example.com");
}

TEST_CASE("parse_link_next", "[client]") {
    REQUIRE(rex::parse_link_next(
                R"(</v2/_catalog?last=b&n=2>; rel="next")") ==
            "/v2/_catalog?last=b&n=2");
    // unquoted and upper case relation types
    REQUIRE(rex::parse_link_next("</v2/x/tags/list?last=v2>; rel=NEXT") ==
            "/v2/x/tags/list?last=v2");
    // absolute URLs are returned unchanged
    REQUIRE(rex::parse_link_next(
                R"(<https://r.io/v2/_catalog?last=b>; rel="next")") ==
            "https://r.io/v2/_catalog?last=b");
    // several links
    REQUIRE(rex::parse_link_next(
                R"(</v2/_catalog?last=a>; rel="prev", </v2/_catalog?last=c>; rel="next")") ==
            "/v2/_catalog?last=c");
    // a list of relation types and extra parameters
    REQUIRE(rex::parse_link_next(
                R"(</page3>; title="more"; rel="last next")") == "/page3");

    REQUIRE(!rex::parse_link_next(""));
    REQUIRE(!rex::parse_link_next(R"(</v2/_catalog?last=a>; rel="prev")"));
    REQUIRE(!rex::parse_link_next(R"(</v2/_catalog?last=a>)"));
    REQUIRE(!rex::parse_link_next(R"(</v2/_catalog; rel="next")"));
}

TEST_CASE("parse_retry_after", "[client]") {
    const auto now = std::chrono::system_clock::from_time_t(1445412480);

    REQUIRE(rex::parse_retry_after("0", now) == 0s);
    REQUIRE(rex::parse_retry_after("5", now) == 5s);
    REQUIRE(rex::parse_retry_after(" 120 ", now) == 120s);

    // now is 2015-10-21T07:28:00Z
    REQUIRE(rex::parse_retry_after("Wed, 21 Oct 2015 07:30:00 GMT", now) ==
            120s);
    // dates in the past mean no delay
    REQUIRE(rex::parse_retry_after("Wed, 21 Oct 2015 07:00:00 GMT", now) ==
            0s);

    REQUIRE(!rex::parse_retry_after("", now));
    REQUIRE(!rex::parse_retry_after("soon", now));
    REQUIRE(!rex::parse_retry_after("99999999999999999999", now));
}

TEST_CASE("classify_response", "[client]") {
    using enum rex::error_kind;
    auto response = [](long status,
                       std::unordered_map<std::string, std::string> headers =
                           {}) {
        return util::curl::response{
            .status = status, .body = {}, .headers = std::move(headers)};
    };
    const std::string target = "https://r.io/v2/app/tags/list";

    {
        auto e = rex::classify_response(
            response(401, {{"www-authenticate",
                            R"(Bearer realm="https://auth.r.io/token")"}}),
            target);
        REQUIRE(e.kind == unauthorized);
        REQUIRE(e.status == 401);
        REQUIRE(e.message.find("Bearer realm") != std::string::npos);
    }
    REQUIRE(rex::classify_response(response(403), target).kind == unauthorized);
    {
        auto e = rex::classify_response(response(404), target);
        REQUIRE(e.kind == not_found);
        REQUIRE(e.message.find(target) != std::string::npos);
    }
    {
        auto e = rex::classify_response(response(429, {{"retry-after", "7"}}),
                                        target);
        REQUIRE(e.kind == rate_limited);
        REQUIRE(e.retry_after == 7s);
        REQUIRE(e.status == 429);
    }
    {
        auto e = rex::classify_response(response(429), target);
        REQUIRE(e.kind == rate_limited);
        REQUIRE(!e.retry_after);
    }
    REQUIRE(rex::classify_response(response(500), target).kind == transport);
    REQUIRE(rex::classify_response(response(503), target).kind == transport);
    REQUIRE(rex::classify_response(response(400), target).kind == protocol);
    REQUIRE(rex::classify_response(response(302), target).kind == protocol);
}

TEST_CASE("credentials are not printed", "[client]") {
    rex::credentials basic = rex::basic_credentials{"wombat", "s3cret"};
    rex::credentials bearer = rex::bearer_token{"abcdef"};

    auto b = fmt::format("{}", basic);
    REQUIRE(b.find("wombat") != std::string::npos);
    REQUIRE(b.find("s3cret") == std::string::npos);
    REQUIRE(fmt::format("{}", bearer).find("abcdef") == std::string::npos);
}

TEST_CASE("connection errors", "[client]") {
    // nothing listens on port 1
    rex::http_client client(
        "127.0.0.1:1", {.credentials = std::nullopt,
                        .timeout = 2000ms,
                        .connect_timeout = 1000ms,
                        .page_size = std::nullopt});
    auto result = client.ping();
    REQUIRE(!result);
    REQUIRE(result.error().kind == rex::error_kind::transport);

    auto tags = client.tags("app");
    REQUIRE(!tags);
    REQUIRE(tags.error().kind == rex::error_kind::transport);
}

TEST_CASE("url_origin", "[client]") {
    REQUIRE(rex::url_origin("https://registry.io") == "https://registry.io");
    REQUIRE(rex::url_origin("https://Registry.IO/v2/_catalog?n=10") ==
            "https://registry.io");
    REQUIRE(rex::url_origin("http://localhost:5000/v2/") ==
            "http://localhost:5000");
    REQUIRE(rex::url_origin("https://registry.io:443/v2/") ==
            "https://registry.io");
    REQUIRE(rex::url_origin("http://registry.io:80") == "http://registry.io");
    REQUIRE(rex::url_origin("https://user@registry.io/v2/") ==
            "https://registry.io");
}

TEST_CASE("credentials follow only same origin links", "[client]") {
    const std::string registry = "https://registry.io";

    // paths are relative to the registry
    REQUIRE(rex::sends_credentials(registry, "/v2/_catalog"));
    REQUIRE(rex::sends_credentials(registry,
                                   "/v2/app/tags/list?last=v9&n=100"));
    REQUIRE(rex::sends_credentials(registry,
                                   "https://registry.io/v2/_catalog?last=x"));
    REQUIRE(rex::sends_credentials(registry,
                                   "https://REGISTRY.io:443/v2/_catalog"));

    REQUIRE(!rex::sends_credentials(registry, "https://evil.test/v2/_catalog"));
    REQUIRE(!rex::sends_credentials(registry,
                                    "https://registry.io.evil.test/v2/"));
    REQUIRE(!rex::sends_credentials(registry,
                                    "https://registry.io@evil.test/v2/"));
    // a different scheme or port is another origin
    REQUIRE(!rex::sends_credentials(registry, "http://registry.io/v2/"));
    REQUIRE(!rex::sends_credentials(registry, "https://registry.io:8443/v2/"));
    REQUIRE(!rex::sends_credentials("http://localhost:5000",
                                    "http://localhost:5001/v2/"));
}
