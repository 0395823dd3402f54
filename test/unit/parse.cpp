#include <chrono>
#include <string>

#include <catch2/catch_all.hpp>
#include <fmt/core.h>

#include <rex/parse.h>
#include <util/lex.h>

namespace chr = std::chrono;

namespace {
rex::timestamp utc(int y, unsigned m, unsigned d, unsigned h = 0,
                   unsigned min = 0, unsigned s = 0) {
    return chr::sys_days{chr::year{y} / chr::month{m} / chr::day{d}} +
           chr::hours{h} + chr::minutes{min} + chr::seconds{s};
}
} // namespace

TEST_CASE("timestamp", "[parse]") {
    {
        auto result = rex::parse_timestamp("2024-01-15T10:30:00Z");
        REQUIRE(result);
        REQUIRE(*result == utc(2024, 1, 15, 10, 30, 0));
    }
    {
        // lower case separators and a space between date and time
        REQUIRE(rex::parse_timestamp("2024-01-15t10:30:00z").value() ==
                utc(2024, 1, 15, 10, 30, 0));
        REQUIRE(rex::parse_timestamp("2024-01-15 10:30:00Z").value() ==
                utc(2024, 1, 15, 10, 30, 0));
    }
    {
        // offsets are converted to UTC
        REQUIRE(rex::parse_timestamp("2024-01-15T12:30:00+02:00").value() ==
                utc(2024, 1, 15, 10, 30, 0));
        REQUIRE(rex::parse_timestamp("2024-01-15T08:30:00-02:00").value() ==
                utc(2024, 1, 15, 10, 30, 0));
        REQUIRE(rex::parse_timestamp("2024-01-01T01:00:00+02:00").value() ==
                utc(2023, 12, 31, 23, 0, 0));
    }
    {
        // fractional seconds
        auto result = rex::parse_timestamp("2024-10-15T11:46:22.533Z");
        REQUIRE(result);
        REQUIRE(*result - utc(2024, 10, 15, 11, 46, 22) ==
                chr::milliseconds(533));
        result = rex::parse_timestamp("2024-10-15T11:46:22.123456789123Z");
        REQUIRE(result);
        REQUIRE(chr::duration_cast<chr::nanoseconds>(
                    *result - utc(2024, 10, 15, 11, 46, 22)) >=
                chr::microseconds(123456));
    }
    {
        // leading and trailing white space is ignored
        REQUIRE(rex::parse_timestamp("  2024-02-29T00:00:00Z \n").value() ==
                utc(2024, 2, 29));
    }
    for (auto in :
         {"", "2024", "2024-01-15", "2024-01-15T10:30", "2024-01-15T10:30:00",
          "2024-13-01T00:00:00Z", "2023-02-29T00:00:00Z", "2024-01-15T24:00:00Z",
          "2024-01-15T10:60:00Z", "2024-01-15T10:30:00+25:00",
          "2024-01-15T10:30:00Zx", "2024-01-15X10:30:00Z",
          "2024-01-15T10:30:00.Z", "yesterday"}) {
        CAPTURE(in);
        REQUIRE(!rex::parse_timestamp(in));
    }
}

TEST_CASE("platform", "[parse]") {
    {
        auto result = rex::parse_platform("linux/amd64");
        REQUIRE(result);
        REQUIRE(result->os == "linux");
        REQUIRE(result->architecture == "amd64");
        REQUIRE(!result->variant);
    }
    {
        auto result = rex::parse_platform("linux/arm64/v8");
        REQUIRE(result);
        REQUIRE(result->os == "linux");
        REQUIRE(result->architecture == "arm64");
        REQUIRE(result->variant == "v8");
        REQUIRE(result->string() == "linux/arm64/v8");
    }
    {
        auto result = rex::parse_platform(" windows/amd64 ");
        REQUIRE(result);
        REQUIRE(result->os == "windows");
    }
    for (auto in : {"", "linux", "linux/", "/amd64", "linux/amd64/",
                    "linux/amd64/v8/x", "linux amd64", "linux/-amd64",
                    "linux/amd64@v8"}) {
        CAPTURE(in);
        REQUIRE(!rex::parse_platform(in));
    }
}

TEST_CASE("parse_error message", "[parse]") {
    auto result = rex::parse_platform("linux/amd64@v8");
    REQUIRE(!result);
    auto e = result.error();
    REQUIRE(e.loc == 11u);
    // the message points at the location of the error
    REQUIRE(e.message().find("linux/amd64@v8\n") != std::string::npos);
    REQUIRE(e.message().find(std::string(11, ' ') + "^") != std::string::npos);

    e.description = "invalid platform";
    REQUIRE(e.message().starts_with("invalid platform: "));
}

TEST_CASE("config_line", "[parse]") {
    for (auto in : {"", " ", "  ", " \t ", "# comment", "    # comment ##"}) {
        auto result = rex::parse_config_line(in);
        // successful parse
        REQUIRE(result);
        // parsed result should evaluate to false (empty line)
        REQUIRE(!(*result));
    }
    for (auto in : {"a=b", " a=b ", "a = b", "a = b    \t"}) {
        auto result = rex::parse_config_line(in);
        REQUIRE(result);
        REQUIRE(result->key == "a");
        REQUIRE(result->value == "b");
    }
    for (auto in : {"registry=", "registry = "}) {
        auto result = rex::parse_config_line(in);
        REQUIRE(result);
        REQUIRE(result->key == "registry");
        REQUIRE(result->value.empty());
    }
    {
        auto result =
            rex::parse_config_line("registry = https://registry.example.com ");
        REQUIRE(result);
        REQUIRE(result->key == "registry");
        REQUIRE(result->value == "https://registry.example.com");
    }
    {
        auto result = rex::parse_config_line("cache = ${HOME}/.cache/rex");
        REQUIRE(result);
        REQUIRE(result->value == "${HOME}/.cache/rex");
    }
    for (auto valid_key : {"w", "color", "x2", "x_2", "tag-ttl",
                           "dockerhub-compat", "_hidden", "hidden_", "_"}) {
        auto result =
            rex::parse_config_line(fmt::format("{}=value", valid_key));
        REQUIRE(result);
        REQUIRE(result->key == valid_key);
        REQUIRE(result->value == "value");
    }
    for (auto invalid : {"2x=value", "-x=value", "4=value", "key value",
                         "key", "=value"}) {
        CAPTURE(invalid);
        REQUIRE(!rex::parse_config_line(invalid));
    }
}
