#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include <util/strings.h>

TEST_CASE("strip", "[strings]") {
    REQUIRE(util::strip("wombat") == "wombat");
    REQUIRE(util::strip("wombat soup") == "wombat soup");
    REQUIRE(util::strip("wombat-soup") == "wombat-soup");
    REQUIRE(util::strip("wombat \nsoup") == "wombat \nsoup");
    REQUIRE(util::strip("") == "");
    REQUIRE(util::strip(" ") == "");
    REQUIRE(util::strip(" x") == "x");
    REQUIRE(util::strip("x ") == "x");
    REQUIRE(util::strip(" x ") == "x");
    REQUIRE(util::strip(" \n\f  ") == "");
    REQUIRE(util::strip(" wombat") == "wombat");
    REQUIRE(util::strip("wombat \n") == "wombat");
    REQUIRE(util::strip("\t\f\vwombat \n") == "wombat");
}

TEST_CASE("split", "[strings]") {
    using v = std::vector<std::string>;
    REQUIRE(util::split("", ',') == v{""});
    REQUIRE(util::split(",", ',') == v{"", ""});
    REQUIRE(util::split(",,", ',') == v{"", "", ""});
    REQUIRE(util::split(",a", ',') == v{"", "a"});
    REQUIRE(util::split("a,", ',') == v{"a", ""});
    REQUIRE(util::split("a", ',') == v{"a"});
    REQUIRE(util::split("a,b", ',') == v{"a", "b"});
    REQUIRE(util::split("a,b,c", ',') == v{"a", "b", "c"});
    REQUIRE(util::split("a,b,,c", ',') == v{"a", "b", "", "c"});

    REQUIRE(util::split("", ',', true) == v{});
    REQUIRE(util::split(",", ',', true) == v{});
    REQUIRE(util::split(",,", ',', true) == v{});
    REQUIRE(util::split(",a", ',', true) == v{"a"});
    REQUIRE(util::split("a,", ',', true) == v{"a"});
    REQUIRE(util::split("a", ',', true) == v{"a"});
    REQUIRE(util::split("a,b", ',', true) == v{"a", "b"});
    REQUIRE(util::split("a,b,c", ',', true) == v{"a", "b", "c"});
    REQUIRE(util::split("a,b,,c", ',', true) == v{"a", "b", "c"});
}

TEST_CASE("join", "[strings]") {
    using v = std::vector<std::string>;
    REQUIRE(util::join(",", v{}) == "");
    REQUIRE(util::join(",", v{"a"}) == "a");
    REQUIRE(util::join(",", v{"linux/amd64", "linux/arm64"}) ==
            "linux/amd64,linux/arm64");
    REQUIRE(util::join(", ", v{"a", "", "c"}) == "a, , c");
}

TEST_CASE("to_lower", "[strings]") {
    REQUIRE(util::to_lower("") == "");
    REQUIRE(util::to_lower("Docker-Content-Digest") == "docker-content-digest");
    REQUIRE(util::to_lower("rel=NEXT") == "rel=next");
}

TEST_CASE("percent_encode", "[strings]") {
    REQUIRE(util::percent_encode("") == "");
    REQUIRE(util::percent_encode("ubuntu_22.04-rc1") == "ubuntu_22.04-rc1");
    REQUIRE(util::percent_encode("library/ubuntu") == "library%2Fubuntu");
    REQUIRE(util::percent_encode("sha256:ab") == "sha256%3Aab");
    REQUIRE(util::percent_encode("a b") == "a%20b");
    // distinct inputs produce distinct file names
    REQUIRE(util::percent_encode("a/b") != util::percent_encode("a_b"));
    REQUIRE(util::percent_encode("%") == "%25");
}
