#include <catch2/catch_all.hpp>

#include <util/color.h>
#include <util/envvars.h>

TEST_CASE("default color", "[color]") {
    envvars::state env{};
    env.set("CLICOLOR_FORCE", "1");
    REQUIRE(color::default_color(env));

    env.set("NO_COLOR", "");
    REQUIRE(!color::default_color(env));

    env.unset("NO_COLOR");
    env.set("CLICOLOR_FORCE", "0");
    env.set("TERM", "dumb");
    REQUIRE(!color::default_color(env));
}

TEST_CASE("styled text", "[color]") {
    color::set_color(false);
    REQUIRE(color::red("failed") == "failed");
    REQUIRE(color::yellow(42) == "42");

    color::set_color(true);
    const auto styled = color::red("failed");
    REQUIRE(styled != "failed");
    REQUIRE(styled.find("failed") != std::string::npos);
    color::set_color(false);
}
