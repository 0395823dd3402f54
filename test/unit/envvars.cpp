#include <catch2/catch_all.hpp>

#include <string>

#include <util/envvars.h>

namespace envvars {
bool validate_name(std::string_view name, bool strict = true);
}

TEST_CASE("validate envvar names", "[envvars]") {
    REQUIRE(envvars::validate_name("wombat", true));
    REQUIRE(envvars::validate_name("_", true));
    REQUIRE(envvars::validate_name("_WOMBAT", true));
    REQUIRE(envvars::validate_name("A", true));
    REQUIRE(envvars::validate_name("XDG_CACHE_HOME", true));
    REQUIRE(envvars::validate_name("P1", true));
    REQUIRE(envvars::validate_name("a123_4", true));

    REQUIRE(!envvars::validate_name("", true));
    REQUIRE(!envvars::validate_name("1A", true));
    REQUIRE(!envvars::validate_name("a-b", true));
    REQUIRE(!envvars::validate_name("b?", true));
    REQUIRE(!envvars::validate_name("wombat soup", true));

    // weak validation only rejects '='
    REQUIRE(envvars::validate_name("a-b", false));
    REQUIRE(!envvars::validate_name("a=b", false));
}

TEST_CASE("state set get unset", "[envvars]") {
    envvars::state env;
    REQUIRE(env.variables().empty());
    REQUIRE(!env.get("HOME"));

    env.set("HOME", "/users/wombat");
    REQUIRE(env.get("HOME").value() == "/users/wombat");

    env.set("HOME", "/users/bilby");
    REQUIRE(env.get("HOME").value() == "/users/bilby");
    REQUIRE(env.variables().size() == 1u);

    // invalid names are skipped
    env.set("A-B", "x");
    REQUIRE(!env.get("A-B"));

    env.unset("HOME");
    REQUIRE(!env.get("HOME"));
    // unsetting a variable that is not set is a no-op
    env.unset("HOME");
}

TEST_CASE("state from environ", "[envvars]") {
    char a[] = "REX_REGISTRY=https://registry.example.com";
    char b[] = "EMPTY=";
    char c[] = "NO_EQUALS";
    char* environ[] = {a, b, c, nullptr};

    envvars::state env(environ);
    REQUIRE(env.get("REX_REGISTRY").value() == "https://registry.example.com");
    REQUIRE(env.get("EMPTY").value() == "");
    REQUIRE(!env.get("NO_EQUALS"));

    envvars::state none(nullptr);
    REQUIRE(none.variables().empty());
}

TEST_CASE("state expand", "[envvars]") {
    envvars::state env;
    env.set("HOME", "/users/wombat");
    env.set("CLUSTER_NAME", "daint");

    REQUIRE(env.expand("") == "");
    REQUIRE(env.expand("/plain/path") == "/plain/path");
    REQUIRE(env.expand("${HOME}/.cache/rex") == "/users/wombat/.cache/rex");
    REQUIRE(env.expand("${HOME}/${CLUSTER_NAME}") == "/users/wombat/daint");
    REQUIRE(env.expand("${HOME}${CLUSTER_NAME}") == "/users/wombatdaint");
    // unset variables expand to the empty string
    REQUIRE(env.expand("${SCRATCH}/rex") == "/rex");
    // invalid names are dropped
    REQUIRE(env.expand("a${A-B}b") == "ab");
    // $VAR without braces is not expanded
    REQUIRE(env.expand("$HOME") == "$HOME");
    // an unterminated reference truncates the result
    REQUIRE(env.expand("x/${HOME") == "x/");
}
