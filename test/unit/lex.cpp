#include <catch2/catch_all.hpp>
#include <fmt/core.h>

#include <util/lex.h>

TEST_CASE("error characters", "[lex]") {
    for (auto in : {"\\", "~", "'", "\"", ",", "#"}) {
        lex::lexer L(in);
        auto t = L.peek();
        REQUIRE(t.kind == lex::tok::error);
        REQUIRE(t.loc == 0u);
    }
}

TEST_CASE("punctuation", "[lex]") {
    lex::lexer L(":@/.-=+:");
    REQUIRE(L.next() == lex::token{0, lex::tok::colon, ":"});
    REQUIRE(L.next() == lex::token{1, lex::tok::at, "@"});
    REQUIRE(L.next() == lex::token{2, lex::tok::slash, "/"});
    REQUIRE(L.next() == lex::token{3, lex::tok::dot, "."});
    REQUIRE(L.next() == lex::token{4, lex::tok::dash, "-"});
    REQUIRE(L.next() == lex::token{5, lex::tok::equals, "="});
    REQUIRE(L.next() == lex::token{6, lex::tok::plus, "+"});
    REQUIRE(L.next() == lex::token{7, lex::tok::colon, ":"});
    // pop the end token twice to check that it does not run off the end
    REQUIRE(L.next() == lex::token{8, lex::tok::end, ""});
    REQUIRE(L.next() == lex::token{8, lex::tok::end, ""});
}

TEST_CASE("number", "[lex]") {
    lex::lexer L("5000 7173b809ca");
    REQUIRE(L.next() == lex::token{0, lex::tok::integer, "5000"});
    REQUIRE(L.next() == lex::token{4, lex::tok::whitespace, " "});
    REQUIRE(L.next() == lex::token{5, lex::tok::integer, "7173"});
    REQUIRE(L.next() == lex::token{9, lex::tok::symbol, "b"});
    REQUIRE(L.next() == lex::token{10, lex::tok::integer, "809"});
    REQUIRE(L.next() == lex::token{13, lex::tok::symbol, "ca"});
    REQUIRE(L.next() == lex::token{15, lex::tok::end, ""});
}

TEST_CASE("peek", "[lex]") {
    lex::lexer L("@sha");
    REQUIRE(L.peek() == lex::token{0, lex::tok::at, "@"});
    REQUIRE(L.peek(1) == lex::token{1, lex::tok::symbol, "sha"});
    REQUIRE(L.peek(2) == lex::token{4, lex::tok::end, ""});
    REQUIRE(L.peek(3) == lex::token{4, lex::tok::end, ""});

    REQUIRE(L.next() == lex::token{0, lex::tok::at, "@"});
    REQUIRE(L.current_kind() == lex::tok::symbol);
    REQUIRE(L.next() == lex::token{1, lex::tok::symbol, "sha"});
    REQUIRE(L.next() == lex::token{4, lex::tok::end, ""});
}

TEST_CASE("whitespace", "[lex]") {
    lex::lexer L("cache  = \t/tmp");
    REQUIRE(L.next() == lex::token{0, lex::tok::symbol, "cache"});
    REQUIRE(L.next() == lex::token{5, lex::tok::whitespace, "  "});
    REQUIRE(L.next() == lex::token{7, lex::tok::equals, "="});
    REQUIRE(L.next() == lex::token{8, lex::tok::whitespace, " \t"});
    REQUIRE(L.next() == lex::token{10, lex::tok::slash, "/"});
    REQUIRE(L.next() == lex::token{11, lex::tok::symbol, "tmp"});
}

TEST_CASE("empty input", "[lex]") {
    lex::lexer L("");
    REQUIRE(L.peek() == lex::token{0, lex::tok::end, ""});
    REQUIRE(L.peek(1036) == lex::token{0, lex::tok::end, ""});
    REQUIRE(L.next() == lex::token{0, lex::tok::end, ""});
    REQUIRE(L.next() == lex::token{0, lex::tok::end, ""});
}

TEST_CASE("references", "[lex]") {
    for (const auto& in : {"registry.example.com:5000/team/app:v1.2",
                           "alpine@sha256:7173b809ca12ec5dee45",
                           "localhost/a__b/c-d:latest"}) {
        lex::lexer L(in);
        while (L.current_kind() != lex::tok::end &&
               L.current_kind() != lex::tok::error) {
            L.next();
        }
        REQUIRE(L.current_kind() == lex::tok::end);
    }
}
