#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace lex {

// tokens used by the reference, digest, timestamp and config parsers
enum class tok {
    at,         // '@'
    slash,      // '/'
    integer,    // unsigned integer, e.g. 5000
    colon,      // ':'
    symbol,     // letters and underscores, e.g. library, sha
    dash,       // '-'
    dot,        // '.'
    whitespace, // contiguous white space characters are joined together
    equals,     // '='
    plus,       // '+'
    end,        // end of input
    error,      // invalid input encountered in stream
};

struct token {
    unsigned loc;
    tok kind;
    std::string_view spelling;
};
bool operator==(const token&, const token&);

// Forward declare pimpled implementation.
class lexer_impl;

class lexer {
  public:
    lexer(std::string_view input);

    token next();
    token peek(unsigned n = 0);

    tok current_kind() const;

    // the full input
    std::string string() const;

    ~lexer();

  private:
    std::unique_ptr<lexer_impl> impl_;
};

} // namespace lex

#include <fmt/core.h>

template <> class fmt::formatter<lex::tok> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(lex::tok const& t, FmtContext& ctx) const {
        using enum lex::tok;
        switch (t) {
        case at:
            return fmt::format_to(ctx.out(), "at");
        case slash:
            return fmt::format_to(ctx.out(), "slash");
        case integer:
            return fmt::format_to(ctx.out(), "integer");
        case colon:
            return fmt::format_to(ctx.out(), "colon");
        case symbol:
            return fmt::format_to(ctx.out(), "symbol");
        case dash:
            return fmt::format_to(ctx.out(), "dash");
        case dot:
            return fmt::format_to(ctx.out(), "dot");
        case whitespace:
            return fmt::format_to(ctx.out(), "whitespace");
        case equals:
            return fmt::format_to(ctx.out(), "equals");
        case plus:
            return fmt::format_to(ctx.out(), "plus");
        case end:
            return fmt::format_to(ctx.out(), "end");
        case error:
            return fmt::format_to(ctx.out(), "error");
        }
        return fmt::format_to(ctx.out(), "?");
    }
};

template <> class fmt::formatter<lex::token> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(lex::token const& t, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "loc: {}, kind: {} '{}'", t.loc,
                              t.kind, t.spelling);
    }
};
