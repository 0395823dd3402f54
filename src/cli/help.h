#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <util/color.h>

// building blocks for the footers of --help messages
namespace help {

// a command line flag, option or environment variable mentioned in help text
struct lst {
    std::string content;
};

// a paragraph with an optional label, e.g. "Example - ..."
struct block {
    enum class admonition : std::uint32_t { none, note, xmpl, code, warn };
    using enum admonition;
    admonition kind = none;
    std::vector<std::string> lines;

    block() = default;
    block(std::string);
    template <typename... Args>
    block(admonition k, Args&&... args)
        : kind(k), lines{std::forward<Args>(args)...} {
    }
};

struct linebreak {};

// an entry in a help footer
struct item {
    item(block b) : value(std::move(b)) {
    }
    item(linebreak l) : value(l) {
    }
    std::variant<block, linebreak> value;
};

std::string render(const item&);

} // namespace help

template <> class fmt::formatter<help::item> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    auto format(help::item const& item, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", help::render(item));
    }
};

template <> class fmt::formatter<help::lst> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    auto format(help::lst const& l, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", ::color::yellow(l.content));
    }
};
