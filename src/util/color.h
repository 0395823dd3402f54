#pragma once

#include <string>

#include <fmt/color.h>

#include <util/envvars.h>

// generates color::NAME() for the text style and color::NAME(value) for the
// text representation of value in that style, when color output is enabled.
#define REX_COLOR(color)                                                       \
    inline auto color() {                                                      \
        return fmt::emphasis::bold | fg(fmt::terminal_color::color);           \
    }                                                                          \
    template <typename S> std::string color(const S& s) {                      \
        return use_color() ? fmt::format(color(), "{}", s)                     \
                           : fmt::format("{}", s);                             \
    }

namespace color {

// automatic color selection, in order of precedence:
//   NO_COLOR is set: no color
//   CLICOLOR_FORCE is set and not 0: color
//   TERM=dumb: no color
//   otherwise color if stdout is a terminal
bool default_color(const envvars::state&);

void set_color(bool v);

bool use_color();

REX_COLOR(red)
REX_COLOR(green)
REX_COLOR(yellow)
REX_COLOR(blue)
REX_COLOR(cyan)
REX_COLOR(white)
REX_COLOR(bright_black)

} // namespace color
