#pragma once

// only the command line front end prints to the terminal: library code
// reports through spdlog and return values.

#include <fmt/core.h>

#include <util/color.h>

namespace term {

template <typename... T> void warn(fmt::format_string<T...> fmt, T&&... args) {
    fmt::print(stderr, "{}: {}\n", ::color::yellow("warning"),
               fmt::format(fmt, std::forward<T>(args)...));
}

template <typename... T> void error(fmt::format_string<T...> fmt, T&&... args) {
    fmt::print(stderr, "{}: {}\n", ::color::red("error"),
               fmt::format(fmt, std::forward<T>(args)...));
}

template <typename... T> void msg(fmt::format_string<T...> fmt, T&&... args) {
    fmt::print(stdout, "{}\n", fmt::format(fmt, std::forward<T>(args)...));
}

// print text that already carries its own line endings
inline void raw(const std::string& text) {
    fmt::print(stdout, "{}", text);
}

} // namespace term
