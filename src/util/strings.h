#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace util {

// remove leading and trailing white space
std::string strip(std::string_view input);

// split a string on a character delimiter
//
// if drop_empty==false (default)
//
// ""       -> [""]
// ","      -> ["", ""]
// ",a"     -> ["", "a"]
// "a,b,,c" -> ["a", "b", "", "c"]
//
// if drop_empty==true
//
// ""       -> []
// ","      -> []
// ",a"     -> ["a"]
// "a,b,,c" -> ["a", "b", "c"]
std::vector<std::string> split(std::string_view s, const char delim,
                               const bool drop_empty = false);

std::string join(std::string_view joiner, const std::vector<std::string>& list);

std::string to_lower(std::string_view s);

// escape every byte outside [A-Za-z0-9._-] as %XX, so that the result can be
// used as a single file name
std::string percent_encode(std::string_view s);

} // namespace util
