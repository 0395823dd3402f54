#include <algorithm>
#include <cctype>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <util/strings.h>

namespace util {

namespace {
bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c));
}
} // namespace

std::string strip(std::string_view input) {
    auto b = std::find_if_not(input.begin(), input.end(), is_space);
    if (b == input.end()) {
        return {};
    }
    auto e = input.end();
    while (is_space(*--e))
        ;
    return {b, e + 1};
}

std::vector<std::string> split(std::string_view s, const char delim,
                               const bool drop_empty) {
    std::vector<std::string> results;

    auto pos = s.cbegin();
    auto end = s.cend();
    auto next = std::find(pos, end, delim);
    while (next != end) {
        if (!drop_empty || pos != next) {
            results.emplace_back(pos, next);
        }
        pos = next + 1;
        next = std::find(pos, end, delim);
    }
    if (!drop_empty || pos != next) {
        results.emplace_back(pos, next);
    }
    return results;
}

std::string join(std::string_view joiner,
                 const std::vector<std::string>& list) {
    if (list.empty()) {
        return "";
    }

    std::string result;
    result.reserve(std::accumulate(
        list.begin(), list.end(), list.size() * joiner.size(),
        [](std::size_t sum, const std::string& s) { return sum + s.size(); }));

    bool first = true;
    for (auto& s : list) {
        if (!first) {
            result += joiner;
        }
        result += s;
        first = false;
    }

    return result;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string percent_encode(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            result += static_cast<char>(c);
        } else {
            result += fmt::format("%{:02X}", c);
        }
    }
    return result;
}

} // namespace util
