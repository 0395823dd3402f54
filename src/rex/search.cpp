#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <rex/search.h>

namespace rex {

namespace {

constexpr int score_match = 16;
constexpr int bonus_boundary = 8;
constexpr int bonus_consecutive = 6;
constexpr int bonus_first = 4;
constexpr int penalty_gap = 1;

bool is_separator(char c) {
    return c == '/' || c == '-' || c == '_' || c == '.' || c == ':' ||
           c == '@' || c == ' ';
}

bool is_upper(char c) {
    return std::isupper(static_cast<unsigned char>(c));
}

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// a match that starts at target[start], taking the leftmost occurrence of
// each following query character
std::optional<int> score_from(std::string_view query, std::string_view target,
                              std::size_t start, bool ignore_case) {
    auto eq = [ignore_case](char a, char b) {
        return ignore_case ? lower(a) == lower(b) : a == b;
    };

    int score = 0;
    std::size_t pos = start;
    std::optional<std::size_t> previous;
    for (auto q : query) {
        while (pos < target.size() && !eq(q, target[pos])) {
            ++pos;
        }
        if (pos == target.size()) {
            return std::nullopt;
        }
        score += score_match;
        if (pos == 0) {
            score += bonus_first + bonus_boundary;
        } else if (is_separator(target[pos - 1]) ||
                   (is_upper(target[pos]) && !is_upper(target[pos - 1]))) {
            score += bonus_boundary;
        }
        if (previous) {
            if (*previous + 1 == pos) {
                score += bonus_consecutive;
            } else {
                score -= penalty_gap * static_cast<int>(pos - *previous - 1);
            }
        }
        previous = pos++;
    }
    return score;
}

void sort_results(std::vector<search_result>& results) {
    std::sort(results.begin(), results.end(),
              [](const search_result& a, const search_result& b) {
                  if (a.score != b.score) {
                      return a.score > b.score;
                  }
                  return a.value < b.value;
              });
}

} // namespace

std::optional<std::uint32_t> fuzzy_score(std::string_view query,
                                         std::string_view target,
                                         case_matching mode) {
    if (query.empty()) {
        return 0;
    }
    const bool ignore_case =
        mode == case_matching::ignore ||
        (mode == case_matching::smart &&
         std::none_of(query.begin(), query.end(), is_upper));

    // try every position where the first character matches and keep the best
    std::optional<int> best;
    for (std::size_t i = 0; i + query.size() <= target.size(); ++i) {
        const char a = ignore_case ? lower(query[0]) : query[0];
        const char b = ignore_case ? lower(target[i]) : target[i];
        if (a != b) {
            continue;
        }
        if (auto s = score_from(query, target, i, ignore_case)) {
            best = std::max(best.value_or(*s), *s);
        }
    }
    if (!best) {
        return std::nullopt;
    }
    // a match always scores above the empty query
    return static_cast<std::uint32_t>(std::max(*best, 1));
}

std::vector<search_result> fuzzy_search(std::string_view query,
                                        const std::vector<std::string>& targets,
                                        case_matching mode) {
    std::vector<search_result> results;
    if (query.empty()) {
        for (auto& t : targets) {
            results.push_back({t, 0});
        }
        return results;
    }
    for (auto& t : targets) {
        if (auto s = fuzzy_score(query, t, mode)) {
            results.push_back({t, *s});
        }
    }
    sort_results(results);
    spdlog::debug("fuzzy_search: '{}' matched {} of {}", query, results.size(),
                  targets.size());
    return results;
}

std::vector<search_result>
search_repositories(std::string_view query,
                    const std::vector<std::string>& repositories) {
    return fuzzy_search(query, repositories, case_matching::smart);
}

std::vector<search_result> search_tags(std::string_view query,
                                       const std::vector<std::string>& tags) {
    return fuzzy_search(query, tags, case_matching::smart);
}

std::vector<search_result> search_images(
    std::string_view query, const std::vector<std::string>& repositories,
    const std::unordered_map<std::string, std::vector<std::string>>& tags) {
    const auto colon = query.find(':');
    const auto repo_query = query.substr(0, colon);

    std::vector<search_result> results;
    for (auto& repo : search_repositories(repo_query, repositories)) {
        auto it = tags.find(repo.value);
        if (it == tags.end()) {
            continue;
        }
        if (colon == std::string_view::npos) {
            for (auto& tag : it->second) {
                results.push_back(
                    {fmt::format("{}:{}", repo.value, tag), repo.score});
            }
            continue;
        }
        for (auto& tag : search_tags(query.substr(colon + 1), it->second)) {
            results.push_back({fmt::format("{}:{}", repo.value, tag.value),
                               (repo.score + tag.score) / 2});
        }
    }
    sort_results(results);
    return results;
}

} // namespace rex
