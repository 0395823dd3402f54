#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rex {

enum class case_matching {
    ignore,
    // case sensitive only if the query contains an upper case letter
    smart,
    respect,
};

struct search_result {
    std::string value;
    // higher is a better match
    std::uint32_t score;

    bool operator==(const search_result&) const = default;
};

// the score of target for a fuzzy query: every character of the query must
// appear in target in order, not necessarily adjacent.
// matches at the start of a word and runs of adjacent characters score
// higher, gaps between matched characters lower the score.
// returns nullopt if target does not match.
std::optional<std::uint32_t> fuzzy_score(std::string_view query,
                                         std::string_view target,
                                         case_matching mode);

// the targets that match query, sorted by descending score then name.
// an empty query matches every target with score 0, in input order.
std::vector<search_result> fuzzy_search(std::string_view query,
                                        const std::vector<std::string>& targets,
                                        case_matching mode);

std::vector<search_result>
search_repositories(std::string_view query,
                    const std::vector<std::string>& repositories);

std::vector<search_result> search_tags(std::string_view query,
                                       const std::vector<std::string>& tags);

// search image references of the form repository:tag.
//
//   "alp"     every tag of the repositories that match "alp"
//   "alp:3.1" the tags that match "3.1" in the repositories that match "alp",
//             scored by the average of the two scores
std::vector<search_result> search_images(
    std::string_view query, const std::vector<std::string>& repositories,
    const std::unordered_map<std::string, std::vector<std::string>>& tags);

} // namespace rex
