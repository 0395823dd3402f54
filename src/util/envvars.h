#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace envvars {

// A read-only snapshot of the environment variables of the calling process,
// taken once at start up so that library code never calls getenv.
//
// Tests construct an empty state and set the variables they need.
class state {
  public:
    state() = default;
    state(char* env[]);
    state(const state&) = default;

    void set(std::string_view name, std::string_view value);
    void unset(std::string_view name);
    std::optional<std::string> get(std::string_view name) const;

    const std::unordered_map<std::string, std::string>& variables() const;

    // expand variables delimited by '${' and '}', e.g:
    //      "${XDG_CACHE_HOME}/rex"
    //      "${HOME}/.cache/${CLUSTER_NAME}"
    // variables that are not set expand to the empty string.
    std::string expand(std::string_view) const;

  private:
    std::unordered_map<std::string, std::string> variables_;
};

} // namespace envvars
