#include <cctype>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include <util/envvars.h>

namespace envvars {

// Environment variable names can contain any character from the portable
// character set except NUL and '=':
//   https://pubs.opengroup.org/onlinepubs/000095399/basedefs/xbd_chap08.html
// in practice, shells and utilities stick to [a-zA-Z_][a-zA-Z0-9_]*
//
//  strict==true  : [a-zA-Z_][a-zA-Z0-9_]*
//  strict==false : no '='
bool validate_name(std::string_view name, bool strict = true) {
    if (name.empty()) {
        return false;
    }

    if (!strict) {
        return name.find('=') == std::string_view::npos;
    }

    if (std::isdigit(static_cast<unsigned char>(name[0]))) {
        return false;
    }

    for (unsigned char c : name) {
        if (!(std::isalnum(c) || c == '_')) {
            return false;
        }
    }

    return true;
}

state::state(char* environ[]) {
    if (environ == nullptr) {
        return;
    }
    for (char** env = environ; *env != nullptr; ++env) {
        const std::string entry(*env);
        if (const auto pos = entry.find('='); pos != std::string::npos) {
            const auto name = entry.substr(0, pos);
            // applications shall tolerate the presence of names that do not
            // follow the shell conventions, so apply weak validation.
            if (validate_name(name, false)) {
                variables_[name] = entry.substr(pos + 1);
            } else {
                spdlog::warn("envvars::state skipping the invalid "
                             "environment variable name '{}'",
                             name);
            }
        }
    }
}

void state::set(std::string_view name, std::string_view value) {
    if (validate_name(name)) {
        variables_[std::string(name)] = value;
    } else {
        spdlog::warn("envvars::state::set skipping the invalid "
                     "environment variable name '{}'",
                     name);
    }
}

std::optional<std::string> state::get(std::string_view name) const {
    if (auto it = variables_.find(std::string(name)); it != variables_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void state::unset(std::string_view name) {
    variables_.erase(std::string(name));
}

const std::unordered_map<std::string, std::string>& state::variables() const {
    return variables_;
}

std::string state::expand(std::string_view in) const {
    std::string result;
    result.reserve(in.size());

    std::size_t pos = 0;
    while (pos < in.size()) {
        const auto start = in.find("${", pos);
        if (start == std::string_view::npos) {
            result += in.substr(pos);
            break;
        }
        result += in.substr(pos, start - pos);

        const auto close = in.find('}', start + 2);
        if (close == std::string_view::npos) {
            spdlog::error("envvars::state::expand: unexpected end of "
                          "string while looking for matching '}}': '{}'",
                          in);
            break;
        }

        const auto name = in.substr(start + 2, close - start - 2);
        if (!validate_name(name)) {
            spdlog::warn("envvars::state::expand: skipping invalid env var "
                         "name {}",
                         name);
        } else if (auto value = get(name)) {
            result += *value;
        } else {
            spdlog::warn("envvars::state::expand: env. variable {} does not "
                         "exist",
                         name);
        }
        pos = close + 1;
    }

    spdlog::trace("envvars::state::expand '{}' -> '{}'", in, result);
    return result;
}

} // namespace envvars
