#pragma once

#include <string>

#include <util/expected.h>
#include <util/lex.h>

#include <rex/digest.h>
#include <rex/oci.h>
#include <rex/reference.h>

namespace rex {

/// represents an error generated when parsing a string.
///
/// stores the input string and the location (loc) in the string where the error
/// was encountered
///
/// there are two levels of error message:
/// - detail: a detailed low level description (e.g. "unexpected symbol ?") that
/// correlates to the loc in input
/// - description: a high level description, usually added at a higher level
/// (e.g. "invalid --platform argument")
struct parse_error {
    std::string input;
    std::string description;
    std::string detail;
    unsigned loc;
    unsigned width;
    parse_error(std::string input, std::string detail, const lex::token& tok)
        : input(std::move(input)), detail(std::move(detail)), loc(tok.loc),
          width(tok.spelling.length()) {
    }
    parse_error(std::string input, std::string detail, unsigned loc,
                unsigned width = 1)
        : input(std::move(input)), detail(std::move(detail)), loc(loc),
          width(width) {
    }
    std::string message() const;
};

// the result of parsing a line in a configuration file
struct config_line {
    std::string key;
    std::string value;
    // evaluates to false -> an empty or comment line
    operator bool() const {
        return !key.empty();
    }
};

util::expected<digest, parse_error> parse_digest(const std::string& in);

util::expected<reference, parse_error> parse_reference(const std::string& in);

// parse an RFC 3339 timestamp, e.g.
//   2024-01-15T10:30:00Z
//   2024-01-15T10:30:00.123456789+02:00
util::expected<timestamp, parse_error> parse_timestamp(const std::string& in);

// parse a platform selector os/architecture[/variant], e.g. linux/arm64/v8
util::expected<platform, parse_error> parse_platform(const std::string& in);

util::expected<config_line, parse_error>
parse_config_line(const std::string& arg);

} // namespace rex
