#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <util/expected.h>
#include <util/lex.h>
#include <util/strings.h>

#include <rex/digest.h>
#include <rex/parse.h>
#include <rex/reference.h>

namespace rex {

std::string parse_error::message() const {
    auto msg =
        fmt::format("{}\n  {}\n  {}{}", detail, input, std::string(loc, ' '),
                    std::string(std::max(1u, width), '^'));
    if (description.empty()) {
        return msg;
    }
    return fmt::format("{}: {}", description, msg);
}

// some pre-processor gubbins that generates code to attempt
// parsing a value using a parse_x method. unwraps and
// forwards the error if there was an error.
#define PARSE(L, TYPE, X)                                                      \
    {                                                                          \
        if (auto rval__ = parse_##TYPE(L))                                     \
            X = *rval__;                                                       \
        else                                                                   \
            return util::unexpected(std::move(rval__.error()));                \
    }

// consume a token of kind KIND, or return an error that describes what was
// expected.
#define EXPECT(L, KIND, WHAT)                                                  \
    {                                                                          \
        if (L.current_kind() != KIND) {                                        \
            const auto t__ = L.peek();                                         \
            return util::unexpected(parse_error{                               \
                L.string(),                                                    \
                fmt::format("expected {}, found {}", WHAT, describe(t__)),     \
                t__});                                                         \
        }                                                                      \
        L.next();                                                              \
    }

namespace {

std::string describe(const lex::token& t) {
    if (t.kind == lex::tok::end) {
        return "end of input";
    }
    return fmt::format("'{}'", t.spelling);
}

bool is_lower_alnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c));
}

bool is_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

template <typename Test>
util::expected<std::string, parse_error>
parse_string(lex::lexer& L, std::string_view type, Test&& test) {
    std::string result;
    while (test(L.current_kind())) {
        const auto t = L.next();
        result += t.spelling;
    }

    if (result.empty()) {
        const auto t = L.peek();
        return util::unexpected(parse_error{
            L.string(), fmt::format("expected a {}, found {}", type, describe(t)),
            t});
    }

    return result;
}

// tokens that can appear in names, e.g. platform fields
bool is_name_tok(lex::tok t) {
    return t == lex::tok::symbol || t == lex::tok::dash || t == lex::tok::dot ||
           t == lex::tok::integer;
}

// don't allow leading dashes and periods
bool is_name_start_tok(lex::tok t) {
    return t == lex::tok::symbol || t == lex::tok::integer;
}

util::expected<std::string, parse_error> parse_name(lex::lexer& L) {
    if (!is_name_start_tok(L.current_kind())) {
        const auto t = L.peek();
        return util::unexpected(parse_error{
            L.string(), fmt::format("found unexpected {}", describe(t)), t});
    }
    return parse_string(L, "name", is_name_tok);
}

template <std::unsigned_integral T>
util::expected<T, parse_error> parse_int(lex::lexer& L) {
    const auto t = L.peek();
    if (t.kind != lex::tok::integer) {
        return util::unexpected(parse_error{
            L.string(), fmt::format("{} is not an integer", describe(t)), t});
    }

    auto s = t.spelling;
    T value;
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);

    if (result.ec != std::errc{}) {
        return util::unexpected(
            parse_error{L.string(),
                        fmt::format("{} is not an integer '{}'", s,
                                    std::make_error_code(result.ec).message()),
                        t});
    }

    L.next();

    return value;
}

util::expected<std::uint32_t, parse_error> parse_uint32(lex::lexer& L) {
    return parse_int<std::uint32_t>(L);
}

// tokens that can appear in a digest algorithm: [a-z0-9]+([+._-][a-z0-9]+)*
bool is_algorithm_tok(lex::tok t) {
    return t == lex::tok::symbol || t == lex::tok::integer ||
           t == lex::tok::plus || t == lex::tok::dot || t == lex::tok::dash;
}

bool is_hex_tok(lex::tok t) {
    return t == lex::tok::symbol || t == lex::tok::integer;
}

// tokens that can appear in the name and tag of a reference.
// the characters are validated per component after the components have been
// split on '/'.
bool is_reference_tok(lex::tok t) {
    return t == lex::tok::symbol || t == lex::tok::integer ||
           t == lex::tok::dot || t == lex::tok::dash || t == lex::tok::colon;
}

// a '/' separated component of a reference, with its location in the input
struct segment {
    std::string text;
    unsigned loc;
};

// domain := component ('.' component)* [':' port]
// component := [a-zA-Z0-9]([a-zA-Z0-9-]*[a-zA-Z0-9])?
std::optional<parse_error> validate_domain(const std::string& in,
                                           const segment& s) {
    const auto colon = s.text.find(':');
    const auto host = s.text.substr(0, colon);

    unsigned offset = 0;
    for (auto& part : util::split(host, '.')) {
        const unsigned loc = s.loc + offset;
        if (part.empty()) {
            return parse_error{in, "empty component in registry name", loc};
        }
        if (!is_alnum(part.front()) || !is_alnum(part.back())) {
            return parse_error{in,
                               "registry name components must start and end "
                               "with a letter or digit",
                               loc, unsigned(part.size())};
        }
        for (unsigned i = 0; i < part.size(); ++i) {
            if (!is_alnum(part[i]) && part[i] != '-') {
                return parse_error{
                    in,
                    fmt::format("invalid character '{}' in registry name",
                                part[i]),
                    loc + i};
            }
        }
        offset += part.size() + 1;
    }

    if (colon != std::string::npos) {
        const auto port = s.text.substr(colon + 1);
        const unsigned loc = s.loc + colon + 1;
        if (port.empty()) {
            return parse_error{in, "expected a port number after ':'",
                               loc - 1};
        }
        for (unsigned i = 0; i < port.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(port[i]))) {
                return parse_error{
                    in,
                    fmt::format("invalid character '{}' in port number",
                                port[i]),
                    loc + i};
            }
        }
    }

    return std::nullopt;
}

// path-component := [a-z0-9]+ (separator [a-z0-9]+)*
// separator      := '.' | '_' | '__' | '-'+
std::optional<parse_error> validate_path_component(const std::string& in,
                                                   const segment& s) {
    const auto& text = s.text;

    auto bad_character = [&](unsigned i) {
        const char c = text[i];
        if (std::isupper(static_cast<unsigned char>(c))) {
            return parse_error{in, "repository names must be lowercase",
                               s.loc + i};
        }
        if (c == '.' || c == '_' || c == '-') {
            return parse_error{in,
                               fmt::format("unexpected separator '{}' in "
                                           "repository name",
                                           c),
                               s.loc + i};
        }
        return parse_error{
            in, fmt::format("invalid character '{}' in repository name", c),
            s.loc + i};
    };

    unsigned i = 0;
    while (i < text.size()) {
        if (!is_lower_alnum(text[i])) {
            return bad_character(i);
        }
        while (i < text.size() && is_lower_alnum(text[i])) {
            ++i;
        }
        if (i == text.size()) {
            break;
        }

        const auto sep = i;
        switch (text[i]) {
        case '.':
            ++i;
            break;
        case '_':
            ++i;
            if (i < text.size() && text[i] == '_') {
                ++i;
            }
            break;
        case '-':
            while (i < text.size() && text[i] == '-') {
                ++i;
            }
            break;
        default:
            return bad_character(i);
        }
        if (i == text.size()) {
            return parse_error{in,
                               "repository path components must not end with "
                               "a separator",
                               s.loc + sep, i - sep};
        }
    }

    return std::nullopt;
}

// tag := [A-Za-z0-9_][A-Za-z0-9_.-]{0,127}
std::optional<parse_error> validate_tag(const std::string& in,
                                        const std::string& tag, unsigned loc) {
    if (tag.empty()) {
        return parse_error{in, "expected a tag after ':'", loc - 1};
    }
    if (tag.size() > 128) {
        return parse_error{in, "tags must not exceed 128 characters", loc,
                           unsigned(tag.size())};
    }
    for (unsigned i = 0; i < tag.size(); ++i) {
        const char c = tag[i];
        const bool valid =
            is_alnum(c) || c == '_' || (i > 0 && (c == '.' || c == '-'));
        if (!valid) {
            return parse_error{
                in, fmt::format("invalid character '{}' in tag", c), loc + i};
        }
    }
    return std::nullopt;
}

} // namespace

util::expected<digest, parse_error> parse_digest(const std::string& in) {
    spdlog::trace("parsing digest '{}'", in);
    auto L = lex::lexer(in);

    const unsigned algorithm_loc = L.peek().loc;
    std::string algorithm;
    while (is_algorithm_tok(L.current_kind())) {
        algorithm += L.next().spelling;
    }
    if (algorithm.empty()) {
        const auto t = L.peek();
        return util::unexpected(parse_error{
            in, fmt::format("expected a digest algorithm, found {}", describe(t)),
            t});
    }
    for (unsigned i = 0; i < algorithm.size(); ++i) {
        const char c = algorithm[i];
        if (is_lower_alnum(c)) {
            continue;
        }
        const bool separator = c == '+' || c == '.' || c == '_' || c == '-';
        if (!separator || i == 0 || i + 1 == algorithm.size() ||
            !is_lower_alnum(algorithm[i + 1])) {
            return util::unexpected(parse_error{
                in,
                fmt::format("invalid character '{}' in digest algorithm", c),
                algorithm_loc + i});
        }
    }

    EXPECT(L, lex::tok::colon, "':' after the digest algorithm");

    const unsigned hex_loc = L.peek().loc;
    std::string hex;
    while (is_hex_tok(L.current_kind())) {
        hex += L.next().spelling;
    }
    if (const auto t = L.peek(); t.kind != lex::tok::end) {
        return util::unexpected(parse_error{
            in, fmt::format("unexpected {} in digest", describe(t)), t});
    }

    const auto length = digest_length(algorithm);
    if (!length) {
        return util::unexpected(parse_error{
            in, fmt::format("unsupported digest algorithm '{}'", algorithm),
            algorithm_loc, unsigned(algorithm.size())});
    }
    for (unsigned i = 0; i < hex.size(); ++i) {
        if (!is_hex(hex[i])) {
            return util::unexpected(parse_error{
                in,
                std::isupper(static_cast<unsigned char>(hex[i]))
                    ? std::string("digests must be lowercase hex")
                    : fmt::format("invalid hex character '{}'", hex[i]),
                hex_loc + i});
        }
    }
    if (hex.size() != length) {
        return util::unexpected(parse_error{
            in,
            fmt::format("a {} digest has {} hex characters, found {}",
                        algorithm, length, hex.size()),
            hex_loc, unsigned(hex.size())});
    }

    return digest{std::move(algorithm), std::move(hex)};
}

util::expected<reference, parse_error> parse_reference(const std::string& in) {
    spdlog::trace("parsing reference '{}'", in);
    auto L = lex::lexer(in);

    // split the name and tag into '/' separated segments
    std::vector<segment> segments{{"", 0u}};
    while (true) {
        const auto k = L.current_kind();
        if (k == lex::tok::slash) {
            const auto t = L.next();
            segments.push_back({"", t.loc + 1});
        } else if (is_reference_tok(k)) {
            segments.back().text += L.next().spelling;
        } else {
            break;
        }
    }
    if (const auto t = L.peek();
        t.kind != lex::tok::at && t.kind != lex::tok::end) {
        return util::unexpected(parse_error{
            in, fmt::format("unexpected {} in reference", describe(t)), t});
    }

    reference result;

    // the first segment is a registry if it looks like a host name
    std::size_t first = 0;
    if (segments.size() > 1) {
        const auto& s = segments.front().text;
        if (s.find_first_of(".:") != std::string::npos || s == "localhost") {
            if (auto e = validate_domain(in, segments.front())) {
                return util::unexpected(std::move(*e));
            }
            result.registry_ = s;
            result.explicit_registry_ = true;
            first = 1;
        }
    }

    // the tag follows the first ':' in the final segment
    auto& last = segments.back();
    if (auto pos = last.text.find(':'); pos != std::string::npos) {
        auto tag = last.text.substr(pos + 1);
        if (auto e = validate_tag(in, tag, last.loc + pos + 1)) {
            return util::unexpected(std::move(*e));
        }
        result.tag_ = std::move(tag);
        last.text.resize(pos);
    }

    std::vector<std::string> path;
    for (auto i = first; i < segments.size(); ++i) {
        const auto& s = segments[i];
        if (s.text.empty()) {
            return util::unexpected(
                parse_error{in, "empty repository path component", s.loc});
        }
        if (auto e = validate_path_component(in, s)) {
            return util::unexpected(std::move(*e));
        }
        path.push_back(s.text);
    }
    result.repository_ = util::join("/", path);

    const auto name_length =
        result.repository_.size() +
        (result.explicit_registry_ ? result.registry_.size() + 1 : 0);
    if (name_length > 255) {
        return util::unexpected(parse_error{
            in, "repository name must not exceed 255 characters", 0,
            unsigned(name_length)});
    }

    if (L.current_kind() == lex::tok::at) {
        const auto at = L.next();
        const unsigned offset = at.loc + 1;
        auto d = parse_digest(in.substr(offset));
        if (!d) {
            auto e = std::move(d.error());
            e.input = in;
            e.loc += offset;
            return util::unexpected(std::move(e));
        }
        result.digest_ = std::move(*d);
    }

    return result;
}

util::expected<timestamp, parse_error> parse_timestamp(const std::string& arg) {
    namespace chr = std::chrono;

    const std::string in = util::strip(arg);
    spdlog::trace("parsing timestamp '{}'", in);
    auto L = lex::lexer(in);

    std::uint32_t year, month, day, hour, minute, second;

    PARSE(L, uint32, year);
    EXPECT(L, lex::tok::dash, "'-'");
    PARSE(L, uint32, month);
    EXPECT(L, lex::tok::dash, "'-'");
    PARSE(L, uint32, day);

    // date and time are separated by 'T', 't' or a space
    if (const auto t = L.peek();
        !(t.kind == lex::tok::whitespace ||
          (t.kind == lex::tok::symbol && (t.spelling == "T" || t.spelling == "t")))) {
        return util::unexpected(parse_error{
            in, fmt::format("expected 'T' separating date and time, found {}",
                            describe(t)),
            t});
    }
    L.next();

    PARSE(L, uint32, hour);
    EXPECT(L, lex::tok::colon, "':'");
    PARSE(L, uint32, minute);
    EXPECT(L, lex::tok::colon, "':'");
    PARSE(L, uint32, second);

    chr::nanoseconds fraction{0};
    if (L.current_kind() == lex::tok::dot) {
        L.next();
        const auto t = L.peek();
        if (t.kind != lex::tok::integer) {
            return util::unexpected(parse_error{
                in,
                fmt::format("expected fractional seconds, found {}",
                            describe(t)),
                t});
        }
        // keep nanosecond precision
        auto digits = std::string(t.spelling.substr(0, 9));
        digits.resize(9, '0');
        fraction = chr::nanoseconds{std::stoll(digits)};
        L.next();
    }

    chr::minutes offset{0};
    if (const auto t = L.peek();
        t.kind == lex::tok::symbol && (t.spelling == "Z" || t.spelling == "z")) {
        L.next();
    } else if (t.kind == lex::tok::plus || t.kind == lex::tok::dash) {
        L.next();
        std::uint32_t offset_hours, offset_minutes;
        PARSE(L, uint32, offset_hours);
        EXPECT(L, lex::tok::colon, "':'");
        PARSE(L, uint32, offset_minutes);
        if (offset_hours > 23 || offset_minutes > 59) {
            return util::unexpected(
                parse_error{in, "time zone offset is out of bounds", t.loc,
                            unsigned(in.size() - t.loc)});
        }
        offset = chr::hours{offset_hours} + chr::minutes{offset_minutes};
        if (t.kind == lex::tok::dash) {
            offset = -offset;
        }
    } else {
        return util::unexpected(parse_error{
            in,
            fmt::format("expected a time zone ('Z' or an offset), found {}",
                        describe(t)),
            t});
    }

    if (const auto t = L.peek(); t.kind != lex::tok::end) {
        return util::unexpected(parse_error{
            in, fmt::format("unexpected {} after timestamp", describe(t)), t});
    }

    const chr::year_month_day date{chr::year{int(year)}, chr::month{month},
                                   chr::day{day}};
    // allow leap seconds (60) but clamp them
    if (!date.ok() || hour > 23 || minute > 59 || second > 60) {
        return util::unexpected(parse_error{
            in, fmt::format("timestamp {} is out of bounds", in), 0u,
            unsigned(in.size())});
    }
    second = std::min(second, 59u);

    const auto t = chr::sys_days{date} + chr::hours{hour} +
                   chr::minutes{minute} + chr::seconds{second} + fraction -
                   offset;
    return chr::time_point_cast<timestamp::duration>(t);
}

util::expected<platform, parse_error> parse_platform(const std::string& arg) {
    const std::string in = util::strip(arg);
    spdlog::trace("parsing platform '{}'", in);
    auto L = lex::lexer(in);

    platform result;
    PARSE(L, name, result.os);
    EXPECT(L, lex::tok::slash, "'/' after the operating system");
    PARSE(L, name, result.architecture);
    if (L.current_kind() == lex::tok::slash) {
        L.next();
        std::string variant;
        PARSE(L, name, variant);
        result.variant = std::move(variant);
    }

    if (const auto t = L.peek(); t.kind != lex::tok::end) {
        return util::unexpected(parse_error{
            in, fmt::format("unexpected {} in platform", describe(t)), t});
    }
    return result;
}

namespace {
// tokens that can appear in configuration keys
bool is_key_tok(lex::tok t) {
    return t == lex::tok::symbol || t == lex::tok::dash ||
           t == lex::tok::integer;
}

// don't allow leading dashes or integers
bool is_key_start_tok(lex::tok t) {
    return t == lex::tok::symbol;
}

util::expected<std::string, parse_error> parse_key(lex::lexer& L) {
    if (!is_key_start_tok(L.current_kind())) {
        const auto t = L.peek();
        return util::unexpected(parse_error{
            L.string(), fmt::format("found unexpected {}", describe(t)), t});
    }
    return parse_string(L, "key", is_key_tok);
}
} // namespace

util::expected<config_line, parse_error>
parse_config_line(const std::string& arg) {
    const auto line = util::strip(arg);
    spdlog::trace("parsing config line '{}'", arg);

    // empty lines or lines that start with '#' are skipped
    if (line.empty() || line[0] == '#') {
        return config_line{};
    }

    auto L = lex::lexer(line);

    auto skip_whitespace = [&L]() {
        while (L.current_kind() == lex::tok::whitespace) {
            L.next();
        }
    };

    config_line result;
    PARSE(L, key, result.key);

    skip_whitespace();
    EXPECT(L, lex::tok::equals, "'='");
    skip_whitespace();

    result.value = line.substr(L.peek().loc);

    return result;
}

} // namespace rex
