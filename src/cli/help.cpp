#include <string>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <util/color.h>
#include <util/strings.h>

#include "help.h"

namespace help {

block::block(std::string msg) : kind(none), lines{std::move(msg)} {
}

namespace {

std::string label(block::admonition kind) {
    using enum block::admonition;
    switch (kind) {
    case note:
        return fmt::format("{} - ", ::color::cyan("Note"));
    case xmpl:
        return fmt::format("{} - ", ::color::blue("Example"));
    case warn:
        return fmt::format("{} - ", ::color::red("Warning"));
    case none:
    case code:
        break;
    }
    return "";
}

} // namespace

std::string render(const item& i) {
    const auto* b = std::get_if<block>(&i.value);
    if (!b) {
        return "";
    }
    if (b->kind == block::code) {
        std::vector<std::string> lines;
        for (auto& l : b->lines) {
            lines.push_back(fmt::format("  {}", ::color::white(l)));
        }
        return util::join("\n", lines);
    }
    return label(b->kind) + util::join("\n", b->lines);
}

} // namespace help
