#include <cctype>
#include <cstddef>
#include <string_view>

#include <util/lex.h>

namespace lex {

bool operator==(const token& lhs, const token& rhs) {
    return lhs.loc == rhs.loc && lhs.kind == rhs.kind &&
           lhs.spelling == rhs.spelling;
}

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c));
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_symbol(char c) {
    return c == '_' || std::isalpha(static_cast<unsigned char>(c));
}

// the kind of a single character token, or error
tok punctuation(char c) {
    switch (c) {
    case '@':
        return tok::at;
    case '/':
        return tok::slash;
    case ':':
        return tok::colon;
    case '-':
        return tok::dash;
    case '.':
        return tok::dot;
    case '=':
        return tok::equals;
    case '+':
        return tok::plus;
    default:
        return tok::error;
    }
}

} // namespace

// scans tokens from the input on demand.
// the token at pos_ is always available in current_.
class lexer_impl {
  public:
    explicit lexer_impl(std::string_view input) : input_(input) {
        current_ = scan(pos_);
    }

    std::string string() const {
        return std::string(input_);
    }

    token next() {
        const auto t = current_;
        // error and end tokens do not advance the input
        if (t.kind != tok::error && t.kind != tok::end) {
            pos_ += t.spelling.size();
            current_ = scan(pos_);
        }
        return t;
    }

    token peek(unsigned n) const {
        auto pos = pos_;
        auto t = current_;
        while (n-- && t.kind != tok::error && t.kind != tok::end) {
            pos += t.spelling.size();
            t = scan(pos);
        }
        return t;
    }

    tok current_kind() const {
        return current_.kind;
    }

  private:
    // the token that starts at pos
    token scan(std::size_t pos) const {
        const auto loc = static_cast<unsigned>(pos);
        if (pos >= input_.size()) {
            return {loc, tok::end, input_.substr(input_.size(), 0)};
        }
        const char c = input_[pos];
        if (is_symbol(c)) {
            return run(pos, tok::symbol, is_symbol);
        }
        if (is_digit(c)) {
            return run(pos, tok::integer, is_digit);
        }
        if (is_space(c)) {
            return run(pos, tok::whitespace, is_space);
        }
        return {loc, punctuation(c), input_.substr(pos, 1)};
    }

    // the longest run of characters that satisfy pred, starting at pos
    template <typename Pred>
    token run(std::size_t pos, tok kind, Pred pred) const {
        auto last = pos;
        while (last < input_.size() && pred(input_[last])) {
            ++last;
        }
        return {static_cast<unsigned>(pos), kind,
                input_.substr(pos, last - pos)};
    }

    std::string_view input_;
    std::size_t pos_ = 0;
    token current_;
};

lexer::lexer(std::string_view input)
    : impl_(std::make_unique<lexer_impl>(input)) {
}

token lexer::next() {
    return impl_->next();
}

token lexer::peek(unsigned n) {
    return impl_->peek(n);
}

tok lexer::current_kind() const {
    return impl_->current_kind();
}

std::string lexer::string() const {
    return impl_->string();
}

lexer::~lexer() = default;

} // namespace lex
