#include <colex/parser/scanner.hpp>

#include <array>
#include <cctype>

namespace colex::parser {

namespace {

constexpr std::array<std::string_view, 2> kLogical = {"&&", "||"};
constexpr std::array<std::string_view, 6> kComparison = {">", ">=", "<", "<=", "==", "!="};
constexpr std::array<std::string_view, 2> kAdditive = {"+", "-"};
constexpr std::array<std::string_view, 2> kMultiplicative = {"*", "/"};
constexpr std::array<std::string_view, 1> kPower = {"^"};

auto contains(std::span<const std::string_view> tokens, std::string_view candidate) -> bool {
    for (auto token : tokens) {
        if (token == candidate) {
            return true;
        }
    }
    return false;
}

// A sign is unary when it follows another operator or the exponent marker of a
// number such as 1e-3.
auto is_unary_sign(std::string_view text, std::size_t idx) -> bool {
    char prev = text[idx - 1];
    if (kOperatorChars.find(prev) != std::string_view::npos) {
        return true;
    }
    if ((prev == 'e' || prev == 'E') && idx >= 2) {
        std::size_t start = idx - 1;
        while (start > 0 && (std::isdigit(static_cast<unsigned char>(text[start - 1])) != 0 ||
                             text[start - 1] == '.')) {
            --start;
        }
        bool mantissa = start < idx - 1;
        bool preceded_by_name =
            start > 0 && (std::isalpha(static_cast<unsigned char>(text[start - 1])) != 0 ||
                          text[start - 1] == '_');
        return mantissa && !preceded_by_name;
    }
    return false;
}

}  // namespace

auto operators_of(Precedence precedence) noexcept -> std::span<const std::string_view> {
    switch (precedence) {
        case Precedence::Logical:
            return kLogical;
        case Precedence::Comparison:
            return kComparison;
        case Precedence::Additive:
            return kAdditive;
        case Precedence::Multiplicative:
            return kMultiplicative;
        case Precedence::Power:
            return kPower;
    }
    return {};
}

auto find_operator(std::string_view text, Precedence precedence) -> std::optional<Split> {
    const auto tokens = operators_of(precedence);
    // Products and quotients split at the last operator so that a/b/c is (a/b)/c.
    const bool rightmost = precedence == Precedence::Multiplicative;
    std::optional<Split> found;
    int depth = 0;
    bool in_quote = false;
    for (std::size_t idx = 0; idx + 1 < text.size(); ++idx) {
        char ch = text[idx];
        if (in_quote) {
            in_quote = ch != '\'';
            continue;
        }
        switch (ch) {
            case '\'':
                in_quote = true;
                continue;
            case '(':
                ++depth;
                continue;
            case ')':
                --depth;
                continue;
            default:
                break;
        }
        if (depth != 0 || idx == 0) {
            continue;
        }
        if (precedence == Precedence::Additive && is_unary_sign(text, idx)) {
            continue;
        }
        if (auto two = text.substr(idx, 2); contains(tokens, two)) {
            found = Split{.op = two, .left = text.substr(0, idx), .right = text.substr(idx + 2)};
            ++idx;
        } else if (auto one = text.substr(idx, 1); contains(tokens, one)) {
            found = Split{.op = one, .left = text.substr(0, idx), .right = text.substr(idx + 1)};
        }
        if (found.has_value() && !rightmost) {
            return found;
        }
    }
    return found;
}

auto matching_paren(std::string_view text, std::size_t open) noexcept -> std::size_t {
    int depth = 0;
    bool in_quote = false;
    for (std::size_t idx = open; idx < text.size(); ++idx) {
        char ch = text[idx];
        if (ch == '\'') {
            in_quote = !in_quote;
        } else if (!in_quote && ch == '(') {
            ++depth;
        } else if (!in_quote && ch == ')') {
            if (--depth == 0) {
                return idx;
            }
        }
    }
    return std::string_view::npos;
}

auto is_wrapped(std::string_view text) noexcept -> bool {
    return !text.empty() && text.front() == '(' && matching_paren(text, 0) + 1 == text.size();
}

auto strip_outer_parens(std::string_view text) noexcept -> std::string_view {
    while (is_wrapped(text)) {
        text = text.substr(1, text.size() - 2);
    }
    return text;
}

auto split_args(std::string_view body) -> std::vector<std::string_view> {
    std::vector<std::string_view> args;
    if (body.empty()) {
        return args;
    }
    int depth = 0;
    bool in_quote = false;
    std::size_t start = 0;
    for (std::size_t idx = 0; idx < body.size(); ++idx) {
        char ch = body[idx];
        if (ch == '\'') {
            in_quote = !in_quote;
        } else if (!in_quote && ch == '(') {
            ++depth;
        } else if (!in_quote && ch == ')') {
            --depth;
        } else if (!in_quote && depth == 0 && ch == ',') {
            args.push_back(body.substr(start, idx - start));
            start = idx + 1;
        }
    }
    args.push_back(body.substr(start));
    return args;
}

auto strip_whitespace(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    bool in_quote = false;
    for (char ch : text) {
        if (ch == '\'') {
            in_quote = !in_quote;
        }
        if (!in_quote && std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        out.push_back(ch);
    }
    return out;
}

auto check_balanced(std::string_view text) -> Result<void> {
    int depth = 0;
    bool in_quote = false;
    for (char ch : text) {
        if (ch == '\'') {
            in_quote = !in_quote;
        } else if (!in_quote && ch == '(') {
            ++depth;
        } else if (!in_quote && ch == ')' && --depth < 0) {
            return make_error(ErrorKind::Parse, "mismatched parentheses in '{}'", text);
        }
    }
    if (in_quote) {
        return make_error(ErrorKind::Parse, "unterminated string literal in '{}'", text);
    }
    if (depth != 0) {
        return make_error(ErrorKind::Parse, "mismatched parentheses in '{}'", text);
    }
    return {};
}

}  // namespace colex::parser
