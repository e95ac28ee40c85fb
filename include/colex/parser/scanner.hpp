#pragma once

#include <colex/core/error.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace colex::parser {

/// Operator precedence classes, lowest binding first.
enum class Precedence : std::uint8_t {
    Logical,         // && ||
    Comparison,      // > >= < <= == !=
    Additive,        // + -
    Multiplicative,  // * /
    Power,           // ^
};

inline constexpr std::array<Precedence, 5> kPrecedenceOrder = {
    Precedence::Logical, Precedence::Comparison, Precedence::Additive,
    Precedence::Multiplicative, Precedence::Power,
};

/// Characters that make up operator tokens.
inline constexpr std::string_view kOperatorChars = "+-*/^<>=&|!";

/// An expression split at a top-level binary operator.
struct Split {
    std::string_view op;
    std::string_view left;
    std::string_view right;
};

/// Operator tokens of a precedence class.
[[nodiscard]] auto operators_of(Precedence precedence) noexcept
    -> std::span<const std::string_view>;

/// Find the operator of `precedence` to split at, outside parentheses and quotes.
///
/// The first match wins except in the multiplicative class, where the last one
/// does.  Index 0 is never a split point.  Two-character tokens win over their
/// one-character prefixes.  In the additive class a sign directly after another
/// operator (or a numeric exponent) is unary and skipped.
[[nodiscard]] auto find_operator(std::string_view text, Precedence precedence)
    -> std::optional<Split>;

/// Index of the parenthesis closing the one at `open`, or npos.
[[nodiscard]] auto matching_paren(std::string_view text, std::size_t open) noexcept -> std::size_t;

/// True when the paren opened at position 0 closes at the last character.
[[nodiscard]] auto is_wrapped(std::string_view text) noexcept -> bool;

/// Strip fully wrapping parenthesis layers: "((a+b))" -> "a+b", "(a)+(b)" unchanged.
[[nodiscard]] auto strip_outer_parens(std::string_view text) noexcept -> std::string_view;

/// Split a function body at top-level commas.  An empty body has no arguments.
[[nodiscard]] auto split_args(std::string_view body) -> std::vector<std::string_view>;

/// Remove whitespace that is not inside a quoted literal.
[[nodiscard]] auto strip_whitespace(std::string_view text) -> std::string;

/// Verify parentheses balance and quotes are closed.
[[nodiscard]] auto check_balanced(std::string_view text) -> Result<void>;

}  // namespace colex::parser
