#pragma once

#include <fmt/core.h>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace colex {

/// Failure classes reported by parsing and evaluation.
enum class ErrorKind : std::uint8_t {
    Parse,   // mismatched parens, unknown function, wrong argument count
    Type,    // argument kind does not match the declared signature
    Shape,   // broadcasting length mismatch, gather index out of range
    Domain,  // division by zero, invalid log input, IRR non-convergence
    Lookup,  // missing pipeline field
};

struct Error {
    ErrorKind kind = ErrorKind::Parse;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

/// Result type for every fallible colex operation.
template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto kind_name(ErrorKind kind) noexcept -> std::string_view;

template <typename... Args>
[[nodiscard]] auto make_error(ErrorKind kind, fmt::format_string<Args...> message, Args&&... args)
    -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = kind, .message = fmt::format(message, std::forward<Args>(args)...)});
}

}  // namespace colex
