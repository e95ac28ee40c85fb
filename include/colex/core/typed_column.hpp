#pragma once

#include <colex/core/column.hpp>
#include <colex/core/error.hpp>
#include <colex/core/time.hpp>

#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace colex {

/// Scalar kinds a TypedColumn can hold.  The order matches ColumnValue's alternatives.
enum class ColumnKind : std::uint8_t {
    Float64,
    Int32,
    Int64,
    String,
    Timestamp,
};

/// Logical classification of a column for downstream consumers.
enum class Role : std::uint8_t {
    Continuous,
    Categorical,
    Undetermined,
};

using ColumnValue = std::variant<Column<double>, Column<std::int32_t>, Column<std::int64_t>,
                                 Column<std::string>, Column<Timestamp>>;

/// A length-N sequence of same-kind scalars plus its kind tag.
///
/// A length-1 column is a scalar and broadcasts against longer columns.
class TypedColumn {
   public:
    TypedColumn() = default;

    template <typename T>
        requires std::constructible_from<ColumnValue, Column<T>>
    // NOLINTNEXTLINE(google-explicit-constructor)
    TypedColumn(Column<T> column) : data_(std::move(column)) {}

    [[nodiscard]] static auto scalar(double value) -> TypedColumn {
        return Column<double>{value};
    }
    [[nodiscard]] static auto scalar(std::int64_t value) -> TypedColumn {
        return Column<std::int64_t>{value};
    }
    [[nodiscard]] static auto scalar(std::string value) -> TypedColumn {
        return Column<std::string>{std::move(value)};
    }
    [[nodiscard]] static auto scalar(Timestamp value) -> TypedColumn {
        return Column<Timestamp>{value};
    }

    [[nodiscard]] auto kind() const noexcept -> ColumnKind {
        return static_cast<ColumnKind>(data_.index());
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return std::visit([](const auto& col) { return col.size(); }, data_);
    }

    [[nodiscard]] auto is_scalar() const noexcept -> bool { return size() == 1; }

    [[nodiscard]] auto is_numeric() const noexcept -> bool;

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> const Column<T>* {
        return std::get_if<Column<T>>(&data_);
    }

    template <typename T>
    [[nodiscard]] auto get_if() noexcept -> Column<T>* {
        return std::get_if<Column<T>>(&data_);
    }

    /// Typed access; the caller must have checked kind().
    template <typename T>
    [[nodiscard]] auto as() const -> const Column<T>& {
        return std::get<Column<T>>(data_);
    }

    [[nodiscard]] auto values() const noexcept -> const ColumnValue& { return data_; }

    /// Element `idx` of a numeric column widened to double.
    [[nodiscard]] auto numeric_at(std::size_t idx) const -> double;

    /// Display text of element `idx` (shortest round-trip for floats).
    [[nodiscard]] auto format_at(std::size_t idx) const -> std::string;

    [[nodiscard]] auto operator==(const TypedColumn&) const -> bool = default;

   private:
    ColumnValue data_;
};

[[nodiscard]] auto kind_name(ColumnKind kind) noexcept -> std::string_view;
[[nodiscard]] auto role_name(Role role) noexcept -> std::string_view;

[[nodiscard]] constexpr auto is_numeric(ColumnKind kind) noexcept -> bool {
    return kind == ColumnKind::Float64 || kind == ColumnKind::Int32 || kind == ColumnKind::Int64;
}

[[nodiscard]] constexpr auto is_integral(ColumnKind kind) noexcept -> bool {
    return kind == ColumnKind::Int32 || kind == ColumnKind::Int64;
}

/// Role a freshly computed column of `kind` gets when nothing more specific is known.
[[nodiscard]] auto default_role(ColumnKind kind) noexcept -> Role;

/// The single boundary conversion between column kinds.
///
/// Floats render as fixed two-decimal text, timestamps as M/D/YYYY.  Strings parse
/// as numbers or dates and fail with a TypeError when they do not.  Numbers never
/// convert to timestamps.
[[nodiscard]] auto convert(const TypedColumn& column, ColumnKind target) -> Result<TypedColumn>;

/// Repeat a length-1 column `rows` times; longer columns are returned unchanged.
[[nodiscard]] auto broadcast_to(const TypedColumn& column, std::size_t rows) -> TypedColumn;

/// `value` truncated toward zero when it is finite and fits in T.
template <std::signed_integral T>
[[nodiscard]] auto checked_integer(double value) noexcept -> std::optional<T> {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    const double truncated = std::trunc(value);
    // Both bounds are powers of two and exact as doubles.
    constexpr auto lowest = static_cast<double>(std::numeric_limits<T>::min());
    constexpr double limit = -lowest;
    if (truncated < lowest || truncated >= limit) {
        return std::nullopt;
    }
    return static_cast<T>(truncated);
}

/// Parse text that is entirely a floating point number.
[[nodiscard]] auto parse_number(std::string_view text) -> std::optional<double>;

}  // namespace colex
