#include <colex/core/typed_column.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <optional>
#include <type_traits>
#include <utility>

namespace colex {

namespace {

// One numeric value as Out; nullopt when it is not finite or does not fit.
template <typename Out, typename In>
auto narrow(In value) -> std::optional<Out> {
    if constexpr (std::is_floating_point_v<Out>) {
        return static_cast<Out>(value);
    } else if constexpr (std::is_floating_point_v<In>) {
        return checked_integer<Out>(value);
    } else if (std::in_range<Out>(value)) {
        return static_cast<Out>(value);
    } else {
        return std::nullopt;
    }
}

template <typename Out>
auto numeric_cast_column(const TypedColumn& column, ColumnKind target) -> Result<Column<Out>> {
    return std::visit(
        [target](const auto& col) -> Result<Column<Out>> {
            using ValueType = typename std::decay_t<decltype(col)>::value_type;
            Column<Out> out;
            if constexpr (std::is_arithmetic_v<ValueType>) {
                out.reserve(col.size());
                for (ValueType v : col) {
                    auto cast = narrow<Out>(v);
                    if (!cast.has_value()) {
                        return make_error(ErrorKind::Type, "{} does not fit in {}", v,
                                          kind_name(target));
                    }
                    out.push_back(*cast);
                }
            }
            return out;
        },
        column.values());
}

template <typename Out>
auto parse_column(const Column<std::string>& col, ColumnKind target) -> Result<Column<Out>> {
    Column<Out> out;
    out.reserve(col.size());
    for (const auto& text : col) {
        auto value = parse_number(text);
        if (!value.has_value()) {
            return make_error(ErrorKind::Type, "cannot convert '{}' to a number", text);
        }
        auto cast = narrow<Out>(*value);
        if (!cast.has_value()) {
            return make_error(ErrorKind::Type, "'{}' does not fit in {}", text,
                              kind_name(target));
        }
        out.push_back(*cast);
    }
    return out;
}

auto format_fixed(double value) -> std::string {
    return fmt::format("{:.2f}", value);
}

}  // namespace

auto TypedColumn::is_numeric() const noexcept -> bool {
    return colex::is_numeric(kind());
}

auto TypedColumn::numeric_at(std::size_t idx) const -> double {
    return std::visit(
        [idx](const auto& col) -> double {
            using ValueType = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_arithmetic_v<ValueType>) {
                return static_cast<double>(col[idx]);
            } else {
                return std::nan("");
            }
        },
        data_);
}

auto TypedColumn::format_at(std::size_t idx) const -> std::string {
    return std::visit(
        [idx](const auto& col) -> std::string {
            using ValueType = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<ValueType, Timestamp>) {
                return format_date(col[idx]);
            } else {
                return fmt::format("{}", col[idx]);
            }
        },
        data_);
}

auto kind_name(ColumnKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ColumnKind::Float64:
            return "Float64";
        case ColumnKind::Int32:
            return "Int32";
        case ColumnKind::Int64:
            return "Int64";
        case ColumnKind::String:
            return "String";
        case ColumnKind::Timestamp:
            return "Timestamp";
    }
    return "unknown";
}

auto role_name(Role role) noexcept -> std::string_view {
    switch (role) {
        case Role::Continuous:
            return "continuous";
        case Role::Categorical:
            return "categorical";
        case Role::Undetermined:
            return "undetermined";
    }
    return "unknown";
}

auto default_role(ColumnKind kind) noexcept -> Role {
    switch (kind) {
        case ColumnKind::Float64:
        case ColumnKind::Int64:
            return Role::Continuous;
        case ColumnKind::Int32:
        case ColumnKind::String:
            return Role::Categorical;
        case ColumnKind::Timestamp:
            return Role::Undetermined;
    }
    return Role::Undetermined;
}

auto parse_number(std::string_view text) -> std::optional<double> {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '-') {
        digits.remove_prefix(1);
    }
    // from_chars accepts "inf" and "nan"; those stay identifiers.
    if (digits.empty() ||
        (std::isdigit(static_cast<unsigned char>(digits.front())) == 0 && digits.front() != '.')) {
        return std::nullopt;
    }
    double value = 0.0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto convert(const TypedColumn& column, ColumnKind target) -> Result<TypedColumn> {
    const ColumnKind source = column.kind();
    if (source == target) {
        return column;
    }
    if (is_numeric(source)) {
        switch (target) {
            case ColumnKind::Float64:
                return numeric_cast_column<double>(column, target);
            case ColumnKind::Int32:
                return numeric_cast_column<std::int32_t>(column, target);
            case ColumnKind::Int64:
                return numeric_cast_column<std::int64_t>(column, target);
            case ColumnKind::String:
                if (source == ColumnKind::Float64) {
                    return column.as<double>().transform(format_fixed);
                }
                {
                    auto ints = numeric_cast_column<std::int64_t>(column, target);
                    if (!ints) {
                        return std::unexpected(std::move(ints).error());
                    }
                    return ints->transform([](std::int64_t v) { return fmt::format("{}", v); });
                }
            case ColumnKind::Timestamp:
                break;
        }
        return make_error(ErrorKind::Type, "cannot convert {} to {}", kind_name(source),
                          kind_name(target));
    }
    if (source == ColumnKind::String) {
        const auto& strings = column.as<std::string>();
        switch (target) {
            case ColumnKind::Float64:
                return parse_column<double>(strings, target);
            case ColumnKind::Int32:
                return parse_column<std::int32_t>(strings, target);
            case ColumnKind::Int64:
                return parse_column<std::int64_t>(strings, target);
            case ColumnKind::Timestamp: {
                Column<Timestamp> out;
                out.reserve(strings.size());
                for (const auto& text : strings) {
                    auto parsed = parse_date(text);
                    if (!parsed.has_value()) {
                        return make_error(ErrorKind::Type, "cannot convert '{}' to a date", text);
                    }
                    out.push_back(*parsed);
                }
                return out;
            }
            case ColumnKind::String:
                break;
        }
    }
    if (source == ColumnKind::Timestamp && target == ColumnKind::String) {
        return column.as<Timestamp>().transform(format_date);
    }
    return make_error(ErrorKind::Type, "cannot convert {} to {}", kind_name(source),
                      kind_name(target));
}

auto broadcast_to(const TypedColumn& column, std::size_t rows) -> TypedColumn {
    if (column.size() != 1 || rows <= 1) {
        return column;
    }
    return std::visit(
        [rows](const auto& col) -> TypedColumn {
            auto out = col;
            out.assign(rows, col[0]);
            return out;
        },
        column.values());
}

}  // namespace colex
