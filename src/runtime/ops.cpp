#include <colex/runtime/ops.hpp>

#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>

namespace colex::runtime::ops {

namespace {

template <typename Out>
auto widen(const TypedColumn& column) -> Column<Out> {
    return std::visit(
        [](const auto& col) -> Column<Out> {
            using ValueType = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_arithmetic_v<ValueType>) {
                return col.transform([](ValueType v) { return static_cast<Out>(v); });
            } else {
                return Column<Out>{};
            }
        },
        column.values());
}

auto type_error(ir::BinaryOp op, const TypedColumn& lhs, const TypedColumn& rhs)
    -> std::unexpected<Error> {
    return make_error(ErrorKind::Type, "operator {} not defined for {} and {}", ir::symbol(op),
                      kind_name(lhs.kind()), kind_name(rhs.kind()));
}

auto truth(bool value) -> double {
    return value ? 1.0 : 0.0;
}

template <typename T>
auto compare(ir::BinaryOp op, const Column<T>& lhs, const Column<T>& rhs) -> Result<TypedColumn> {
    auto result = zip_broadcast(
        [op](const T& a, const T& b) -> double {
            switch (op) {
                case ir::BinaryOp::Gt:
                    return truth(a > b);
                case ir::BinaryOp::Ge:
                    return truth(a >= b);
                case ir::BinaryOp::Lt:
                    return truth(a < b);
                case ir::BinaryOp::Le:
                    return truth(a <= b);
                case ir::BinaryOp::Eq:
                    return truth(a == b);
                case ir::BinaryOp::Ne:
                    return truth(a != b);
                default:
                    return 0.0;
            }
        },
        lhs, rhs);
    if (!result) {
        return std::unexpected(result.error());
    }
    return TypedColumn{std::move(*result)};
}

auto compare_columns(ir::BinaryOp op, const TypedColumn& lhs, const TypedColumn& rhs)
    -> Result<TypedColumn> {
    const auto lk = lhs.kind();
    const auto rk = rhs.kind();
    if (is_numeric(lk) && is_numeric(rk)) {
        return compare(op, widen<double>(lhs), widen<double>(rhs));
    }
    if (lk == ColumnKind::String && rk == ColumnKind::String) {
        return compare(op, lhs.as<std::string>(), rhs.as<std::string>());
    }
    if (lk == ColumnKind::Timestamp || rk == ColumnKind::Timestamp) {
        // A string compared with a date is read as a date literal.
        auto left = convert(lhs, ColumnKind::Timestamp);
        auto right = convert(rhs, ColumnKind::Timestamp);
        if (!left || !right || (lk != ColumnKind::String && lk != ColumnKind::Timestamp) ||
            (rk != ColumnKind::String && rk != ColumnKind::Timestamp)) {
            return type_error(op, lhs, rhs);
        }
        return compare(op, left->as<Timestamp>(), right->as<Timestamp>());
    }
    return type_error(op, lhs, rhs);
}

template <typename T>
auto wrap(Result<Column<T>> result) -> Result<TypedColumn> {
    if (!result) {
        return std::unexpected(result.error());
    }
    return TypedColumn{std::move(*result)};
}

auto arithmetic(ir::BinaryOp op, const TypedColumn& lhs, const TypedColumn& rhs)
    -> Result<TypedColumn> {
    if (!lhs.is_numeric() || !rhs.is_numeric()) {
        return type_error(op, lhs, rhs);
    }
    const bool integral = is_integral(lhs.kind()) && is_integral(rhs.kind());
    switch (op) {
        case ir::BinaryOp::Add:
            if (integral) {
                return wrap(zip_broadcast(
                    [](std::int64_t a, std::int64_t b) -> Result<std::int64_t> {
                        std::int64_t sum = 0;
                        if (__builtin_add_overflow(a, b, &sum)) {
                            return make_error(ErrorKind::Domain, "integer overflow in {} + {}", a,
                                              b);
                        }
                        return sum;
                    },
                    widen<std::int64_t>(lhs), widen<std::int64_t>(rhs)));
            }
            return wrap(zip_broadcast(std::plus<>{}, widen<double>(lhs), widen<double>(rhs)));
        case ir::BinaryOp::Mul:
            if (integral) {
                return wrap(zip_broadcast(
                    [](std::int64_t a, std::int64_t b) -> Result<std::int64_t> {
                        std::int64_t product = 0;
                        if (__builtin_mul_overflow(a, b, &product)) {
                            return make_error(ErrorKind::Domain, "integer overflow in {} * {}", a,
                                              b);
                        }
                        return product;
                    },
                    widen<std::int64_t>(lhs), widen<std::int64_t>(rhs)));
            }
            return wrap(
                zip_broadcast(std::multiplies<>{}, widen<double>(lhs), widen<double>(rhs)));
        case ir::BinaryOp::Div:
            return wrap(zip_broadcast(
                [](double a, double b) -> Result<double> {
                    if (b == 0.0) {
                        return make_error(ErrorKind::Domain, "divide by zero");
                    }
                    return a / b;
                },
                widen<double>(lhs), widen<double>(rhs)));
        case ir::BinaryOp::Pow:
            return wrap(zip_broadcast(power, widen<double>(lhs), widen<double>(rhs)));
        default:
            return type_error(op, lhs, rhs);
    }
}

}  // namespace

auto broadcast(std::span<const std::size_t> lengths) -> Result<Broadcast> {
    Broadcast shape;
    for (auto length : lengths) {
        shape.length = std::max(shape.length, length);
    }
    shape.strides.reserve(lengths.size());
    for (auto length : lengths) {
        if (length != 1 && length != shape.length) {
            return make_error(ErrorKind::Shape, "cannot broadcast length {} against length {}",
                              length, shape.length);
        }
        shape.strides.push_back(length == 1 ? 0 : 1);
    }
    return shape;
}

auto apply_binary(ir::BinaryOp op, const TypedColumn& lhs, const TypedColumn& rhs)
    -> Result<TypedColumn> {
    switch (op) {
        case ir::BinaryOp::And:
        case ir::BinaryOp::Or: {
            if (!lhs.is_numeric() || !rhs.is_numeric()) {
                return type_error(op, lhs, rhs);
            }
            const bool conjunction = op == ir::BinaryOp::And;
            return wrap(zip_broadcast(
                [conjunction](double a, double b) {
                    return conjunction ? truth(a > 0.0 && b > 0.0) : truth(a > 0.0 || b > 0.0);
                },
                widen<double>(lhs), widen<double>(rhs)));
        }
        case ir::BinaryOp::Gt:
        case ir::BinaryOp::Ge:
        case ir::BinaryOp::Lt:
        case ir::BinaryOp::Le:
        case ir::BinaryOp::Eq:
        case ir::BinaryOp::Ne:
            return compare_columns(op, lhs, rhs);
        case ir::BinaryOp::Add:
        case ir::BinaryOp::Mul:
        case ir::BinaryOp::Div:
        case ir::BinaryOp::Pow:
            return arithmetic(op, lhs, rhs);
    }
    return type_error(op, lhs, rhs);
}

auto negate(const TypedColumn& column) -> Result<TypedColumn> {
    return std::visit(
        [&column](const auto& col) -> Result<TypedColumn> {
            using ValueType = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_integral_v<ValueType>) {
                for (ValueType v : col) {
                    if (v == std::numeric_limits<ValueType>::min()) {
                        return make_error(ErrorKind::Domain, "integer overflow in -({})", v);
                    }
                }
                return TypedColumn{
                    col.transform([](ValueType v) { return static_cast<ValueType>(-v); })};
            } else if constexpr (std::is_arithmetic_v<ValueType>) {
                return TypedColumn{col.transform([](ValueType v) { return -v; })};
            } else {
                return column;
            }
        },
        column.values());
}

auto power(double base, double exponent) -> Result<double> {
    const double value = std::pow(base, exponent);
    if (std::isnan(value) && !std::isnan(base) && !std::isnan(exponent)) {
        return make_error(ErrorKind::Domain, "{}^{} is undefined", base, exponent);
    }
    return value;
}

}  // namespace colex::runtime::ops
