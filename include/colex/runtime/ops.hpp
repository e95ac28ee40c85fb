#pragma once

#include <colex/core/error.hpp>
#include <colex/core/typed_column.hpp>
#include <colex/ir/node.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace colex::runtime::ops {

/// Output length and per-operand strides for a broadcast.
///
/// An operand of length 1 advances with stride 0 (element 0 is reused), every
/// other operand with stride 1.
struct Broadcast {
    std::size_t length = 0;
    std::vector<std::size_t> strides;
};

/// Resolve the broadcast of operands with the given lengths.
///
/// Every length other than 1 must equal the longest one; anything else is a
/// ShapeError.
[[nodiscard]] auto broadcast(std::span<const std::size_t> lengths) -> Result<Broadcast>;

/// Evaluate a binary operator with broadcasting.
[[nodiscard]] auto apply_binary(ir::BinaryOp op, const TypedColumn& lhs, const TypedColumn& rhs)
    -> Result<TypedColumn>;

/// Arithmetic negation of numeric columns; string and timestamp columns are returned as is.
///
/// Negating the most negative value of an integer column is a DomainError.
[[nodiscard]] auto negate(const TypedColumn& column) -> Result<TypedColumn>;

/// `base` raised to `exponent`; a NaN result from non-NaN inputs is a DomainError.
[[nodiscard]] auto power(double base, double exponent) -> Result<double>;

namespace detail {

template <typename T>
struct result_value {
    using type = T;
    static constexpr bool fallible = false;
};

template <typename T>
struct result_value<Result<T>> {
    using type = T;
    static constexpr bool fallible = true;
};

}  // namespace detail

/// Apply `kernel` element by element over broadcast columns.
///
/// The kernel receives one element of every column and returns either a value
/// or a Result; the first failing element aborts the whole call.
template <typename F, typename... In>
[[nodiscard]] auto zip_broadcast(F&& kernel, const Column<In>&... columns)
    -> Result<Column<typename detail::result_value<std::invoke_result_t<F, const In&...>>::type>> {
    using Returned = std::invoke_result_t<F, const In&...>;
    using Traits = detail::result_value<Returned>;
    using Out = typename Traits::type;

    const std::array<std::size_t, sizeof...(In)> lengths = {columns.size()...};
    auto shape = broadcast(lengths);
    if (!shape) {
        return std::unexpected(shape.error());
    }
    Column<Out> out;
    out.reserve(shape->length);
    std::array<std::size_t, sizeof...(In)> positions{};
    for (std::size_t row = 0; row < shape->length; ++row) {
        auto call = [&]<std::size_t... I>(std::index_sequence<I...>) -> Returned {
            return kernel(columns[positions[I]]...);
        };
        if constexpr (Traits::fallible) {
            auto value = call(std::index_sequence_for<In...>{});
            if (!value) {
                return std::unexpected(value.error());
            }
            out.push_back(std::move(*value));
        } else {
            out.push_back(call(std::index_sequence_for<In...>{}));
        }
        for (std::size_t k = 0; k < positions.size(); ++k) {
            positions[k] += shape->strides[k];
        }
    }
    return out;
}

}  // namespace colex::runtime::ops
