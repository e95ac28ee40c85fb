#pragma once

#include <colex/core/error.hpp>
#include <colex/core/typed_column.hpp>
#include <colex/runtime/function_registry.hpp>
#include <colex/runtime/ops.hpp>

#include <cstddef>
#include <string>
#include <utility>

// Helpers shared by the builtins_*.cpp registration units.
namespace colex::runtime::builtins {

/// Value returned by functions that are run for their side effects.
[[nodiscard]] inline auto sentinel() -> TypedColumn {
    return TypedColumn::scalar(0.0);
}

template <typename T>
[[nodiscard]] auto lift(Result<Column<T>> result) -> Result<TypedColumn> {
    if (!result) {
        return std::unexpected(result.error());
    }
    return TypedColumn{std::move(*result)};
}

/// First element of a numeric argument that must be a single value.
[[nodiscard]] inline auto scalar_arg(const CallArgs& args, std::size_t idx) -> Result<double> {
    const auto& column = args.floats(idx);
    if (column.size() != 1) {
        return make_error(ErrorKind::Shape, "{}() argument {} must be a single value, got {}",
                          args.node.function()->name, idx + 1, column.size());
    }
    return column[0];
}

/// First element of a string argument that must be a single value.
[[nodiscard]] inline auto text_arg(const CallArgs& args, std::size_t idx)
    -> Result<std::string> {
    const auto& column = args.strings(idx);
    if (column.size() != 1) {
        return make_error(ErrorKind::Shape, "{}() argument {} must be a single value, got {}",
                          args.node.function()->name, idx + 1, column.size());
    }
    return column[0];
}

/// Row function of one numeric argument applied element by element.
template <typename F>
[[nodiscard]] auto elementwise(std::string name, F fn) -> FunctionDescriptor {
    return FunctionDescriptor{
        .name = std::move(name),
        .arg_kinds = {ArgKind::Numeric},
        .return_kind = ColumnKind::Float64,
        .impl = [fn](const CallArgs& args) -> Result<TypedColumn> {
            return lift(ops::zip_broadcast(fn, args.floats(0)));
        },
    };
}

}  // namespace colex::runtime::builtins
