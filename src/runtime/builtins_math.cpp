#include <colex/runtime/function_registry.hpp>

#include "builtin_support.hpp"

#include <cmath>
#include <type_traits>
#include <utility>
#include <variant>

namespace colex::runtime {

namespace {

// if(cond, a, b): branches of one kind keep it, mixed numeric kinds meet at Float64.
auto select_rows(const CallArgs& args) -> Result<TypedColumn> {
    const auto& cond = args.floats(0);
    const TypedColumn* then_branch = &args[1];
    const TypedColumn* else_branch = &args[2];
    TypedColumn widened_then;
    TypedColumn widened_else;
    if (then_branch->kind() != else_branch->kind()) {
        if (!then_branch->is_numeric() || !else_branch->is_numeric()) {
            return make_error(ErrorKind::Type, "if() branches differ in kind: {} and {}",
                              kind_name(then_branch->kind()), kind_name(else_branch->kind()));
        }
        auto lhs = convert(*then_branch, ColumnKind::Float64);
        auto rhs = convert(*else_branch, ColumnKind::Float64);
        if (!lhs) {
            return std::unexpected(lhs.error());
        }
        if (!rhs) {
            return std::unexpected(rhs.error());
        }
        widened_then = std::move(*lhs);
        widened_else = std::move(*rhs);
        then_branch = &widened_then;
        else_branch = &widened_else;
    }
    return std::visit(
        [&](const auto& then_col) -> Result<TypedColumn> {
            using T = typename std::decay_t<decltype(then_col)>::value_type;
            const auto& else_col = else_branch->as<T>();
            return builtins::lift(ops::zip_broadcast(
                [](double c, const T& a, const T& b) -> T { return c > 0.0 ? a : b; }, cond,
                then_col, else_col));
        },
        then_branch->values());
}

}  // namespace

void register_math_functions(FunctionRegistry& registry) {
    using builtins::elementwise;

    registry.add(elementwise("abs", [](double x) { return std::abs(x); }));
    registry.add(elementwise("exp", [](double x) { return std::exp(x); }));
    registry.add(elementwise("log", [](double x) -> Result<double> {
        if (x <= 0.0) {
            return make_error(ErrorKind::Domain, "log() of non-positive value {}", x);
        }
        return std::log(x);
    }));
    registry.add(elementwise("sqrt", [](double x) -> Result<double> {
        if (x < 0.0) {
            return make_error(ErrorKind::Domain, "sqrt() of negative value {}", x);
        }
        return std::sqrt(x);
    }));

    registry.add(FunctionDescriptor{
        .name = "pow",
        .arg_kinds = {ArgKind::Numeric, ArgKind::Numeric},
        .return_kind = ColumnKind::Float64,
        .impl = [](const CallArgs& args) -> Result<TypedColumn> {
            return builtins::lift(ops::zip_broadcast(ops::power, args.floats(0), args.floats(1)));
        },
    });

    registry.add(FunctionDescriptor{
        .name = "if",
        .arg_kinds = {ArgKind::Numeric, ArgKind::Any, ArgKind::Any},
        .impl = select_rows,
    });
}

}  // namespace colex::runtime
