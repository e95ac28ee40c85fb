#include <colex/runtime/function_registry.hpp>

#include "builtin_support.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

namespace colex::runtime {

namespace {

// Longest column range() builds.
constexpr std::uint64_t kMaxRangeLength = 100'000'000;

auto lag(const CallArgs& args) -> Result<TypedColumn> {
    const auto& x = args[0];
    auto fill = convert(args[1], x.kind());
    if (!fill) {
        return make_error(ErrorKind::Type, "lag() fill value: {}", fill.error().message);
    }
    if (fill->size() != 1) {
        return make_error(ErrorKind::Shape, "lag() fill must be a single value, got {}",
                          fill->size());
    }
    return std::visit(
        [&fill](const auto& col) -> Result<TypedColumn> {
            using Col = std::decay_t<decltype(col)>;
            Col out;
            out.reserve(col.size());
            if (!col.empty()) {
                out.push_back(fill->as<typename Col::value_type>()[0]);
            }
            for (std::size_t i = 1; i < col.size(); ++i) {
                out.push_back(col[i - 1]);
            }
            return TypedColumn{std::move(out)};
        },
        x.values());
}

auto gather(const CallArgs& args) -> Result<TypedColumn> {
    const auto& x = args[0];
    const auto& positions = args.floats(1);
    return std::visit(
        [&positions](const auto& col) -> Result<TypedColumn> {
            std::decay_t<decltype(col)> out;
            out.reserve(positions.size());
            for (double pos : positions) {
                if (!(pos >= 0.0) || pos >= static_cast<double>(col.size())) {
                    return make_error(ErrorKind::Shape, "index() position {} outside [0, {})", pos,
                                      col.size());
                }
                out.push_back(col[static_cast<std::size_t>(pos)]);
            }
            return TypedColumn{std::move(out)};
        },
        x.values());
}

auto range(const CallArgs& args) -> Result<TypedColumn> {
    auto start = builtins::scalar_arg(args, 0);
    if (!start) {
        return std::unexpected(start.error());
    }
    auto end = builtins::scalar_arg(args, 1);
    if (!end) {
        return std::unexpected(end.error());
    }
    const auto first = checked_integer<std::int64_t>(*start);
    const auto last = checked_integer<std::int64_t>(*end);
    if (!first.has_value() || !last.has_value()) {
        return make_error(ErrorKind::Domain,
                          "range() bounds must be finite integers, got {} and {}", *start, *end);
    }
    if (*last <= *first) {
        return make_error(ErrorKind::Domain, "range() end {} must exceed start {}", *last, *first);
    }
    // Both bounds fit in int64, so their difference fits in uint64.
    const auto length = static_cast<std::uint64_t>(*last) - static_cast<std::uint64_t>(*first);
    if (length > kMaxRangeLength) {
        return make_error(ErrorKind::Domain, "range() of {} values exceeds the limit of {}",
                          length, kMaxRangeLength);
    }
    Column<std::int64_t> out;
    out.reserve(static_cast<std::size_t>(length));
    for (auto value = *first; value < *last; ++value) {
        out.push_back(value);
    }
    return TypedColumn{std::move(out)};
}

// Exclusive running fold: out[i] folds every element strictly before (or after) row i.
template <typename Op>
auto running(const Column<double>& x, double identity, bool forward, Op op) -> Column<double> {
    const std::size_t n = x.size();
    Column<double> out;
    out.resize(n);
    double acc = identity;
    for (std::size_t step = 0; step < n; ++step) {
        const std::size_t i = forward ? step : n - 1 - step;
        out[i] = acc;
        acc = op(acc, x[i]);
    }
    return out;
}

auto running_function(std::string name, double identity, bool forward,
                      double (*op)(double, double)) -> FunctionDescriptor {
    return FunctionDescriptor{
        .name = std::move(name),
        .arg_kinds = {ArgKind::Numeric},
        .return_kind = ColumnKind::Float64,
        .impl = [identity, forward, op](const CallArgs& args) -> Result<TypedColumn> {
            return running(args.floats(0), identity, forward, op);
        },
    };
}

auto counting_function(std::string name, bool forward) -> FunctionDescriptor {
    return FunctionDescriptor{
        .name = std::move(name),
        .arg_kinds = {ArgKind::Any},
        .return_kind = ColumnKind::Int64,
        .impl = [forward](const CallArgs& args) -> Result<TypedColumn> {
            const std::size_t n = args[0].size();
            Column<std::int64_t> out;
            out.reserve(n);
            for (std::size_t i = 0; i < n; ++i) {
                out.push_back(static_cast<std::int64_t>(forward ? i : n - 1 - i));
            }
            return TypedColumn{std::move(out)};
        },
    };
}

auto add(double acc, double x) -> double {
    return acc + x;
}

auto multiply(double acc, double x) -> double {
    return acc * x;
}

}  // namespace

void register_window_functions(FunctionRegistry& registry) {
    registry.add(FunctionDescriptor{
        .name = "lag",
        .arg_kinds = {ArgKind::Any, ArgKind::Any},
        .impl = lag,
    });
    registry.add(FunctionDescriptor{
        .name = "row",
        .arg_kinds = {ArgKind::Any},
        .return_kind = ColumnKind::Int64,
        .impl = [](const CallArgs& args) -> Result<TypedColumn> {
            Column<std::int64_t> out;
            out.reserve(args[0].size());
            for (std::size_t i = 0; i < args[0].size(); ++i) {
                out.push_back(static_cast<std::int64_t>(i));
            }
            return TypedColumn{std::move(out)};
        },
    });
    registry.add(FunctionDescriptor{
        .name = "index",
        .arg_kinds = {ArgKind::Any, ArgKind::Numeric},
        .impl = gather,
    });
    registry.add(FunctionDescriptor{
        .name = "range",
        .arg_kinds = {ArgKind::Numeric, ArgKind::Numeric},
        .return_kind = ColumnKind::Int64,
        .impl = range,
    });

    registry.add(running_function("cumeBefore", 0.0, true, add));
    registry.add(running_function("cumeAfter", 0.0, false, add));
    registry.add(running_function("prodBefore", 1.0, true, multiply));
    registry.add(running_function("prodAfter", 1.0, false, multiply));
    registry.add(counting_function("countBefore", true));
    registry.add(counting_function("countAfter", false));

    // The evaluator resolves exist() itself; the implementation only serves
    // callers that hand it already evaluated arguments.
    registry.add(FunctionDescriptor{
        .name = "exist",
        .arg_kinds = {ArgKind::Any, ArgKind::Any},
        .arg_mode = ArgMode::Fallback,
        .impl = [](const CallArgs& args) -> Result<TypedColumn> { return args[0]; },
    });
}

}  // namespace colex::runtime
