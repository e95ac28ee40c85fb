#include <colex/runtime/function_registry.hpp>
#include <colex/runtime/interpreter.hpp>

#include "builtin_support.hpp"

#include <fmt/ostream.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numeric>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace colex::runtime {

namespace {

constexpr int kIrrMaxIterations = 40;
constexpr double kIrrSeed = 0.05;
constexpr double kIrrStep = 0.05;
constexpr double kIrrTolerance = 1e-4;

auto numeric_reduction(std::string name, double (*reduce)(const Column<double>&))
    -> FunctionDescriptor {
    return FunctionDescriptor{
        .name = std::move(name),
        .arg_kinds = {ArgKind::Numeric},
        .return_kind = ColumnKind::Float64,
        .level = Level::Reduction,
        .impl = [reduce](const CallArgs& args) -> Result<TypedColumn> {
            return TypedColumn::scalar(reduce(args.floats(0)));
        },
    };
}

auto total(const Column<double>& x) -> double {
    return std::accumulate(x.begin(), x.end(), 0.0);
}

auto require_rows(const CallArgs& args, std::size_t minimum) -> Result<void> {
    if (args[0].size() < minimum) {
        return make_error(ErrorKind::Domain, "{}() needs at least {} value(s), got {}",
                          args.node.function()->name, minimum, args[0].size());
    }
    return {};
}

auto mean(const CallArgs& args) -> Result<TypedColumn> {
    if (auto status = require_rows(args, 1); !status) {
        return std::unexpected(status.error());
    }
    const auto& x = args.floats(0);
    return TypedColumn::scalar(total(x) / static_cast<double>(x.size()));
}

auto sample_std(const CallArgs& args) -> Result<TypedColumn> {
    if (auto status = require_rows(args, 2); !status) {
        return std::unexpected(status.error());
    }
    const auto& x = args.floats(0);
    const double n = static_cast<double>(x.size());
    const double average = total(x) / n;
    double squares = 0.0;
    for (double v : x) {
        squares += (v - average) * (v - average);
    }
    return TypedColumn::scalar(std::sqrt(squares / (n - 1.0)));
}

// Lower median: the smallest value with at least half the sample at or below it.
auto median(const CallArgs& args) -> Result<TypedColumn> {
    if (auto status = require_rows(args, 1); !status) {
        return std::unexpected(status.error());
    }
    const auto span = args.floats(0).span();
    std::vector<double> sorted(span.begin(), span.end());
    std::ranges::sort(sorted);
    const auto rank = static_cast<std::size_t>(std::ceil(static_cast<double>(sorted.size()) * 0.5));
    return TypedColumn::scalar(sorted[rank - 1]);
}

auto extreme(const CallArgs& args, bool largest) -> Result<TypedColumn> {
    if (auto status = require_rows(args, 1); !status) {
        return std::unexpected(status.error());
    }
    return std::visit(
        [largest](const auto& col) -> Result<TypedColumn> {
            auto it = largest ? std::ranges::max_element(col) : std::ranges::min_element(col);
            return TypedColumn{std::decay_t<decltype(col)>{*it}};
        },
        args[0].values());
}

struct FitSums {
    double sse = 0.0;
    double absolute = 0.0;
    double total = 0.0;  // sum of squared deviations of y from its mean
    std::size_t rows = 0;
};

auto fit_sums(const CallArgs& args) -> Result<FitSums> {
    const auto& y = args.floats(0);
    const auto& fitted = args.floats(1);
    const std::array<std::size_t, 2> lengths = {y.size(), fitted.size()};
    auto shape = ops::broadcast(lengths);
    if (!shape) {
        return std::unexpected(shape.error());
    }
    FitSums sums{.rows = shape->length};
    if (sums.rows == 0) {
        return make_error(ErrorKind::Domain, "{}() of empty columns", args.node.function()->name);
    }
    double y_total = 0.0;
    for (std::size_t i = 0; i < sums.rows; ++i) {
        y_total += y[i * shape->strides[0]];
    }
    const double y_mean = y_total / static_cast<double>(sums.rows);
    for (std::size_t i = 0; i < sums.rows; ++i) {
        const double observed = y[i * shape->strides[0]];
        const double residual = observed - fitted[i * shape->strides[1]];
        sums.sse += residual * residual;
        sums.absolute += std::abs(residual);
        sums.total += (observed - y_mean) * (observed - y_mean);
    }
    return sums;
}

auto fit_statistic(std::string name, Result<double> (*statistic)(const FitSums&))
    -> FunctionDescriptor {
    return FunctionDescriptor{
        .name = std::move(name),
        .arg_kinds = {ArgKind::Numeric, ArgKind::Numeric},
        .return_kind = ColumnKind::Float64,
        .level = Level::Reduction,
        .impl = [statistic](const CallArgs& args) -> Result<TypedColumn> {
            auto sums = fit_sums(args);
            if (!sums) {
                return std::unexpected(sums.error());
            }
            auto value = statistic(*sums);
            if (!value) {
                return std::unexpected(value.error());
            }
            return TypedColumn::scalar(*value);
        },
    };
}

// Present value of `flows` where flow i is discounted by (1 + rate_i)^i.
auto present_value(const Column<double>& rates, const Column<double>& flows)
    -> Result<double> {
    const std::array<std::size_t, 2> lengths = {rates.size(), flows.size()};
    auto shape = ops::broadcast(lengths);
    if (!shape) {
        return std::unexpected(shape.error());
    }
    double value = 0.0;
    for (std::size_t i = 0; i < shape->length; ++i) {
        const double rate = rates[i * shape->strides[0]];
        value += flows[i * shape->strides[1]] * std::pow(1.0 + rate, -static_cast<double>(i));
    }
    return value;
}

auto npv(const CallArgs& args) -> Result<TypedColumn> {
    auto value = present_value(args.floats(0), args.floats(1));
    if (!value) {
        return std::unexpected(value.error());
    }
    return TypedColumn::scalar(*value);
}

// One-dimensional Nelder-Mead on the squared pricing error.  The cost is read from
// the first row, so a pipeline field holding one repeated value works as well.
auto irr(const CallArgs& args) -> Result<TypedColumn> {
    if (auto status = require_rows(args, 1); !status) {
        return std::unexpected(status.error());
    }
    const double cost = args.floats(0)[0];
    const auto& flows = args.floats(1);
    auto residual = [&](double rate) {
        const Column<double> rates{rate};
        auto value = present_value(rates, flows);
        return value ? *value - cost : std::numeric_limits<double>::quiet_NaN();
    };
    auto objective = [&](double rate) {
        const double r = residual(rate);
        const double squared = r * r;
        return std::isfinite(squared) ? squared : std::numeric_limits<double>::infinity();
    };

    double best = kIrrSeed;
    double worst = kIrrSeed + kIrrStep;
    double f_best = objective(best);
    double f_worst = objective(worst);
    for (int iteration = 0; iteration < kIrrMaxIterations; ++iteration) {
        if (f_worst < f_best) {
            std::swap(best, worst);
            std::swap(f_best, f_worst);
        }
        if (std::abs(worst - best) < std::numeric_limits<double>::epsilon() * 4.0) {
            break;
        }
        const double reflected = best + (best - worst);
        const double f_reflected = objective(reflected);
        if (f_reflected < f_best) {
            const double expanded = best + 2.0 * (best - worst);
            const double f_expanded = objective(expanded);
            if (f_expanded < f_reflected) {
                worst = expanded;
                f_worst = f_expanded;
            } else {
                worst = reflected;
                f_worst = f_reflected;
            }
            continue;
        }
        const bool outside = f_reflected < f_worst;
        const double contracted =
            outside ? best + 0.5 * (reflected - best) : best + 0.5 * (worst - best);
        const double f_contracted = objective(contracted);
        if (f_contracted < (outside ? f_reflected : f_worst) ||
            (outside && f_contracted == f_reflected)) {
            worst = contracted;
            f_worst = f_contracted;
        } else {
            worst = best + 0.5 * (worst - best);
            f_worst = objective(worst);
        }
    }
    if (f_worst < f_best) {
        best = worst;
    }
    const double error = residual(best);
    if (!(std::abs(error) <= kIrrTolerance * std::abs(cost))) {
        return make_error(ErrorKind::Domain, "irr() did not converge (rate {}, residual {})",
                          best, error);
    }
    return TypedColumn::scalar(best);
}

auto print_limit(double requested, std::size_t rows) -> std::size_t {
    if (!(requested > 0.0) || requested >= static_cast<double>(rows)) {
        return rows;
    }
    return static_cast<std::size_t>(requested);
}

auto print_rows(const CallArgs& args) -> Result<TypedColumn> {
    auto requested = builtins::scalar_arg(args, 1);
    if (!requested) {
        return std::unexpected(requested.error());
    }
    const auto& x = args[0];
    auto& out = *args.env.out;
    fmt::print(out, "{}\n", args.node.child(0).expression());
    const std::size_t limit = print_limit(*requested, x.size());
    for (std::size_t i = 0; i < limit; ++i) {
        fmt::print(out, "{}: {}\n", i, x.format_at(i));
    }
    return builtins::sentinel();
}

auto print_rows_if(const CallArgs& args) -> Result<TypedColumn> {
    auto requested = builtins::scalar_arg(args, 1);
    if (!requested) {
        return std::unexpected(requested.error());
    }
    const auto& x = args[0];
    const auto& cond = args.floats(2);
    const std::array<std::size_t, 2> lengths = {x.size(), cond.size()};
    auto shape = ops::broadcast(lengths);
    if (!shape) {
        return std::unexpected(shape.error());
    }
    auto& out = *args.env.out;
    fmt::print(out, "{}\n", args.node.child(0).expression());
    const std::size_t limit = print_limit(*requested, shape->length);
    std::size_t printed = 0;
    for (std::size_t i = 0; i < shape->length && printed < limit; ++i) {
        if (cond[i * shape->strides[1]] > 0.0) {
            fmt::print(out, "{}: {}\n", i, x.format_at(i * shape->strides[0]));
            ++printed;
        }
    }
    return builtins::sentinel();
}

}  // namespace

void register_reduction_functions(FunctionRegistry& registry) {
    registry.add(numeric_reduction("sum", total));
    registry.add(FunctionDescriptor{
        .name = "mean",
        .arg_kinds = {ArgKind::Numeric},
        .return_kind = ColumnKind::Float64,
        .level = Level::Reduction,
        .impl = mean,
    });
    registry.add(FunctionDescriptor{
        .name = "min",
        .arg_kinds = {ArgKind::Any},
        .level = Level::Reduction,
        .impl = [](const CallArgs& args) { return extreme(args, false); },
    });
    registry.add(FunctionDescriptor{
        .name = "max",
        .arg_kinds = {ArgKind::Any},
        .level = Level::Reduction,
        .impl = [](const CallArgs& args) { return extreme(args, true); },
    });
    registry.add(FunctionDescriptor{
        .name = "std",
        .arg_kinds = {ArgKind::Numeric},
        .return_kind = ColumnKind::Float64,
        .level = Level::Reduction,
        .impl = sample_std,
    });
    registry.add(FunctionDescriptor{
        .name = "count",
        .arg_kinds = {ArgKind::Any},
        .return_kind = ColumnKind::Int64,
        .level = Level::Reduction,
        .impl = [](const CallArgs& args) -> Result<TypedColumn> {
            return TypedColumn::scalar(static_cast<std::int64_t>(args[0].size()));
        },
    });
    registry.add(FunctionDescriptor{
        .name = "median",
        .arg_kinds = {ArgKind::Numeric},
        .return_kind = ColumnKind::Float64,
        .level = Level::Reduction,
        .impl = median,
    });

    registry.add(fit_statistic("sse", [](const FitSums& sums) -> Result<double> {
        return sums.sse;
    }));
    registry.add(fit_statistic("mad", [](const FitSums& sums) -> Result<double> {
        return sums.absolute / static_cast<double>(sums.rows);
    }));
    registry.add(fit_statistic("r2", [](const FitSums& sums) -> Result<double> {
        if (sums.total == 0.0) {
            return make_error(ErrorKind::Domain, "r2() of a constant series");
        }
        return 1.0 - sums.sse / sums.total;
    }));

    registry.add(FunctionDescriptor{
        .name = "npv",
        .arg_kinds = {ArgKind::Numeric, ArgKind::Numeric},
        .return_kind = ColumnKind::Float64,
        .level = Level::Reduction,
        .impl = npv,
    });
    registry.add(FunctionDescriptor{
        .name = "irr",
        .arg_kinds = {ArgKind::Numeric, ArgKind::Numeric},
        .return_kind = ColumnKind::Float64,
        .level = Level::Reduction,
        .impl = irr,
    });

    registry.add(FunctionDescriptor{
        .name = "print",
        .arg_kinds = {ArgKind::Any, ArgKind::Numeric},
        .return_kind = ColumnKind::Float64,
        .level = Level::Reduction,
        .impl = print_rows,
    });
    registry.add(FunctionDescriptor{
        .name = "printIf",
        .arg_kinds = {ArgKind::Any, ArgKind::Numeric, ArgKind::Numeric},
        .return_kind = ColumnKind::Float64,
        .level = Level::Reduction,
        .impl = print_rows_if,
    });
}

}  // namespace colex::runtime
