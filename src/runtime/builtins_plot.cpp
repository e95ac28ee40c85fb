#include <colex/runtime/function_registry.hpp>
#include <colex/runtime/interpreter.hpp>
#include <colex/runtime/plot.hpp>

#include "builtin_support.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace colex::runtime {

namespace {

auto to_vector(const Column<double>& column) -> std::vector<double> {
    const auto span = column.span();
    return {span.begin(), span.end()};
}

auto set_plot_dim(const CallArgs& args) -> Result<TypedColumn> {
    auto width = builtins::scalar_arg(args, 0);
    if (!width) {
        return std::unexpected(width.error());
    }
    auto height = builtins::scalar_arg(args, 1);
    if (!height) {
        return std::unexpected(height.error());
    }
    if (!(*width > 0.0) || !(*height > 0.0)) {
        return make_error(ErrorKind::Domain, "setPlotDim() needs positive sizes, got {}x{}",
                          *width, *height);
    }
    args.env.plot.width = *width;
    args.env.plot.height = *height;
    return builtins::sentinel();
}

auto plot_xy(const CallArgs& args) -> Result<TypedColumn> {
    const auto& x = args.floats(0);
    const auto& y = args.floats(1);
    const std::array<std::size_t, 2> lengths = {x.size(), y.size()};
    auto shape = ops::broadcast(lengths);
    if (!shape) {
        return std::unexpected(shape.error());
    }
    auto type = builtins::text_arg(args, 2);
    if (!type) {
        return std::unexpected(type.error());
    }
    auto mode = scatter_mode(*type);
    if (!mode) {
        return std::unexpected(mode.error());
    }
    auto color = builtins::text_arg(args, 3);
    if (!color) {
        return std::unexpected(color.error());
    }
    Trace trace{.mode = std::move(*mode), .color = std::move(*color)};
    trace.x.reserve(shape->length);
    trace.y.reserve(shape->length);
    for (std::size_t i = 0; i < shape->length; ++i) {
        trace.x.push_back(x[i * shape->strides[0]]);
        trace.y.push_back(y[i * shape->strides[1]]);
    }
    args.env.plot.figure.traces.push_back(std::move(trace));
    return builtins::sentinel();
}

auto plot_line(const CallArgs& args) -> Result<TypedColumn> {
    auto type = builtins::text_arg(args, 1);
    if (!type) {
        return std::unexpected(type.error());
    }
    auto mode = scatter_mode(*type);
    if (!mode) {
        return std::unexpected(mode.error());
    }
    auto color = builtins::text_arg(args, 2);
    if (!color) {
        return std::unexpected(color.error());
    }
    Trace trace{
        .mode = std::move(*mode), .color = std::move(*color), .y = to_vector(args.floats(0))};
    trace.x.reserve(trace.y.size());
    for (std::size_t i = 0; i < trace.y.size(); ++i) {
        trace.x.push_back(static_cast<double>(i));
    }
    args.env.plot.figure.traces.push_back(std::move(trace));
    return builtins::sentinel();
}

auto histogram(const CallArgs& args) -> Result<TypedColumn> {
    auto color = builtins::text_arg(args, 1);
    if (!color) {
        return std::unexpected(color.error());
    }
    auto norm = builtins::text_arg(args, 2);
    if (!norm) {
        return std::unexpected(norm.error());
    }
    if (*norm != "counts" && *norm != "percent") {
        return make_error(ErrorKind::Domain,
                          "histogram() norm must be 'counts' or 'percent', got '{}'", *norm);
    }
    args.env.plot.figure.traces.push_back(Trace{
        .type = "histogram",
        .color = std::move(*color),
        .histnorm = *norm == "percent" ? "percent" : "",
        .x = to_vector(args.floats(0)),
    });
    return builtins::sentinel();
}

auto render(const CallArgs& args) -> Result<TypedColumn> {
    std::array<std::string, 4> text;
    for (std::size_t i = 0; i < text.size(); ++i) {
        auto value = builtins::text_arg(args, i);
        if (!value) {
            return std::unexpected(value.error());
        }
        text[i] = std::move(*value);
    }
    auto& env = args.env;
    if (env.sink == nullptr) {
        spdlog::warn("render('{}'): no render sink configured, {} trace(s) not drawn", text[0],
                     env.plot.figure.traces.size());
        return builtins::sentinel();
    }
    const Layout layout{
        .title = std::move(text[1]),
        .x_title = std::move(text[2]),
        .y_title = std::move(text[3]),
        .file_name = std::move(text[0]),
        .width = env.plot.width,
        .height = env.plot.height,
    };
    if (auto status = env.sink->render(env.plot.figure, layout); !status) {
        return std::unexpected(status.error());
    }
    return builtins::sentinel();
}

auto plot_function(std::string name, std::vector<ArgKind> arg_kinds, FunctionImpl impl)
    -> FunctionDescriptor {
    return FunctionDescriptor{
        .name = std::move(name),
        .arg_kinds = std::move(arg_kinds),
        .return_kind = ColumnKind::Float64,
        .level = Level::Reduction,
        .impl = std::move(impl),
    };
}

}  // namespace

void register_plot_functions(FunctionRegistry& registry) {
    registry.add(
        plot_function("setPlotDim", {ArgKind::Numeric, ArgKind::Numeric}, set_plot_dim));
    registry.add(plot_function("newPlot", {}, [](const CallArgs& args) -> Result<TypedColumn> {
        args.env.plot.reset();
        return builtins::sentinel();
    }));
    registry.add(plot_function(
        "plotXY", {ArgKind::Numeric, ArgKind::Numeric, ArgKind::String, ArgKind::String},
        plot_xy));
    registry.add(
        plot_function("plotLine", {ArgKind::Numeric, ArgKind::String, ArgKind::String}, plot_line));
    registry.add(plot_function("histogram",
                               {ArgKind::Numeric, ArgKind::String, ArgKind::String}, histogram));
    registry.add(plot_function(
        "render", {ArgKind::String, ArgKind::String, ArgKind::String, ArgKind::String}, render));
}

}  // namespace colex::runtime
