#include <colex/core/time.hpp>
#include <colex/runtime/function_registry.hpp>

#include "builtin_support.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

namespace colex::runtime {

namespace {

auto conversion(std::string name, ColumnKind target) -> FunctionDescriptor {
    return FunctionDescriptor{
        .name = std::move(name),
        .arg_kinds = {ArgKind::Any},
        .return_kind = target,
        .impl = [target](const CallArgs& args) -> Result<TypedColumn> {
            return convert(args[0], target);
        },
    };
}

// Categorical codes: numbers become Int32 codes, text stays text.
auto categorical(const CallArgs& args) -> Result<TypedColumn> {
    const auto& x = args[0];
    if (x.is_numeric()) {
        return convert(x, ColumnKind::Int32);
    }
    return convert(x, ColumnKind::String);
}

auto date_part(std::string name, std::int64_t (*part)(Timestamp)) -> FunctionDescriptor {
    return FunctionDescriptor{
        .name = std::move(name),
        .arg_kinds = {ArgKind::Date},
        .return_kind = ColumnKind::Int64,
        .impl = [part](const CallArgs& args) -> Result<TypedColumn> {
            return args[0].as<Timestamp>().transform(part);
        },
    };
}

auto substring(const std::string& text, double start, double length) -> Result<std::string> {
    if (std::isnan(start) || std::isnan(length)) {
        return make_error(ErrorKind::Domain, "substr() position {} and length {} must be numbers",
                          start, length);
    }
    const auto size = static_cast<double>(text.size());
    const double first = std::clamp(start, 0.0, size);
    const double count = std::clamp(length, 0.0, size - first);
    return text.substr(static_cast<std::size_t>(first), static_cast<std::size_t>(count));
}

auto as_text(const TypedColumn& column) -> Result<Column<std::string>> {
    auto text = convert(column, ColumnKind::String);
    if (!text) {
        return std::unexpected(text.error());
    }
    return text->as<std::string>();
}

}  // namespace

void register_conversion_functions(FunctionRegistry& registry) {
    registry.add(conversion("toFloat", ColumnKind::Float64));
    registry.add(conversion("toInt", ColumnKind::Int64));
    registry.add(conversion("toString", ColumnKind::String));
    registry.add(conversion("toDate", ColumnKind::Timestamp));

    registry.add(FunctionDescriptor{
        .name = "cat",
        .arg_kinds = {ArgKind::Any},
        .role = Role::Categorical,
        .impl = categorical,
    });

    registry.add(FunctionDescriptor{
        .name = "dateAdd",
        .arg_kinds = {ArgKind::Date, ArgKind::Numeric},
        .return_kind = ColumnKind::Timestamp,
        .impl = [](const CallArgs& args) -> Result<TypedColumn> {
            return builtins::lift(ops::zip_broadcast(
                [](const Timestamp& ts, double months) -> Result<Timestamp> {
                    auto count = checked_integer<std::int64_t>(months);
                    auto shifted = count ? add_months(ts, *count) : std::nullopt;
                    if (!shifted) {
                        return make_error(ErrorKind::Domain,
                                          "dateAdd() cannot move {} by {} months",
                                          format_date(ts), months);
                    }
                    return *shifted;
                },
                args[0].as<Timestamp>(), args.floats(1)));
        },
    });
    registry.add(FunctionDescriptor{
        .name = "dateDiff",
        .arg_kinds = {ArgKind::Date, ArgKind::Date},
        .return_kind = ColumnKind::Int64,
        .impl = [](const CallArgs& args) -> Result<TypedColumn> {
            return builtins::lift(ops::zip_broadcast(
                [](const Timestamp& to, const Timestamp& from) { return days_between(from, to); },
                args[0].as<Timestamp>(), args[1].as<Timestamp>()));
        },
    });
    registry.add(date_part("year", year_of));
    registry.add(date_part("month", month_of));

    registry.add(FunctionDescriptor{
        .name = "substr",
        .arg_kinds = {ArgKind::String, ArgKind::Numeric, ArgKind::Numeric},
        .return_kind = ColumnKind::String,
        .impl = [](const CallArgs& args) -> Result<TypedColumn> {
            return builtins::lift(
                ops::zip_broadcast(substring, args.strings(0), args.floats(1), args.floats(2)));
        },
    });
    registry.add(FunctionDescriptor{
        .name = "strPos",
        .arg_kinds = {ArgKind::String, ArgKind::String},
        .return_kind = ColumnKind::Int64,
        .impl = [](const CallArgs& args) -> Result<TypedColumn> {
            return builtins::lift(ops::zip_broadcast(
                [](const std::string& haystack, const std::string& needle) -> std::int64_t {
                    auto pos = haystack.find(needle);
                    return pos == std::string::npos ? -1 : static_cast<std::int64_t>(pos);
                },
                args.strings(0), args.strings(1)));
        },
    });
    registry.add(FunctionDescriptor{
        .name = "strLen",
        .arg_kinds = {ArgKind::String},
        .return_kind = ColumnKind::Int64,
        .impl = [](const CallArgs& args) -> Result<TypedColumn> {
            return args.strings(0).transform(
                [](const std::string& text) { return static_cast<std::int64_t>(text.size()); });
        },
    });
    registry.add(FunctionDescriptor{
        .name = "concat",
        .arg_kinds = {ArgKind::Any, ArgKind::Any},
        .return_kind = ColumnKind::String,
        .impl = [](const CallArgs& args) -> Result<TypedColumn> {
            auto lhs = as_text(args[0]);
            if (!lhs) {
                return std::unexpected(lhs.error());
            }
            auto rhs = as_text(args[1]);
            if (!rhs) {
                return std::unexpected(rhs.error());
            }
            return builtins::lift(ops::zip_broadcast(
                [](const std::string& a, const std::string& b) { return a + b; }, *lhs, *rhs));
        },
    });
}

}  // namespace colex::runtime
