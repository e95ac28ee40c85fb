#pragma once

#include <colex/core/error.hpp>
#include <colex/core/typed_column.hpp>
#include <colex/ir/node.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace colex::runtime {

class Pipeline;
struct EvalEnv;

/// Whether a function yields one value per row or one value per column.
enum class Level : std::uint8_t {
    Row,
    Reduction,
};

/// Declared kind of a function argument.
///
/// Numeric arguments reach the implementation as Float64, Date arguments as
/// Timestamp (strings are parsed).  String arguments must already be strings.
enum class ArgKind : std::uint8_t {
    Any,
    Numeric,
    String,
    Date,
};

/// How the evaluator treats the arguments before calling the implementation.
enum class ArgMode : std::uint8_t {
    Eager,     // evaluate every argument first
    Fallback,  // evaluate the first; on a lookup failure use the second
};

/// Evaluated arguments handed to a function implementation.
struct CallArgs {
    const ir::OpNode& node;
    std::vector<std::shared_ptr<const TypedColumn>> values;
    Pipeline& pipeline;
    EvalEnv& env;

    [[nodiscard]] auto operator[](std::size_t idx) const -> const TypedColumn& {
        return *values[idx];
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return values.size(); }
    [[nodiscard]] auto floats(std::size_t idx) const -> const Column<double>& {
        return values[idx]->as<double>();
    }
    [[nodiscard]] auto strings(std::size_t idx) const -> const Column<std::string>& {
        return values[idx]->as<std::string>();
    }
};

using FunctionImpl = std::function<Result<TypedColumn>(const CallArgs&)>;

/// Immutable description of a callable function.
struct FunctionDescriptor {
    std::string name;
    /// Declared arguments in order; empty means the arity is not checked.
    std::vector<ArgKind> arg_kinds;
    /// Result kind; nullopt when it follows the arguments.
    std::optional<ColumnKind> return_kind;
    Level level = Level::Row;
    /// Role forced on the result (e.g. cat() is always categorical).
    std::optional<Role> role;
    ArgMode arg_mode = ArgMode::Eager;
    FunctionImpl impl;
};

/// Name-indexed table of functions.  Lookup ignores case.
///
/// Descriptors are never moved once added, so the pointers handed to parsed
/// trees stay valid for the registry's lifetime.
class FunctionRegistry {
   public:
    FunctionRegistry() = default;

    /// Register a function, replacing any previous one with the same name.
    void add(FunctionDescriptor descriptor);

    [[nodiscard]] auto find(std::string_view name) const -> const FunctionDescriptor*;

    [[nodiscard]] auto contains(std::string_view name) const -> bool {
        return find(name) != nullptr;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return registry_.size(); }

    /// Registered names, sorted.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    /// The built-in function table, constructed on first use.
    [[nodiscard]] static auto builtin() -> const FunctionRegistry&;

   private:
    std::unordered_map<std::string, FunctionDescriptor> registry_;
};

void register_math_functions(FunctionRegistry& registry);
void register_window_functions(FunctionRegistry& registry);
void register_conversion_functions(FunctionRegistry& registry);
void register_reduction_functions(FunctionRegistry& registry);
void register_plot_functions(FunctionRegistry& registry);

}  // namespace colex::runtime
