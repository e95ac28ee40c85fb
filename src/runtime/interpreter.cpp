#include <colex/runtime/function_registry.hpp>
#include <colex/runtime/interpreter.hpp>
#include <colex/runtime/ops.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace colex::runtime {

namespace {

auto arg_kind_name(ArgKind kind) -> std::string_view {
    switch (kind) {
        case ArgKind::Any:
            return "any";
        case ArgKind::Numeric:
            return "numeric";
        case ArgKind::String:
            return "string";
        case ArgKind::Date:
            return "date";
    }
    return "unknown";
}

// Numeric literal, quoted literal or pipeline field, decided by the text alone.
auto resolve_leaf(ir::OpNode& node, const Pipeline& pipeline) -> Result<void> {
    const auto& text = node.expression();
    if (auto number = parse_number(text)) {
        node.set_value(std::make_shared<const TypedColumn>(TypedColumn::scalar(*number)));
        node.set_role(Role::Continuous);
        return {};
    }
    if (text.find('\'') != std::string::npos) {
        std::string literal = text;
        std::erase(literal, '\'');
        node.set_value(
            std::make_shared<const TypedColumn>(TypedColumn::scalar(std::move(literal))));
        node.set_role(Role::Categorical);
        return {};
    }
    auto field = pipeline.get_column(text);
    if (!field) {
        return std::unexpected(field.error());
    }
    node.set_value(field->column);
    node.set_role(field->role);
    return {};
}

// Bring evaluated arguments to the kinds the descriptor declares.
auto normalize_args(const FunctionDescriptor& fn,
                    std::vector<std::shared_ptr<const TypedColumn>>& values) -> Result<void> {
    if (fn.arg_kinds.empty()) {
        return {};
    }
    for (std::size_t idx = 0; idx < values.size() && idx < fn.arg_kinds.size(); ++idx) {
        const ArgKind declared = fn.arg_kinds[idx];
        const ColumnKind actual = values[idx]->kind();
        std::optional<ColumnKind> target;
        bool accepted = true;
        switch (declared) {
            case ArgKind::Any:
                break;
            case ArgKind::Numeric:
                accepted = is_numeric(actual);
                target = ColumnKind::Float64;
                break;
            case ArgKind::String:
                accepted = actual == ColumnKind::String;
                break;
            case ArgKind::Date:
                accepted = actual == ColumnKind::Timestamp || actual == ColumnKind::String;
                target = ColumnKind::Timestamp;
                break;
        }
        if (!accepted) {
            return make_error(ErrorKind::Type, "{}() argument {} must be {}, got {}", fn.name,
                              idx + 1, arg_kind_name(declared), kind_name(actual));
        }
        if (target.has_value() && *target != actual) {
            auto converted = convert(*values[idx], *target);
            if (!converted) {
                return make_error(ErrorKind::Type, "{}() argument {}: {}", fn.name, idx + 1,
                                  converted.error().message);
            }
            values[idx] = std::make_shared<const TypedColumn>(std::move(*converted));
        }
    }
    return {};
}

auto evaluate_node(ir::OpNode& node, Pipeline& pipeline, EvalEnv& env) -> Result<void>;

// exist(a, b): a missing field in `a` is answered by `b`.
auto evaluate_fallback(ir::OpNode& node, Pipeline& pipeline, EvalEnv& env) -> Result<void> {
    auto& primary = node.child(0);
    auto attempt = evaluate_node(primary, pipeline, env);
    ir::OpNode* chosen = &primary;
    if (!attempt) {
        if (attempt.error().kind != ErrorKind::Lookup) {
            return attempt;
        }
        spdlog::debug("{}: '{}' unavailable ({}), using '{}'", node.function()->name,
                      primary.expression(), attempt.error().message, node.child(1).expression());
        chosen = &node.child(1);
        if (auto fallback = evaluate_node(*chosen, pipeline, env); !fallback) {
            return fallback;
        }
    }
    node.set_value(chosen->value());
    node.set_role(chosen->role());
    return {};
}

auto evaluate_function(ir::OpNode& node, const FunctionDescriptor& fn, Pipeline& pipeline,
                       EvalEnv& env) -> Result<void> {
    if (fn.arg_mode == ArgMode::Fallback) {
        if (node.children().size() != 2) {
            return make_error(ErrorKind::Parse, "{}() expects 2 arguments", fn.name);
        }
        return evaluate_fallback(node, pipeline, env);
    }
    CallArgs args{.node = node, .values = {}, .pipeline = pipeline, .env = env};
    args.values.reserve(node.children().size());
    for (std::size_t idx = 0; idx < node.children().size(); ++idx) {
        auto& child = node.child(idx);
        if (auto status = evaluate_node(child, pipeline, env); !status) {
            return status;
        }
        args.values.push_back(child.value());
    }
    if (auto status = normalize_args(fn, args.values); !status) {
        return status;
    }
    auto result = fn.impl(args);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (fn.level == Level::Reduction && result->size() != 1) {
        return make_error(ErrorKind::Shape, "{}() produced {} values, expected 1", fn.name,
                          result->size());
    }
    node.set_role(fn.role.value_or(default_role(result->kind())));
    node.set_value(std::make_shared<const TypedColumn>(std::move(*result)));
    return {};
}

auto evaluate_node(ir::OpNode& node, Pipeline& pipeline, EvalEnv& env) -> Result<void> {
    if (node.held()) {
        return {};
    }
    if (node.is_leaf()) {
        if (auto status = resolve_leaf(node, pipeline); !status) {
            return status;
        }
    } else if (auto op = node.binary_op()) {
        if (node.children().size() != 2) {
            return make_error(ErrorKind::Parse, "operator {} requires two operands",
                              ir::symbol(*op));
        }
        for (std::size_t idx = 0; idx < 2; ++idx) {
            if (auto status = evaluate_node(node.child(idx), pipeline, env); !status) {
                return status;
            }
        }
        auto result = ops::apply_binary(*op, *node.child(0).value(), *node.child(1).value());
        if (!result) {
            return std::unexpected(result.error());
        }
        node.set_role(default_role(result->kind()));
        node.set_value(std::make_shared<const TypedColumn>(std::move(*result)));
    } else if (const auto* fn = node.function()) {
        if (auto status = evaluate_function(node, *fn, pipeline, env); !status) {
            return status;
        }
    }
    if (node.negate() && node.value() != nullptr && node.value()->is_numeric()) {
        // Leaf values may be the pipeline's own storage; negation always copies.
        auto negated = ops::negate(*node.value());
        if (!negated) {
            return std::unexpected(negated.error());
        }
        node.set_value(std::make_shared<const TypedColumn>(std::move(*negated)));
    }
    return {};
}

}  // namespace

auto evaluate(ir::OpNode& node, Pipeline& pipeline, EvalEnv* env) -> Result<void> {
    if (env == nullptr) {
        EvalEnv local;
        return evaluate_node(node, pipeline, local);
    }
    return evaluate_node(node, pipeline, *env);
}

auto evaluate_value(ir::OpNode& node, Pipeline& pipeline, EvalEnv* env)
    -> Result<std::shared_ptr<const TypedColumn>> {
    if (auto status = evaluate(node, pipeline, env); !status) {
        return std::unexpected(status.error());
    }
    return node.value();
}

}  // namespace colex::runtime
