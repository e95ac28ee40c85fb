#pragma once

#include <colex/core/typed_column.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace colex::runtime {
struct FunctionDescriptor;
}  // namespace colex::runtime

namespace colex::ir {

/// Binary operators.  Subtraction is parsed as addition of a negated operand.
enum class BinaryOp : std::uint8_t {
    And,
    Or,
    Gt,
    Ge,
    Lt,
    Le,
    Eq,
    Ne,
    Add,
    Mul,
    Div,
    Pow,
};

[[nodiscard]] auto binary_op_from_symbol(std::string_view symbol) noexcept
    -> std::optional<BinaryOp>;
[[nodiscard]] auto symbol(BinaryOp op) noexcept -> std::string_view;

class OpNode;
using NodePtr = std::unique_ptr<OpNode>;

/// What a node applies to its children: nothing (leaf), an operator or a function.
using Functor = std::variant<std::monostate, BinaryOp, const runtime::FunctionDescriptor*>;

/// A node of a parsed expression.
///
/// The parser fills in the structural part (expression text, functor, negation,
/// children).  Evaluation overwrites the value and role of every node it visits,
/// so a tree must not be evaluated by two callers at once; clone it instead.
class OpNode {
   public:
    explicit OpNode(std::string expression) : expression_(std::move(expression)) {}

    OpNode(const OpNode&) = delete;
    auto operator=(const OpNode&) -> OpNode& = delete;
    OpNode(OpNode&&) = default;
    auto operator=(OpNode&&) -> OpNode& = default;
    ~OpNode() = default;

    [[nodiscard]] auto expression() const noexcept -> const std::string& { return expression_; }
    void set_expression(std::string expression) { expression_ = std::move(expression); }

    [[nodiscard]] auto negate() const noexcept -> bool { return negate_; }
    void set_negate(bool negate) noexcept { negate_ = negate; }

    [[nodiscard]] auto functor() const noexcept -> const Functor& { return functor_; }
    void set_functor(Functor functor) noexcept { functor_ = functor; }

    [[nodiscard]] auto is_leaf() const noexcept -> bool {
        return std::holds_alternative<std::monostate>(functor_);
    }

    [[nodiscard]] auto binary_op() const noexcept -> std::optional<BinaryOp> {
        if (const auto* op = std::get_if<BinaryOp>(&functor_)) {
            return *op;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto function() const noexcept -> const runtime::FunctionDescriptor* {
        if (const auto* fn = std::get_if<const runtime::FunctionDescriptor*>(&functor_)) {
            return *fn;
        }
        return nullptr;
    }

    [[nodiscard]] auto children() const noexcept -> const std::vector<NodePtr>& {
        return children_;
    }
    [[nodiscard]] auto child(std::size_t idx) noexcept -> OpNode& { return *children_[idx]; }
    [[nodiscard]] auto child(std::size_t idx) const noexcept -> const OpNode& {
        return *children_[idx];
    }
    void add_child(NodePtr child) { children_.push_back(std::move(child)); }

    [[nodiscard]] auto role() const noexcept -> Role { return role_; }
    void set_role(Role role) noexcept { role_ = role; }

    /// Result of the last evaluation; null before the node has been evaluated.
    [[nodiscard]] auto value() const noexcept -> const std::shared_ptr<const TypedColumn>& {
        return value_;
    }
    void set_value(std::shared_ptr<const TypedColumn> value) { value_ = std::move(value); }

    /// Pin a value that evaluation must keep (loop variables).
    void hold(TypedColumn value) {
        value_ = std::make_shared<const TypedColumn>(std::move(value));
        held_ = true;
    }
    void release() noexcept { held_ = false; }
    [[nodiscard]] auto held() const noexcept -> bool { return held_; }

   private:
    std::string expression_;
    Functor functor_;
    bool negate_ = false;
    std::vector<NodePtr> children_;
    Role role_ = Role::Undetermined;
    std::shared_ptr<const TypedColumn> value_;
    bool held_ = false;
};

/// Deep copy of a tree, including any computed values, sharing no mutable state.
[[nodiscard]] auto clone_tree(const OpNode& node) -> NodePtr;

/// Parenthesized prefix rendering, e.g. "(+ -a b)", for diagnostics and tests.
[[nodiscard]] auto describe(const OpNode& node) -> std::string;

}  // namespace colex::ir
