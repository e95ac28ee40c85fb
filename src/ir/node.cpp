#include <colex/ir/node.hpp>
#include <colex/runtime/function_registry.hpp>

#include <array>
#include <utility>

namespace colex::ir {

namespace {

constexpr std::array<std::pair<std::string_view, BinaryOp>, 12> kSymbols = {{
    {"&&", BinaryOp::And},
    {"||", BinaryOp::Or},
    {">", BinaryOp::Gt},
    {">=", BinaryOp::Ge},
    {"<", BinaryOp::Lt},
    {"<=", BinaryOp::Le},
    {"==", BinaryOp::Eq},
    {"!=", BinaryOp::Ne},
    {"+", BinaryOp::Add},
    {"*", BinaryOp::Mul},
    {"/", BinaryOp::Div},
    {"^", BinaryOp::Pow},
}};

}  // namespace

auto binary_op_from_symbol(std::string_view text) noexcept -> std::optional<BinaryOp> {
    for (const auto& [sym, op] : kSymbols) {
        if (sym == text) {
            return op;
        }
    }
    return std::nullopt;
}

auto symbol(BinaryOp op) noexcept -> std::string_view {
    for (const auto& [sym, candidate] : kSymbols) {
        if (candidate == op) {
            return sym;
        }
    }
    return "?";
}

auto clone_tree(const OpNode& node) -> NodePtr {
    auto copy = std::make_unique<OpNode>(node.expression());
    copy->set_functor(node.functor());
    copy->set_negate(node.negate());
    copy->set_role(node.role());
    if (node.value() != nullptr) {
        if (node.held()) {
            copy->hold(*node.value());
        } else {
            copy->set_value(std::make_shared<const TypedColumn>(*node.value()));
        }
    }
    for (const auto& child : node.children()) {
        copy->add_child(clone_tree(*child));
    }
    return copy;
}

auto describe(const OpNode& node) -> std::string {
    std::string out = node.negate() ? "-" : "";
    if (node.is_leaf()) {
        return out + node.expression();
    }
    out += "(";
    if (auto op = node.binary_op()) {
        out += symbol(*op);
    } else {
        out += node.function()->name;
    }
    for (const auto& child : node.children()) {
        out += " ";
        out += describe(*child);
    }
    out += ")";
    return out;
}

}  // namespace colex::ir
