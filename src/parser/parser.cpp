#include <colex/parser/parser.hpp>
#include <colex/parser/scanner.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace colex::parser {

namespace {

enum class Negation : std::uint8_t {
    Whole,         // -(a*b), -f(x), -a
    FirstOperand,  // -a+b is (-a)+b
};

// Where a leading minus applies.  It binds tighter than the additive, comparison
// and logical operators, and looser than products and powers.
auto negation_placement(std::string_view text) -> Negation {
    if (is_wrapped(text.substr(1))) {
        return Negation::Whole;
    }
    for (auto precedence : kPrecedenceOrder) {
        if (!find_operator(text, precedence).has_value()) {
            continue;
        }
        return precedence == Precedence::Multiplicative || precedence == Precedence::Power
                   ? Negation::Whole
                   : Negation::FirstOperand;
    }
    return Negation::Whole;
}

struct Call {
    std::string_view name;
    std::string_view body;
};

// name(...) where the parenthesized group runs to the end of the text.
auto match_call(std::string_view text) -> std::optional<Call> {
    const auto open = text.find('(');
    if (open == 0 || open == std::string_view::npos) {
        return std::nullopt;
    }
    const auto name = text.substr(0, open);
    if (!std::ranges::all_of(name, [](unsigned char ch) { return std::isalpha(ch) != 0; })) {
        return std::nullopt;
    }
    const auto group = text.substr(open);
    if (!is_wrapped(group)) {
        return std::nullopt;
    }
    return Call{.name = name, .body = group.substr(1, group.size() - 2)};
}

auto has_bare_paren(std::string_view text) -> bool {
    bool in_quote = false;
    for (char ch : text) {
        if (ch == '\'') {
            in_quote = !in_quote;
        } else if (!in_quote && (ch == '(' || ch == ')')) {
            return true;
        }
    }
    return false;
}

auto build_node(std::string_view text, const runtime::FunctionRegistry& registry)
    -> Result<ir::NodePtr> {
    text = strip_outer_parens(text);
    bool negate = false;
    bool negate_first = false;
    while (!text.empty() && text.front() == '-' && !negate_first) {
        if (negation_placement(text) == Negation::Whole) {
            negate = !negate;
        } else {
            negate_first = true;
        }
        text = strip_outer_parens(text.substr(1));
    }
    if (text.empty()) {
        return make_error(ErrorKind::Parse, "empty operand");
    }

    auto node = std::make_unique<ir::OpNode>(std::string(text));
    node->set_negate(negate);

    if (auto call = match_call(text)) {
        const auto* fn = registry.find(call->name);
        if (fn == nullptr) {
            return make_error(ErrorKind::Parse, "unknown function: {}", call->name);
        }
        const auto args = split_args(call->body);
        if (!fn->arg_kinds.empty() && args.size() != fn->arg_kinds.size()) {
            return make_error(ErrorKind::Parse,
                              "wrong number of arguments in {}: expected {}, got {}", fn->name,
                              fn->arg_kinds.size(), args.size());
        }
        node->set_functor(fn);
        for (auto arg : args) {
            auto child = build_node(arg, registry);
            if (!child) {
                return child;
            }
            node->add_child(std::move(*child));
        }
    } else {
        std::optional<Split> split;
        for (auto precedence : kPrecedenceOrder) {
            if ((split = find_operator(text, precedence))) {
                break;
            }
        }
        if (!split.has_value()) {
            if (has_bare_paren(text)) {
                return make_error(ErrorKind::Parse, "malformed operand '{}'", text);
            }
            if (kOperatorChars.find(text.back()) != std::string_view::npos) {
                return make_error(ErrorKind::Parse, "missing operand after '{}'", text);
            }
            return node;
        }
        if (split->left.empty() || split->right.empty()) {
            return make_error(ErrorKind::Parse, "missing operand for {} in '{}'", split->op, text);
        }
        auto op = ir::binary_op_from_symbol(split->op);
        std::string right(split->right);
        if (split->op == "-") {
            op = ir::BinaryOp::Add;
            right.insert(right.begin(), '-');
        }
        if (!op.has_value()) {
            return make_error(ErrorKind::Parse, "unsupported operator {}", split->op);
        }
        node->set_functor(*op);
        for (std::string_view operand : {split->left, std::string_view(right)}) {
            auto child = build_node(operand, registry);
            if (!child) {
                return child;
            }
            node->add_child(std::move(*child));
        }
    }

    if (negate_first && !node->children().empty()) {
        auto& first = node->child(0);
        first.set_negate(!first.negate());
    } else if (negate_first) {
        node->set_negate(!node->negate());
    }
    return node;
}

}  // namespace

auto build_tree(std::string_view text, const runtime::FunctionRegistry& registry)
    -> Result<ir::NodePtr> {
    const std::string cleaned = strip_whitespace(text);
    if (cleaned.empty()) {
        return make_error(ErrorKind::Parse, "empty expression");
    }
    Result<ir::NodePtr> tree;
    if (auto balanced = check_balanced(cleaned); !balanced) {
        tree = std::unexpected(balanced.error());
    } else {
        tree = build_node(cleaned, registry);
    }
    if (!tree) {
        spdlog::debug("cannot parse '{}': {}", text, tree.error().message);
    }
    return tree;
}

}  // namespace colex::parser
