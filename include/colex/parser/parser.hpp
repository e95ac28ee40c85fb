#pragma once

#include <colex/core/error.hpp>
#include <colex/ir/node.hpp>
#include <colex/runtime/function_registry.hpp>

#include <string_view>

namespace colex::parser {

/// Parse an expression into an evaluation tree.
///
/// Whitespace outside quoted literals is ignored.  Function names are resolved
/// against `registry` when the tree is built, so an unknown name or a wrong
/// argument count fails here rather than during evaluation.  Whether a leaf is a
/// literal or a field is left to evaluation.
///
/// Fails with ErrorKind::Parse; no partial tree is returned.
[[nodiscard]] auto build_tree(std::string_view text, const runtime::FunctionRegistry& registry =
                                                         runtime::FunctionRegistry::builtin())
    -> Result<ir::NodePtr>;

}  // namespace colex::parser
