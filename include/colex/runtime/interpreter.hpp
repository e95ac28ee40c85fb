#pragma once

#include <colex/core/error.hpp>
#include <colex/core/typed_column.hpp>
#include <colex/ir/node.hpp>
#include <colex/runtime/pipeline.hpp>
#include <colex/runtime/plot.hpp>

#include <iostream>
#include <memory>
#include <ostream>

namespace colex::runtime {

/// Side-effect channels of an evaluation session.
///
/// Keep one EvalEnv alive across related evaluations: plot commands issued as
/// separate expressions accumulate into its PlotState.
struct EvalEnv {
    /// Destination of print() and printIf().
    std::ostream* out = &std::cout;
    /// Plotting backend used by render(); optional.
    RenderSink* sink = nullptr;
    PlotState plot;
};

/// Evaluate a parsed tree bottom-up against `pipeline`.
///
/// Every visited node gets a value; held nodes keep their pinned value.  On
/// failure the already-evaluated part of the tree stays populated, so the tree
/// should be discarded or re-cloned.  When `env` is null a temporary session
/// writing to stdout with no render sink is used.
[[nodiscard]] auto evaluate(ir::OpNode& node, Pipeline& pipeline, EvalEnv* env = nullptr)
    -> Result<void>;

/// Evaluate and hand back the root value.
[[nodiscard]] auto evaluate_value(ir::OpNode& node, Pipeline& pipeline, EvalEnv* env = nullptr)
    -> Result<std::shared_ptr<const TypedColumn>>;

}  // namespace colex::runtime
