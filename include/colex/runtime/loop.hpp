#pragma once

#include <colex/core/error.hpp>
#include <colex/ir/node.hpp>
#include <colex/runtime/interpreter.hpp>
#include <colex/runtime/pipeline.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace colex::runtime {

/// Store the value of an evaluated root as field `field`.
///
/// A single value is repeated to the row count.  A field of the same name is
/// replaced.  Longer values must match the row count unless the pipeline has at
/// most one row, in which case the pipeline grows to the value's length.
[[nodiscard]] auto append_result(const ir::OpNode& root, const std::string& field,
                                 Pipeline& pipeline, bool renormalize = false) -> Result<void>;

/// Run `bodies[k]` for every integer of [start, end), storing each result in
/// `targets[k]` before the next body runs.
///
/// Leaves named `loop_var` are pinned to the iteration value and take precedence
/// over a pipeline field of the same name.  They are released when the loop ends.
[[nodiscard]] auto run_loop(const std::string& loop_var, std::int64_t start, std::int64_t end,
                            std::span<const ir::NodePtr> bodies,
                            const std::vector<std::string>& targets, Pipeline& pipeline,
                            EvalEnv* env = nullptr) -> Result<void>;

}  // namespace colex::runtime
