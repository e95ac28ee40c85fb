#include <colex/runtime/loop.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace colex::runtime {

namespace {

void pin(ir::OpNode& node, const std::string& loop_var, std::int64_t value) {
    if (node.is_leaf() && node.expression() == loop_var) {
        node.hold(TypedColumn::scalar(node.negate() ? -value : value));
    }
    for (std::size_t idx = 0; idx < node.children().size(); ++idx) {
        pin(node.child(idx), loop_var, value);
    }
}

void release(ir::OpNode& node) {
    node.release();
    for (std::size_t idx = 0; idx < node.children().size(); ++idx) {
        release(node.child(idx));
    }
}

auto iterate(const std::string& loop_var, std::int64_t start, std::int64_t end,
             std::span<const ir::NodePtr> bodies, const std::vector<std::string>& targets,
             Pipeline& pipeline, EvalEnv& env) -> Result<void> {
    for (auto value = start; value < end; ++value) {
        spdlog::debug("loop {} = {}", loop_var, value);
        for (std::size_t k = 0; k < bodies.size(); ++k) {
            pin(*bodies[k], loop_var, value);
            if (auto status = evaluate(*bodies[k], pipeline, &env); !status) {
                return status;
            }
            if (auto status = append_result(*bodies[k], targets[k], pipeline); !status) {
                return status;
            }
        }
    }
    return {};
}

}  // namespace

auto append_result(const ir::OpNode& root, const std::string& field, Pipeline& pipeline,
                   bool renormalize) -> Result<void> {
    const auto& value = root.value();
    if (value == nullptr) {
        return make_error(ErrorKind::Shape, "cannot store '{}': expression not evaluated", field);
    }
    const std::size_t rows = pipeline.rows();
    if (value->size() > 1 && rows > 1 && value->size() != rows) {
        return make_error(ErrorKind::Shape, "cannot store '{}': expected {} rows, got {}", field,
                          rows, value->size());
    }
    if (pipeline.contains(field)) {
        if (auto dropped = pipeline.drop_column(field); !dropped) {
            return dropped;
        }
    }
    spdlog::debug("append field '{}' ({} {} rows, {})", field, kind_name(value->kind()),
                  value->size(), role_name(root.role()));
    return pipeline.append_column(field, broadcast_to(*value, pipeline.rows()), root.role(),
                                  renormalize);
}

auto run_loop(const std::string& loop_var, std::int64_t start, std::int64_t end,
              std::span<const ir::NodePtr> bodies, const std::vector<std::string>& targets,
              Pipeline& pipeline, EvalEnv* env) -> Result<void> {
    if (bodies.empty()) {
        return make_error(ErrorKind::Shape, "loop over '{}' has no bodies", loop_var);
    }
    if (bodies.size() != targets.size()) {
        return make_error(ErrorKind::Shape, "loop over '{}' has {} bodies but {} targets",
                          loop_var, bodies.size(), targets.size());
    }
    if (std::ranges::any_of(bodies, [](const ir::NodePtr& body) { return body == nullptr; })) {
        return make_error(ErrorKind::Shape, "loop over '{}' has an empty body", loop_var);
    }
    if (pipeline.contains(loop_var)) {
        spdlog::warn("loop variable '{}' shadows the pipeline field of the same name", loop_var);
    }

    EvalEnv local;
    auto status = iterate(loop_var, start, end, bodies, targets, pipeline,
                          env != nullptr ? *env : local);
    for (const auto& body : bodies) {
        release(*body);
    }
    return status;
}

}  // namespace colex::runtime
