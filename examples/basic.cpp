#include <colex/colex.hpp>

#include <fmt/core.h>

auto main() -> int {
    colex::runtime::MemoryPipeline pipeline;
    if (!pipeline.add("price", colex::Column<double>{100.5, 200.3, 50.0, 175.8}) ||
        !pipeline.add("qty", colex::Column<double>{3.0, 1.0, 10.0, 2.0})) {
        return 1;
    }

    fmt::print("=== Derived field ===\n");
    auto notional = colex::parser::build_tree("price * qty");
    if (!notional) {
        fmt::print("parse error: {}\n", notional.error().format());
        return 1;
    }
    fmt::print("tree: {}\n", colex::ir::describe(**notional));
    if (auto status = colex::runtime::evaluate(**notional, pipeline); !status) {
        fmt::print("{}\n", status.error().format());
        return 1;
    }
    if (auto stored = colex::runtime::append_result(**notional, "notional", pipeline); !stored) {
        fmt::print("{}\n", stored.error().format());
        return 1;
    }

    fmt::print("\n=== Reductions ===\n");
    for (const char* text : {"sum(notional)", "mean(price)", "npv(.05, notional)"}) {
        auto tree = colex::parser::build_tree(text);
        if (!tree) {
            fmt::print("{}: {}\n", text, tree.error().format());
            continue;
        }
        auto value = colex::runtime::evaluate_value(**tree, pipeline);
        if (!value) {
            fmt::print("{}: {}\n", text, value.error().format());
            continue;
        }
        fmt::print("{} = {}\n", text, (*value)->format_at(0));
    }
    return 0;
}
