#include <colex/colex.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

struct Assignment {
    std::string target;  // empty for a bare expression
    std::string expression;
};

auto is_identifier(std::string_view text) -> bool {
    return !text.empty() && std::isalpha(static_cast<unsigned char>(text.front())) != 0 &&
           std::ranges::all_of(text, [](unsigned char ch) {
               return std::isalnum(ch) != 0 || ch == '_';
           });
}

// "name=expr" assigns; "a==b" or "a>=b" are plain expressions.
auto split_assignment(const std::string& text) -> Assignment {
    const auto pos = text.find('=');
    if (pos == std::string::npos || pos + 1 >= text.size() || text[pos + 1] == '=') {
        return {.target = "", .expression = text};
    }
    std::string_view name(text.data(), pos);
    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back())) != 0) {
        name.remove_suffix(1);
    }
    if (!is_identifier(name)) {
        return {.target = "", .expression = text};
    }
    return {.target = std::string(name), .expression = text.substr(pos + 1)};
}

// "name=v1,v2,..." becomes a Float64 column when every value is a number,
// a String column otherwise.
auto parse_column_option(const std::string& option)
    -> colex::Result<std::pair<std::string, colex::TypedColumn>> {
    const auto pos = option.find('=');
    if (pos == std::string::npos || pos == 0) {
        return colex::make_error(colex::ErrorKind::Parse, "expected name=v1,v2,... got '{}'",
                                 option);
    }
    std::string name = option.substr(0, pos);
    std::vector<std::string> values;
    std::string_view rest(option);
    rest.remove_prefix(pos + 1);
    while (true) {
        const auto comma = rest.find(',');
        values.emplace_back(rest.substr(0, comma));
        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }

    colex::Column<double> numbers;
    for (const auto& value : values) {
        auto number = colex::parse_number(value);
        if (!number.has_value()) {
            return std::pair{std::move(name),
                             colex::TypedColumn{colex::Column<std::string>{std::move(values)}}};
        }
        numbers.push_back(*number);
    }
    return std::pair{std::move(name), colex::TypedColumn{std::move(numbers)}};
}

auto run_expression(const Assignment& assignment, colex::runtime::Pipeline& pipeline,
                    colex::runtime::EvalEnv& env) -> colex::Result<void> {
    auto tree = colex::parser::build_tree(assignment.expression);
    if (!tree) {
        return std::unexpected(tree.error());
    }
    auto value = colex::runtime::evaluate_value(**tree, pipeline, &env);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (!assignment.target.empty()) {
        return colex::runtime::append_result(**tree, assignment.target, pipeline);
    }
    const auto& column = **value;
    fmt::print("{} [{} x {}, {}]\n", assignment.expression, colex::kind_name(column.kind()),
               column.size(), colex::role_name((*tree)->role()));
    for (std::size_t i = 0; i < column.size(); ++i) {
        fmt::print("  {}: {}\n", i, column.format_at(i));
    }
    return {};
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"colex - evaluate column expressions"};

    bool verbose = false;
    std::vector<std::string> columns;
    std::vector<std::string> expressions;
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_option("-c,--column", columns,
                   "Input field as name=v1,v2,...  Numbers give a Float64 field, "
                   "anything else a String field.");
    app.add_option("-e,--expr", expressions,
                   "Expression to evaluate.  name=expr stores the result as a new field; "
                   "a bare expression prints its value.")
        ->required();

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    colex::runtime::MemoryPipeline pipeline;
    for (const auto& option : columns) {
        auto parsed = parse_column_option(option);
        if (!parsed) {
            spdlog::error("{}", parsed.error().format());
            return 1;
        }
        if (auto added = pipeline.add(std::move(parsed->first), std::move(parsed->second));
            !added) {
            spdlog::error("{}", added.error().format());
            return 1;
        }
    }

    colex::runtime::EvalEnv env;
    for (const auto& text : expressions) {
        const auto assignment = split_assignment(text);
        if (auto status = run_expression(assignment, pipeline, env); !status) {
            spdlog::error("'{}': {}", text, status.error().format());
            return 1;
        }
    }
    return 0;
}
