#include <colex/parser/parser.hpp>
#include <colex/runtime/function_registry.hpp>
#include <colex/runtime/interpreter.hpp>
#include <colex/runtime/pipeline.hpp>
#include <colex/runtime/plot.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

using namespace colex;

namespace {

auto run(const std::string& text, runtime::Pipeline& pipeline, runtime::EvalEnv* env = nullptr)
    -> Result<TypedColumn> {
    auto tree = parser::build_tree(text);
    REQUIRE(tree.has_value());
    auto value = runtime::evaluate_value(**tree, pipeline, env);
    if (!value) {
        return std::unexpected(value.error());
    }
    return **value;
}

auto value_of(const std::string& text, runtime::Pipeline& pipeline,
              runtime::EvalEnv* env = nullptr) -> TypedColumn {
    auto value = run(text, pipeline, env);
    INFO(text);
    REQUIRE(value.has_value());
    return *value;
}

auto error_of(const std::string& text, runtime::Pipeline& pipeline) -> ErrorKind {
    auto value = run(text, pipeline);
    INFO(text);
    REQUIRE_FALSE(value.has_value());
    return value.error().kind;
}

auto doubles(std::initializer_list<double> values) -> TypedColumn {
    return Column<double>(values);
}

auto strings(std::initializer_list<std::string> values) -> TypedColumn {
    return Column<std::string>(values);
}

auto ints(std::initializer_list<std::int64_t> values) -> TypedColumn {
    return Column<std::int64_t>(values);
}

class RecordingSink final : public runtime::RenderSink {
   public:
    auto render(const runtime::Figure& figure, const runtime::Layout& layout)
        -> Result<void> override {
        figures.push_back(figure);
        layouts.push_back(layout);
        return {};
    }

    std::vector<runtime::Figure> figures;
    std::vector<runtime::Layout> layouts;
};

class FailingSink final : public runtime::RenderSink {
   public:
    auto render(const runtime::Figure& /*figure*/, const runtime::Layout& layout)
        -> Result<void> override {
        return make_error(ErrorKind::Domain, "cannot write '{}'", layout.file_name);
    }
};

}  // namespace

TEST_CASE("Builtin registry", "[functions][registry]") {
    const auto& registry = runtime::FunctionRegistry::builtin();
    for (const char* name :
         {"abs", "exp", "log", "sqrt", "pow", "if", "lag", "row", "index", "range", "cumeBefore",
          "cumeAfter", "prodBefore", "prodAfter", "countBefore", "countAfter", "toFloat", "toInt",
          "toString", "toDate", "cat", "dateAdd", "dateDiff", "year", "month", "substr",
          "strPos", "strLen", "concat", "exist", "sum", "mean", "min", "max", "std", "count",
          "median", "r2", "sse", "mad", "npv", "irr", "print", "printIf", "setPlotDim",
          "newPlot", "plotXY", "plotLine", "histogram", "render"}) {
        INFO(name);
        REQUIRE(registry.contains(name));
    }
    REQUIRE(registry.find("CUMEBEFORE") == registry.find("cumeBefore"));
    REQUIRE(registry.find("sum")->level == runtime::Level::Reduction);
    REQUIRE(registry.find("abs")->level == runtime::Level::Row);
    REQUIRE(registry.find("cat")->role == Role::Categorical);
    REQUIRE(registry.find("exist")->arg_mode == runtime::ArgMode::Fallback);
    REQUIRE(registry.find("newPlot")->arg_kinds.empty());
    REQUIRE_FALSE(registry.contains("nope"));

    auto names = registry.names();
    REQUIRE(names.size() == registry.size());
    REQUIRE(std::is_sorted(names.begin(), names.end()));
}

TEST_CASE("Math functions", "[functions][math]") {
    runtime::MemoryPipeline pipeline;
    REQUIRE(pipeline.add("c", Column<double>{1.0, 2.0, 3.0}).has_value());

    REQUIRE(value_of("abs(-c)", pipeline) == doubles({1.0, 2.0, 3.0}));
    REQUIRE(value_of("exp(0)", pipeline) == doubles({1.0}));
    REQUIRE(value_of("sqrt(c*c)", pipeline) == doubles({1.0, 2.0, 3.0}));
    REQUIRE(value_of("pow(c,2)", pipeline) == doubles({1.0, 4.0, 9.0}));
    REQUIRE(value_of("log(exp(c))", pipeline).numeric_at(2) == Catch::Approx(3.0));

    REQUIRE(error_of("log(c-1)", pipeline) == ErrorKind::Domain);
    REQUIRE(error_of("sqrt(-c)", pipeline) == ErrorKind::Domain);

    SECTION("pow rejects undefined powers like the ^ operator") {
        REQUIRE(error_of("pow(-8,1/3)", pipeline) == ErrorKind::Domain);
        REQUIRE(error_of("(-8)^(1/3)", pipeline) == ErrorKind::Domain);
    }
}

TEST_CASE("if selects rows", "[functions][math]") {
    runtime::MemoryPipeline pipeline;
    REQUIRE(pipeline.add("c", Column<double>{1.0, 2.0, 3.0}).has_value());

    SECTION("string branches stay strings") {
        REQUIRE(value_of("if(c>1,'big','small')", pipeline) ==
                strings({"small", "big", "big"}));
    }

    SECTION("mixed numeric branches meet at Float64") {
        REQUIRE(value_of("if(c>1, row(c), c)", pipeline) == doubles({1.0, 1.0, 2.0}));
    }

    SECTION("integer branches stay integers") {
        REQUIRE(value_of("if(c>2, row(c), count(c))", pipeline) == ints({3, 3, 2}));
    }

    SECTION("string against number is a type error") {
        REQUIRE(error_of("if(c>1,'a',c)", pipeline) == ErrorKind::Type);
    }

    SECTION("the condition must be numeric") {
        REQUIRE(error_of("if('a',c,c)", pipeline) == ErrorKind::Type);
    }
}

TEST_CASE("Window functions", "[functions][window]") {
    runtime::MemoryPipeline pipeline;
    REQUIRE(pipeline.add("c", Column<double>{1.0, 2.0, 3.0, 4.0}).has_value());
    REQUIRE(pipeline.add("s", Column<std::string>{"a", "b", "c", "d"}).has_value());

    REQUIRE(value_of("cumeBefore(c)", pipeline) == doubles({0.0, 1.0, 3.0, 6.0}));
    REQUIRE(value_of("cumeAfter(c)", pipeline) == doubles({9.0, 7.0, 4.0, 0.0}));
    REQUIRE(value_of("prodBefore(c)", pipeline) == doubles({1.0, 1.0, 2.0, 6.0}));
    REQUIRE(value_of("prodAfter(c)", pipeline) == doubles({24.0, 12.0, 4.0, 1.0}));
    REQUIRE(value_of("countBefore(s)", pipeline) == ints({0, 1, 2, 3}));
    REQUIRE(value_of("countAfter(s)", pipeline) == ints({3, 2, 1, 0}));
    REQUIRE(value_of("row(s)", pipeline) == ints({0, 1, 2, 3}));

    SECTION("index gathers rows") {
        REQUIRE(value_of("index(s,3-row(s))", pipeline) == strings({"d", "c", "b", "a"}));
        REQUIRE(value_of("index(c,0)", pipeline) == doubles({1.0}));
        REQUIRE(error_of("index(c,4)", pipeline) == ErrorKind::Shape);
        REQUIRE(error_of("index(c,-1)", pipeline) == ErrorKind::Shape);
    }

    SECTION("lag converts the fill to the column kind") {
        REQUIRE(value_of("lag(s,3)", pipeline) == strings({"3.00", "a", "b", "c"}));
        REQUIRE(value_of("lag(c,'7')", pipeline) == doubles({7.0, 1.0, 2.0, 3.0}));
        REQUIRE(error_of("lag(c,'x')", pipeline) == ErrorKind::Type);
        REQUIRE(error_of("lag(c,c)", pipeline) == ErrorKind::Shape);
    }

    SECTION("range") {
        REQUIRE(value_of("range(2,5)", pipeline) == ints({2, 3, 4}));
        REQUIRE(value_of("range(0,10)", pipeline).size() == 10);
        REQUIRE(error_of("range(5,5)", pipeline) == ErrorKind::Domain);
        REQUIRE(error_of("range(c,10)", pipeline) == ErrorKind::Shape);
    }

    SECTION("range bounds must be representable and the result bounded") {
        REQUIRE(error_of("range(0,1e300)", pipeline) == ErrorKind::Domain);
        REQUIRE(error_of("range(-1e300,0)", pipeline) == ErrorKind::Domain);
        REQUIRE(error_of("range(0,exp(1000))", pipeline) == ErrorKind::Domain);
        REQUIRE(error_of("range(0,1e12)", pipeline) == ErrorKind::Domain);
        REQUIRE(error_of("range(-9e18,9e18)", pipeline) == ErrorKind::Domain);
    }
}

TEST_CASE("Conversions", "[functions][conversion]") {
    runtime::MemoryPipeline pipeline;
    REQUIRE(pipeline.add("c", Column<double>{1.0, 2.0}).has_value());
    REQUIRE(pipeline.add("n", Column<std::string>{"34", "50"}).has_value());
    REQUIRE(pipeline.add("d", Column<std::string>{"20230228", "20230301"}).has_value());

    REQUIRE(value_of("toFloat(c)", pipeline) == doubles({1.0, 2.0}));
    REQUIRE(value_of("toFloat(n)", pipeline) == doubles({34.0, 50.0}));
    REQUIRE(value_of("toInt(c*1.5)", pipeline) == ints({1, 3}));
    REQUIRE(value_of("toString(cat(c))", pipeline) == strings({"1", "2"}));
    REQUIRE(value_of("toString(c)", pipeline) == strings({"1.00", "2.00"}));
    REQUIRE(value_of("toString(toDate(d))", pipeline) == strings({"2/28/2023", "3/1/2023"}));
    REQUIRE(error_of("toDate(c)", pipeline) == ErrorKind::Type);
    REQUIRE(error_of("toFloat('x')", pipeline) == ErrorKind::Type);

    SECTION("cat yields categorical codes") {
        REQUIRE(value_of("cat(c)", pipeline).kind() == ColumnKind::Int32);
        REQUIRE(value_of("cat(n)", pipeline) == strings({"34", "50"}));
    }

    SECTION("integer conversions reject values out of range") {
        REQUIRE(error_of("toInt(exp(1000))", pipeline) == ErrorKind::Type);
        REQUIRE(error_of("toInt(1e300)", pipeline) == ErrorKind::Type);
        REQUIRE(error_of("toInt('1e300')", pipeline) == ErrorKind::Type);
        REQUIRE(error_of("cat(3e9)", pipeline) == ErrorKind::Type);
        REQUIRE(error_of("cat(-3e9*c)", pipeline) == ErrorKind::Type);
        REQUIRE(value_of("toInt(-9e18)", pipeline) == ints({-9'000'000'000'000'000'000}));
    }
}

TEST_CASE("Integer arithmetic reports overflow", "[functions][conversion]") {
    runtime::MemoryPipeline pipeline;

    REQUIRE(value_of("toInt(2)+toInt(3)", pipeline) == ints({5}));
    REQUIRE(value_of("toInt(-4)*toInt(3)", pipeline) == ints({-12}));
    REQUIRE(value_of("-toInt(7)", pipeline) == ints({-7}));

    REQUIRE(error_of("toInt(9e18)+toInt(9e18)", pipeline) == ErrorKind::Domain);
    REQUIRE(error_of("toInt(-9e18)-toInt(9e18)", pipeline) == ErrorKind::Domain);
    REQUIRE(error_of("toInt(4e9)*toInt(4e9)", pipeline) == ErrorKind::Domain);
    REQUIRE(error_of("-cat(-2147483648)", pipeline) == ErrorKind::Domain);
    REQUIRE(error_of("-toInt(-9223372036854775808)", pipeline) == ErrorKind::Domain);

    SECTION("mixed operands fall back to floating point") {
        REQUIRE(value_of("toInt(9e18)+9e18", pipeline) == doubles({1.8e19}));
    }
}

TEST_CASE("Date functions", "[functions][dates]") {
    runtime::MemoryPipeline pipeline;
    REQUIRE(pipeline
                .add("date", Column<std::string>{"3/1/2023", "4/1/2023", "5/1/2023", "6/1/2023",
                                                 "7/1/2023", "8/1/2020"})
                .has_value());
    REQUIRE(pipeline.add("n", Column<double>{0.0, 2.0, 3.0, 4.0, 1.0, 100.0}).has_value());

    REQUIRE(value_of("toString(dateAdd(date,n))", pipeline) ==
            strings({"3/1/2023", "6/1/2023", "8/1/2023", "10/1/2023", "8/1/2023", "12/1/2028"}));
    REQUIRE(value_of("toString(dateAdd('1/31/2020',1))", pipeline) == strings({"2/29/2020"}));
    REQUIRE(value_of("dateDiff('1/4/2020','12/25/2019')", pipeline) == ints({10}));
    REQUIRE(value_of("year('20230228')", pipeline) == ints({2023}));
    REQUIRE(value_of("month(date)", pipeline) == ints({3, 4, 5, 6, 7, 8}));

    REQUIRE(error_of("dateAdd(n,1)", pipeline) == ErrorKind::Type);
    REQUIRE(error_of("dateAdd('1/1/2020',1e300)", pipeline) == ErrorKind::Domain);
    REQUIRE(error_of("dateAdd('1/1/2020',exp(1000))", pipeline) == ErrorKind::Domain);
    REQUIRE(error_of("dateAdd('1/1/2020',12*300)", pipeline) == ErrorKind::Domain);
    REQUIRE(value_of("toString(dateAdd('1/1/2020',12*200))", pipeline) ==
            strings({"1/1/2220"}));
    REQUIRE(error_of("year('notadate')", pipeline) == ErrorKind::Type);
}

TEST_CASE("String functions", "[functions][strings]") {
    runtime::MemoryPipeline pipeline;
    REQUIRE(pipeline.add("c", Column<double>{1.0, 2.0}).has_value());
    REQUIRE(pipeline.add("s", Column<std::string>{"hello", "hi"}).has_value());

    REQUIRE(value_of("substr(s,1,3)", pipeline) == strings({"ell", "i"}));
    REQUIRE(value_of("substr('hello',3,10)", pipeline) == strings({"lo"}));
    REQUIRE(value_of("substr('hello',-2,2)", pipeline) == strings({"he"}));
    REQUIRE(value_of("substr('hello',9,1)", pipeline) == strings({""}));
    REQUIRE(value_of("substr('hello',exp(1000),2)", pipeline) == strings({""}));
    REQUIRE(value_of("substr('hello',1,exp(1000))", pipeline) == strings({"ello"}));
    REQUIRE(error_of("substr('hello',exp(1000)-exp(1000),2)", pipeline) == ErrorKind::Domain);
    REQUIRE(error_of("substr(s,1,exp(1000)-exp(1000))", pipeline) == ErrorKind::Domain);
    REQUIRE(value_of("strPos(s,'l')", pipeline) == ints({2, -1}));
    REQUIRE(value_of("strLen(s)", pipeline) == ints({5, 2}));
    REQUIRE(value_of("concat('a',c)", pipeline) == strings({"a1.00", "a2.00"}));
    REQUIRE(value_of("concat(cat(c),s)", pipeline) == strings({"1hello", "2hi"}));

    REQUIRE(error_of("strLen(c)", pipeline) == ErrorKind::Type);
    REQUIRE(error_of("strPos(s,1)", pipeline) == ErrorKind::Type);
}

TEST_CASE("Reductions", "[functions][reduction]") {
    runtime::MemoryPipeline pipeline;
    REQUIRE(pipeline.add("c", Column<double>{1.0, 2.0, 3.0, 4.0}).has_value());
    REQUIRE(pipeline.add("f", Column<std::string>{"x", "a", "z", "t"}).has_value());
    REQUIRE(pipeline.add("k", Column<double>{2.0, 2.0, 2.0, 2.0}).has_value());

    REQUIRE(value_of("sum(c)", pipeline) == doubles({10.0}));
    REQUIRE(value_of("mean(c)", pipeline) == doubles({2.5}));
    REQUIRE(value_of("std(c)", pipeline).numeric_at(0) == Catch::Approx(std::sqrt(5.0 / 3.0)));
    REQUIRE(value_of("count(f)", pipeline) == ints({4}));
    REQUIRE(value_of("median(c)", pipeline) == doubles({2.0}));
    REQUIRE(value_of("median(index(c,range(0,3)))", pipeline) == doubles({2.0}));
    REQUIRE(value_of("min(c)", pipeline) == doubles({1.0}));
    REQUIRE(value_of("max(f)", pipeline) == strings({"z"}));
    REQUIRE(value_of("min(f)", pipeline) == strings({"a"}));
    REQUIRE(value_of("c-mean(c)", pipeline) == doubles({-1.5, -0.5, 0.5, 1.5}));

    SECTION("fit statistics") {
        REQUIRE(value_of("sse(c,c+(c==4))", pipeline) == doubles({1.0}));
        REQUIRE(value_of("mad(c,c+(c==4))", pipeline) == doubles({0.25}));
        REQUIRE(value_of("r2(c,c+(c==4))", pipeline).numeric_at(0) == Catch::Approx(0.8));
        REQUIRE(value_of("sse(c,2.5)", pipeline) == doubles({5.0}));
        REQUIRE(error_of("r2(k,c)", pipeline) == ErrorKind::Domain);
        REQUIRE(error_of("sse(c,range(0,3))", pipeline) == ErrorKind::Shape);
    }

    SECTION("too few values") {
        REQUIRE(error_of("std(sum(c))", pipeline) == ErrorKind::Domain);
    }
}

TEST_CASE("print writes to the session stream", "[functions][print]") {
    runtime::MemoryPipeline pipeline;
    REQUIRE(pipeline.add("c", Column<double>{1.0, 2.0, 3.0, 4.0}).has_value());
    REQUIRE(pipeline.add("s", Column<std::string>{"a", "b", "c", "d"}).has_value());

    std::ostringstream out;
    runtime::EvalEnv env{.out = &out};

    SECTION("all rows") {
        REQUIRE(value_of("print(c, 0)", pipeline, &env) == doubles({0.0}));
        REQUIRE(out.str() == "c\n0: 1\n1: 2\n2: 3\n3: 4\n");
    }

    SECTION("first rows of an expression") {
        REQUIRE(value_of("print(c*1.5, 2)", pipeline, &env) == doubles({0.0}));
        REQUIRE(out.str() == "c*1.5\n0: 1.5\n1: 3\n");
    }

    SECTION("a count beyond the row count prints every row") {
        REQUIRE(value_of("print(c, 1e300)", pipeline, &env) == doubles({0.0}));
        REQUIRE(out.str() == "c\n0: 1\n1: 2\n2: 3\n3: 4\n");
    }

    SECTION("rows meeting a condition") {
        REQUIRE(value_of("printIf(s, 0, c>2)", pipeline, &env) == doubles({0.0}));
        REQUIRE(out.str() == "s\n2: c\n3: d\n");
    }

    SECTION("at most n rows meeting a condition") {
        REQUIRE(value_of("printIf(c, 1, c>1)", pipeline, &env) == doubles({0.0}));
        REQUIRE(out.str() == "c\n1: 2\n");
    }
}

TEST_CASE("Plot commands build a figure", "[functions][plot]") {
    runtime::MemoryPipeline pipeline;
    REQUIRE(pipeline.add("c", Column<double>{1.0, 2.0, 3.0, 4.0}).has_value());
    REQUIRE(pipeline.add("D", Column<double>{6.0, 7.0, 8.0, 9.0}).has_value());
    REQUIRE(pipeline.add("e", Column<double>{9.0, 8.0, 7.0, 6.0}).has_value());
    REQUIRE(pipeline.add("f", Column<double>{1.0, 2.0, 1.0, 1.0}).has_value());

    RecordingSink sink;
    runtime::EvalEnv env{.sink = &sink};
    auto command = [&](const char* text) {
        REQUIRE(value_of(text, pipeline, &env) == doubles({0.0}));
    };

    command("setPlotDim(500,300)");
    command("histogram(f,'green','counts')");
    command("render('', 'Histogram', 'Data','Counts')");
    REQUIRE(sink.figures.size() == 1);
    REQUIRE(sink.layouts[0].title == "Histogram");
    REQUIRE(sink.layouts[0].x_title == "Data");
    REQUIRE(sink.layouts[0].y_title == "Counts");
    REQUIRE(sink.layouts[0].width == 500.0);
    REQUIRE(sink.layouts[0].height == 300.0);
    REQUIRE(sink.figures[0].traces.size() == 1);
    REQUIRE(sink.figures[0].traces[0].type == "histogram");
    REQUIRE(sink.figures[0].traces[0].color == "green");
    REQUIRE(sink.figures[0].traces[0].histnorm.empty());
    REQUIRE(sink.figures[0].traces[0].x == std::vector<double>{1.0, 2.0, 1.0, 1.0});

    command("newPlot()");
    command("plotXY(c,D,'line','black')");
    command("render('one.html','One Line','X label','Y label')");
    command("plotXY(c,e,'markers','red')");
    command("render('two.html','Two Lines','X label','Y label')");
    REQUIRE(sink.figures.size() == 3);
    REQUIRE(sink.layouts[1].file_name == "one.html");
    REQUIRE(sink.figures[1].traces.size() == 1);
    REQUIRE(sink.figures[1].traces[0].mode == "lines");
    REQUIRE(sink.figures[1].traces[0].y == std::vector<double>{6.0, 7.0, 8.0, 9.0});
    REQUIRE(sink.figures[2].traces.size() == 2);
    REQUIRE(sink.figures[2].traces[1].mode == "markers");
    REQUIRE(sink.figures[2].traces[1].color == "red");

    command("newPlot()");
    command("setPlotDim(1000,1000)");
    command("plotLine(D,'line','green')");
    command("histogram(f,'blue','percent')");
    command("render('','plotLine Test','Auto-x', 'Y')");
    REQUIRE(sink.figures.size() == 4);
    REQUIRE(sink.layouts[3].width == 1000.0);
    REQUIRE(sink.figures[3].traces[0].x == std::vector<double>{0.0, 1.0, 2.0, 3.0});
    REQUIRE(sink.figures[3].traces[1].histnorm == "percent");

    REQUIRE(run("plotXY(c,D,'dots','red')", pipeline, &env).error().kind == ErrorKind::Domain);
    REQUIRE(run("histogram(f,'red','density')", pipeline, &env).error().kind ==
            ErrorKind::Domain);
    REQUIRE(run("setPlotDim(0,10)", pipeline, &env).error().kind == ErrorKind::Domain);
    REQUIRE(run("plotXY(c,D,1,'red')", pipeline, &env).error().kind == ErrorKind::Type);
}

TEST_CASE("render without a usable sink", "[functions][plot]") {
    runtime::MemoryPipeline pipeline;
    REQUIRE(pipeline.add("c", Column<double>{1.0, 2.0}).has_value());

    SECTION("no sink is not an error") {
        runtime::EvalEnv env;
        REQUIRE(value_of("plotLine(c,'line','black')", pipeline, &env) == doubles({0.0}));
        REQUIRE(value_of("render('','t','x','y')", pipeline, &env) == doubles({0.0}));
        REQUIRE(env.plot.figure.traces.size() == 1);
    }

    SECTION("sink failures propagate") {
        FailingSink sink;
        runtime::EvalEnv env{.sink = &sink};
        auto result = run("render('out.html','t','x','y')", pipeline, &env);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "cannot write 'out.html'");
    }
}
