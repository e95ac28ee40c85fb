#include <colex/ir/node.hpp>
#include <colex/parser/parser.hpp>
#include <colex/runtime/function_registry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace colex;

namespace {

auto shape_of(const char* text) -> std::string {
    auto tree = parser::build_tree(text);
    REQUIRE(tree.has_value());
    return ir::describe(**tree);
}

auto parse_error(const char* text) -> Error {
    auto tree = parser::build_tree(text);
    REQUIRE_FALSE(tree.has_value());
    return tree.error();
}

}  // namespace

TEST_CASE("Binary operators follow precedence", "[parser]") {
    REQUIRE(shape_of("a+b") == "(+ a b)");
    REQUIRE(shape_of("c+3*D") == "(+ c (* 3 D))");
    REQUIRE(shape_of("(c-D)*(c+D)") == "(* (+ c -D) (+ c D))");
    REQUIRE(shape_of("c>=3||D==10") == "(|| (>= c 3) (== D 10))");
    REQUIRE(shape_of("c>1 && D>2") == "(&& (> c 1) (> D 2))");
    REQUIRE(shape_of("2^-1") == "(^ 2 -1)");
    REQUIRE(shape_of("c*-2") == "(* c -2)");
}

TEST_CASE("Whitespace and wrapping parentheses are ignored", "[parser]") {
    REQUIRE(shape_of(" ( ( a + b ) ) ") == "(+ a b)");
    REQUIRE(shape_of("(((-(c))))") == "-c");
}

TEST_CASE("Subtraction is addition of a negated operand", "[parser]") {
    REQUIRE(shape_of("a-b") == "(+ a -b)");
    REQUIRE(shape_of("c-D-D") == "(+ c (+ -D -D))");
    REQUIRE(shape_of("1-r+x") == "(+ 1 (+ -r x))");
}

TEST_CASE("Products and quotients associate to the left", "[parser]") {
    REQUIRE(shape_of("a/b/c") == "(/ (/ a b) c)");
    REQUIRE(shape_of("a/b*c") == "(* (/ a b) c)");
}

TEST_CASE("Leading minus placement", "[parser]") {
    SECTION("before an additive expression it negates the first operand") {
        REQUIRE(shape_of("-D*3 + D") == "(+ -(* D 3) D)");
        REQUIRE(shape_of("-D + 4*c") == "(+ -D (* 4 c))");
    }

    SECTION("before a product or power it negates the whole node") {
        REQUIRE(shape_of("-(c+3)*(D-3)") == "-(* (+ c 3) (+ D -3))");
        REQUIRE(shape_of("-2^2") == "-(^ 2 2)");
    }

    SECTION("before a parenthesized group it negates the group") {
        REQUIRE(shape_of("-(D ^ (c-1))") == "-(^ D (+ c -1))");
    }

    SECTION("before a comparison it binds to the left operand") {
        REQUIRE(shape_of("-a>b") == "(> -a b)");
        REQUIRE(shape_of("-c>2") == "(> -c 2)");
        REQUIRE(shape_of("-c<0&&c>0") == "(&& -(< c 0) (> c 0))");
    }

    SECTION("double negation cancels") {
        REQUIRE(shape_of("-(-c)") == "c");
    }
}

TEST_CASE("Function calls", "[parser][functions]") {
    REQUIRE(shape_of("if(c>D,c,D)") == "(if (> c D) c D)");
    REQUIRE(shape_of("log(e+c+1)*2+5") == "(+ (* (log (+ e (+ c 1))) 2) 5)");
    REQUIRE(shape_of("sum(c) - npv(.1,D)") == "(+ (sum c) -(npv .1 D))");
    REQUIRE(shape_of("newPlot()") == "(newPlot)");

    SECTION("names are matched case-insensitively") {
        REQUIRE(shape_of("SUM(c)") == "(sum c)");
        REQUIRE(shape_of("cumebefore(c)") == "(cumeBefore c)");
    }

    SECTION("quoted arguments keep their commas and spaces") {
        REQUIRE(shape_of("concat(a, 'x, y')") == "(concat a 'x, y')");
    }

    SECTION("the node records its descriptor") {
        auto tree = parser::build_tree("abs(c)");
        REQUIRE(tree.has_value());
        REQUIRE((*tree)->function() == runtime::FunctionRegistry::builtin().find("abs"));
        REQUIRE((*tree)->children().size() == 1);
    }
}

TEST_CASE("Parse errors", "[parser][errors]") {
    REQUIRE(parse_error("(1+2").kind == ErrorKind::Parse);
    REQUIRE(parse_error("1+2)").kind == ErrorKind::Parse);
    REQUIRE(parse_error("'abc").kind == ErrorKind::Parse);
    REQUIRE(parse_error("").kind == ErrorKind::Parse);
    REQUIRE(parse_error("   ").kind == ErrorKind::Parse);
    REQUIRE(parse_error("a+").kind == ErrorKind::Parse);
    REQUIRE(parse_error("2(3)").kind == ErrorKind::Parse);
    REQUIRE(parse_error("pow(a,)").kind == ErrorKind::Parse);

    SECTION("unknown functions are reported by name") {
        auto error = parse_error("foo(c)");
        REQUIRE(error.kind == ErrorKind::Parse);
        REQUIRE(error.message == "unknown function: foo");
    }

    SECTION("argument counts are checked") {
        REQUIRE(parse_error("log(a,b)").kind == ErrorKind::Parse);
        REQUIRE(parse_error("sum()").kind == ErrorKind::Parse);
        REQUIRE(parse_error("if(a,b)").kind == ErrorKind::Parse);
    }

    SECTION("errors inside arguments abort the whole parse") {
        REQUIRE(parse_error("sum(foo(c))").message == "unknown function: foo");
    }
}

TEST_CASE("An injected registry replaces the built-in table", "[parser][functions]") {
    runtime::FunctionRegistry registry;
    registry.add(runtime::FunctionDescriptor{
        .name = "twice",
        .arg_kinds = {runtime::ArgKind::Numeric},
        .impl = [](const runtime::CallArgs& args) -> Result<TypedColumn> {
            return args.floats(0).transform([](double x) { return 2.0 * x; });
        },
    });

    auto tree = parser::build_tree("twice(c)+1", registry);
    REQUIRE(tree.has_value());
    REQUIRE(ir::describe(**tree) == "(+ (twice c) 1)");

    auto missing = parser::build_tree("sum(c)", registry);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == ErrorKind::Parse);
}

TEST_CASE("clone_tree copies structure", "[parser][ir]") {
    auto tree = parser::build_tree("-(c+3)*(D-3)");
    REQUIRE(tree.has_value());
    auto copy = ir::clone_tree(**tree);
    REQUIRE(ir::describe(*copy) == ir::describe(**tree));
    REQUIRE(copy.get() != tree->get());
    REQUIRE(&copy->child(0) != &(*tree)->child(0));
}
