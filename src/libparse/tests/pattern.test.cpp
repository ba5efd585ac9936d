#include <libutl/utilities.hpp>
#include <libparse/parse.hpp>
#include <libparse/test_interface.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using namespace knit;
using Catch::Matchers::ContainsSubstring;

namespace {
    constexpr auto parse = par::test_parse_pattern;
}

#define TEST(name) TEST_CASE("parse-pattern " name, "[libparse][pattern]") // NOLINT

#define REQUIRE_SIMPLE_PARSE(string) REQUIRE(parse(string) == (string))

TEST("wildcard and variable")
{
    REQUIRE_SIMPLE_PARSE("_");
    REQUIRE_SIMPLE_PARSE("x");
    REQUIRE_SIMPLE_PARSE("camelCase2");
}

TEST("literals")
{
    REQUIRE_SIMPLE_PARSE("5");
    REQUIRE_SIMPLE_PARSE("-1");
    REQUIRE_SIMPLE_PARSE("'c'");
    REQUIRE_SIMPLE_PARSE("\"s\"");
}

TEST("constructors")
{
    REQUIRE_SIMPLE_PARSE("Nothing");
    REQUIRE_SIMPLE_PARSE("True");
    REQUIRE(parse("Just x") == "(Just x)");
    REQUIRE(parse("Maybe.Just x") == "(Maybe.Just x)");
    REQUIRE(parse("Pair a _") == "(Pair a _)");
    REQUIRE(parse("Just Nothing") == "(Just Nothing)");
    REQUIRE(parse("Just (Ok y)") == "(Just (paren (Ok y)))");
    REQUIRE(parse("Just\n x") == "(Just x)");
}

TEST("parenthesized and tuples")
{
    REQUIRE(parse("()") == "()");
    REQUIRE(parse("(x)") == "(paren x)");
    REQUIRE(parse("(a, b)") == "(tuple a b)");
    REQUIRE(parse("( a , _ , 3 )") == "(tuple a _ 3)");
}

TEST("lists and records")
{
    REQUIRE(parse("[]") == "(list)");
    REQUIRE(parse("[a, b]") == "(list a b)");
    REQUIRE(parse("{ a, b }") == "(record a b)");
    REQUIRE(parse("{}") == "(record)");
}

TEST("cons")
{
    REQUIRE(parse("x :: xs") == "(:: x xs)");
    REQUIRE(parse("x :: y :: rest") == "(:: x y rest)");
    REQUIRE(parse("Just x :: rest") == "(:: (Just x) rest)");
}

TEST("alias")
{
    REQUIRE(parse("Just x as m") == "(as (Just x) m)");
    REQUIRE(parse("(x :: xs) as list") == "(as (paren (:: x xs)) list)");
    REQUIRE(parse("a as b as c") == "(as (as a b) c)");
}

TEST("errors")
{
    REQUIRE(parse("x as") == "1:5: Expected an alias name, but found the end of input");
    REQUIRE(parse("x ::") == "1:5: Expected a pattern, but found the end of input");
    REQUIRE(parse("(a, )") == "1:5: Expected a pattern, but found ')'");
    REQUIRE(parse("[a b]") == "1:4: Expected a ',' or a ']', but found 'b'");
}

TEST("nesting depth is limited")
{
    auto const nested = [](std::size_t const depth) {
        return std::string(depth, '(') + "x" + std::string(depth, ')');
    };
    REQUIRE(parse(nested(100)).ends_with("x" + std::string(100, ')')));
    REQUIRE_THAT(parse(nested(100000)), ContainsSubstring("Expected a shallower pattern"));

    par::Configuration const config { .max_depth = 10 };
    REQUIRE(par::parse_pattern_text(nested(5), config).has_value());
    REQUIRE_FALSE(par::parse_pattern_text(nested(12), config).has_value());
}
