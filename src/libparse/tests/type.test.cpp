#include <libutl/utilities.hpp>
#include <libparse/parse.hpp>
#include <libparse/test_interface.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using namespace knit;
using Catch::Matchers::ContainsSubstring;

namespace {
    constexpr auto parse = par::test_parse_type;
}

#define TEST(name) TEST_CASE("parse-type " name, "[libparse][type]") // NOLINT

#define REQUIRE_SIMPLE_PARSE(string) REQUIRE(parse(string) == (string))

TEST("variables and constructors")
{
    REQUIRE_SIMPLE_PARSE("a");
    REQUIRE_SIMPLE_PARSE("Int");
    REQUIRE_SIMPLE_PARSE("Html.Html");
    REQUIRE(parse("List a") == "(List a)");
    REQUIRE(parse("Maybe.Maybe a") == "(Maybe.Maybe a)");
    REQUIRE(parse("Dict String (List a)") == "(Dict String (paren (List a)))");
    REQUIRE(parse("Result Error (Maybe a)") == "(Result Error (paren (Maybe a)))");
}

TEST("unit, parentheses, and tuples")
{
    REQUIRE(parse("()") == "()");
    REQUIRE(parse("(a)") == "(paren a)");
    REQUIRE(parse("(a, b)") == "(tuple a b)");
    REQUIRE(parse("(Int, List a, ())") == "(tuple Int (List a) ())");
}

TEST("records")
{
    REQUIRE(parse("{}") == "(record)");
    REQUIRE(parse("{ a : Int, b : String }") == "(record (a Int) (b String))");
    REQUIRE(parse("{ r | a : Int }") == "(record-extension r (a Int))");
    REQUIRE(parse("{ f : a -> b }") == "(record (f (-> a b)))");
}

TEST("functions")
{
    REQUIRE(parse("a -> b") == "(-> a b)");
    REQUIRE(parse("a -> b -> c") == "(-> a b c)");
    REQUIRE(parse("(a -> b) -> List a -> List b") == "(-> (paren (-> a b)) (List a) (List b))");
    REQUIRE(parse("Int\n -> Int") == "(-> Int Int)");
}

TEST("errors")
{
    REQUIRE(parse("a ->") == "1:5: Expected a type, but found the end of input");
    REQUIRE(parse("{ a Int }") == "1:5: Expected a ':', but found 'Int'");
    REQUIRE(parse("{ r | }") == "1:8: Expected a record field, but found the end of input");
}

TEST("nesting depth is limited")
{
    auto const nested = [](std::size_t const depth) {
        return std::string(depth, '(') + "a" + std::string(depth, ')');
    };
    REQUIRE(parse(nested(100)).ends_with("a" + std::string(100, ')')));
    REQUIRE_THAT(parse(nested(100000)), ContainsSubstring("Expected a shallower type"));

    par::Configuration const config { .max_depth = 10 };
    REQUIRE(par::parse_type_text(nested(5), config).has_value());
    REQUIRE_FALSE(par::parse_type_text(nested(12), config).has_value());
}
