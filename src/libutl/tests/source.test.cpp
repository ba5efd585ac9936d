#include <libutl/utilities.hpp>
#include <libutl/source.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace knit;

#define TEST(name) TEST_CASE("libutl " name, "[libutl][source]") // NOLINT

TEST("advance")
{
    utl::Position position { .line = 5, .column = 7 };
    position = utl::advance(position, 'a');
    REQUIRE(position == utl::Position { .line = 5, .column = 8 });
    position = utl::advance(position, '\t');
    REQUIRE(position == utl::Position { .line = 5, .column = 9 });
    position = utl::advance(position, '\n');
    REQUIRE(position == utl::Position { .line = 6, .column = 0 });
    position = utl::advance(position, 'b');
    REQUIRE(position == utl::Position { .line = 6, .column = 1 });
}

TEST("position formatting is one-based")
{
    REQUIRE(std::format("{}", utl::Position { .line = 0, .column = 0 }) == "1:1");
    REQUIRE(std::format("{}", utl::Range({ 1, 2 }, { 1, 5 })) == "(2:3-2:6)");
}

TEST("format_diagnostic")
{
    auto const diagnostic = utl::Diagnostic {
        .message = "Expected an expression, but found ')'",
        .range   = utl::Range({ 1, 4 }, { 1, 5 }),
    };
    REQUIRE(
        utl::format_diagnostic("x =\n  f ) y\n", diagnostic)
        == "2:5: Error: Expected an expression, but found ')'\n"
           "    2 |   f ) y\n"
           "      |     ^");
}

TEST("format_diagnostic past the end of input")
{
    auto const diagnostic = utl::Diagnostic {
        .message  = "Unexpected end of input",
        .range    = utl::Range({ 4, 0 }, { 4, 0 }),
        .severity = utl::Severity::Warning,
    };
    REQUIRE(utl::format_diagnostic("a\n", diagnostic) == "5:1: Warning: Unexpected end of input");
}

static_assert(not std::is_default_constructible_v<utl::Range>);
static_assert(std::is_trivially_copyable_v<utl::Range>);
static_assert(utl::Position { 4, 5 } < utl::Position { 9, 2 });
static_assert(utl::Position { 5, 2 } < utl::Position { 5, 3 });
