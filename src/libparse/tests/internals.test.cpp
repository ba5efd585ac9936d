#include <libutl/utilities.hpp>
#include <libparse/internals.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace knit;

#define TEST(name) TEST_CASE("parse-internals " name, "[libparse][internals]") // NOLINT

namespace {
    auto push_unit(par::Context& ctx) -> ast::Expression_id
    {
        return ctx.arena.expressions.push(
            ast::Expression_variant(ast::expr::Unit {}), utl::to_range(ctx.state.position));
    }
} // namespace

TEST("failed attempt restores the context")
{
    auto ctx = par::context("abc\ndef", {});
    auto const result = par::attempt(ctx, [&]() -> std::optional<int> {
        std::ignore = push_unit(ctx);
        lex::advance(ctx.state, 5);
        ctx.indentation.push_back(3);
        par::error_expected(ctx, "something");
    });
    REQUIRE_FALSE(result.has_value());
    REQUIRE(ctx.arena.expressions.size() == 0);
    REQUIRE(ctx.state.position == utl::Position {});
    REQUIRE(ctx.state.newlines == 0);
    REQUIRE(ctx.indentation == std::vector<std::uint32_t> { 0 });
}

TEST("empty attempt restores the context")
{
    auto ctx = par::context("abc", {});
    auto const result = par::attempt(ctx, [&]() -> std::optional<int> {
        std::ignore = push_unit(ctx);
        lex::advance(ctx.state, 2);
        return std::nullopt;
    });
    REQUIRE_FALSE(result.has_value());
    REQUIRE(ctx.arena.expressions.size() == 0);
    REQUIRE(lex::current(ctx.state) == 'a');
}

TEST("successful attempt keeps its effects")
{
    auto ctx = par::context("abc", {});
    auto const result = par::attempt(ctx, [&]() -> std::optional<int> {
        std::ignore = push_unit(ctx);
        lex::advance(ctx.state, 2);
        return 42;
    });
    REQUIRE(result == 42);
    REQUIRE(ctx.arena.expressions.size() == 1);
    REQUIRE(lex::current(ctx.state) == 'c');
}

TEST("followed_by consumes nothing")
{
    auto ctx = par::context("  -> x", {});
    REQUIRE(par::followed_by(ctx, [&] {
        std::ignore = par::extract_trivia(ctx);
        return par::try_symbol(ctx, "->");
    }));
    REQUIRE(ctx.state.position == utl::Position {});
    REQUIRE_FALSE(par::followed_by(ctx, [&] { return par::try_symbol(ctx, "->"); }));
}

TEST("with_position pops the reference column")
{
    auto ctx = par::context("   x", {});
    std::ignore = par::whitespace(ctx);
    par::with_position(ctx, [&] {
        REQUIRE(ctx.indentation == std::vector<std::uint32_t> { 0, 3 });
        REQUIRE(par::check_indent(ctx));
        REQUIRE_FALSE(par::is_indented(ctx));
    });
    REQUIRE(ctx.indentation == std::vector<std::uint32_t> { 0 });
    REQUIRE(par::is_indented(ctx));
    REQUIRE_THROWS_AS(
        par::with_position(ctx, [&] { par::error_expected(ctx, "something"); }), par::Failure);
    REQUIRE(ctx.indentation == std::vector<std::uint32_t> { 0 });
}

TEST("symbols are not prefixes of longer operators")
{
    auto ctx = par::context("->> ->", {});
    REQUIRE_FALSE(par::try_symbol(ctx, "->"));
    REQUIRE(lex::extract_operator(ctx.state) == "->>");
    std::ignore = par::whitespace(ctx);
    REQUIRE(par::try_symbol(ctx, "->"));
    REQUIRE(lex::is_finished(ctx.state));
}

TEST("error messages describe the current character")
{
    auto ctx = par::context("\n", {});
    try {
        par::error_expected(ctx, "an expression");
        FAIL("error_expected returned");
    }
    catch (par::Failure const& failure) {
        REQUIRE(failure.message == "Expected an expression, but found a newline");
        REQUIRE(failure.position == utl::Position {});
    }
}
