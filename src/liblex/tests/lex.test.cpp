#include <libutl/utilities.hpp>
#include <liblex/lex.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace knit;

#define TEST(name) TEST_CASE("liblex " name, "[liblex]") // NOLINT

namespace {
    auto trivia_of(std::string_view const text) -> lex::Trivia
    {
        auto state  = lex::state(text);
        auto trivia = lex::skip_trivia(state);
        REQUIRE(trivia.has_value());
        return std::move(trivia).value();
    }

    auto comment_texts(lex::Trivia const& trivia) -> std::vector<std::string>
    {
        return trivia.comments | std::views::transform(&lex::Comment::text)
             | std::ranges::to<std::vector>();
    }
} // namespace

TEST("cursor")
{
    auto state = lex::state("ab\nc");
    REQUIRE(lex::current(state) == 'a');
    REQUIRE(lex::lookahead(state, 1) == 'b');
    REQUIRE(lex::lookahead(state, 10) == '\0');
    lex::advance(state, 3);
    REQUIRE(lex::current(state) == 'c');
    REQUIRE(state.position == utl::Position { .line = 1, .column = 0 });
    lex::advance(state);
    REQUIRE(lex::is_finished(state));
    REQUIRE(lex::current(state) == '\0');
}

TEST("whitespace trivia")
{
    auto state = lex::state(" \t\n  \n x");
    auto const trivia = lex::skip_trivia(state);
    REQUIRE(trivia.has_value());
    REQUIRE(trivia->consumed);
    REQUIRE(trivia->comments.empty());
    REQUIRE(state.newlines == 2);
    REQUIRE(lex::current(state) == 'x');

    REQUIRE_FALSE(trivia_of("x").consumed);
}

TEST("line comment trivia")
{
    auto const trivia = trivia_of("-- a\n  -- b\nx");
    REQUIRE(comment_texts(trivia) == std::vector<std::string> { " a", " b" });
    REQUIRE(trivia.comments.front().kind == lex::Comment_kind::Line);
    REQUIRE(trivia.comments.front().range == utl::Range({ 0, 0 }, { 0, 4 }));
}

TEST("block comment trivia")
{
    auto const trivia = trivia_of("{- a {- nested -} b -} {-| doc -}");
    REQUIRE(comment_texts(trivia) == std::vector<std::string> { " a {- nested -} b ", " doc " });
    REQUIRE(trivia.comments.at(0).kind == lex::Comment_kind::Block);
    REQUIRE(trivia.comments.at(1).kind == lex::Comment_kind::Documentation);
}

TEST("unterminated block comment")
{
    auto state  = lex::state("  {- a {- b -}");
    auto result = lex::skip_trivia(state);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().message == "Unterminated block comment");
    REQUIRE(result.error().position == utl::Position { .line = 0, .column = 2 });
}

TEST("lower names")
{
    auto state = lex::state("map2 x");
    REQUIRE(lex::extract_lower_name(state) == "map2");
    REQUIRE(lex::current(state) == ' ');

    auto keyword = lex::state("then x");
    REQUIRE(lex::extract_lower_name(keyword) == std::nullopt);
    REQUIRE(keyword.offset == 0);

    auto prefixed = lex::state("thenx");
    REQUIRE(lex::extract_lower_name(prefixed) == "thenx");
}

TEST("keywords")
{
    auto state = lex::state("iffy");
    REQUIRE_FALSE(lex::try_consume_keyword(state, "if"));
    auto keyword = lex::state("if(");
    REQUIRE(lex::try_consume_keyword(keyword, "if"));
    REQUIRE(lex::current(keyword) == '(');
}

TEST("qualified names")
{
    auto state = lex::state("List.map f");
    auto name  = lex::extract_qualified_name(state);
    REQUIRE(name.has_value());
    REQUIRE(name->qualifier == std::vector<std::string> { "List" });
    REQUIRE(name->name == "map");
    REQUIRE_FALSE(name->is_upper);

    auto tag = lex::state("Maybe.Just.x");
    name     = lex::extract_qualified_name(tag);
    REQUIRE(name.has_value());
    REQUIRE(name->qualifier == std::vector<std::string> { "Maybe", "Just" });
    REQUIRE(name->name == "x");

    auto trailing = lex::state("Model. x");
    name          = lex::extract_qualified_name(trailing);
    REQUIRE(name.has_value());
    REQUIRE(name->qualifier.empty());
    REQUIRE(name->name == "Model");
    REQUIRE(name->is_upper);
    REQUIRE(lex::current(trailing) == '.');
}

TEST("operators")
{
    auto state = lex::state("|> x");
    REQUIRE(lex::extract_operator(state) == "|>");

    for (std::string_view const reserved : { "=", "->", "|", ":", "..", "--" }) {
        auto reserved_state = lex::state(reserved);
        REQUIRE(lex::extract_operator(reserved_state) == std::nullopt);
        REQUIRE(reserved_state.offset == 0);
    }

    auto access = lex::state(".field");
    REQUIRE(lex::extract_operator(access) == std::nullopt);

    auto compose = lex::state(".>");
    REQUIRE(lex::extract_operator(compose) == ".>");
}

TEST("describe current")
{
    REQUIRE(lex::describe_current(lex::state("")) == "the end of input");
    REQUIRE(lex::describe_current(lex::state("then x")) == "'then'");
    REQUIRE(lex::describe_current(lex::state(")")) == "')'");
    REQUIRE(lex::describe_current(lex::state("\n")) == "a newline");
}
