#include <libutl/utilities.hpp>
#include <libparse/parse.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace knit;

#define TEST(name) TEST_CASE("syntax-tree " name, "[libparse][syntax-tree]") // NOLINT

namespace {
    auto parse(std::string_view const source) -> par::Parsed<ast::Expression_id>
    {
        auto result = par::parse_expression_text(source);
        REQUIRE(result.has_value());
        return std::move(result).value();
    }

    template <typename T>
    auto node(par::Parsed<ast::Expression_id> const& parsed, ast::Expression_id const id) -> T const&
    {
        auto const* const node = std::get_if<T>(&parsed.arena.expressions[id].variant);
        REQUIRE(node != nullptr);
        return *node;
    }

    template <typename T>
    auto root(par::Parsed<ast::Expression_id> const& parsed) -> T const&
    {
        return node<T>(parsed, parsed.root);
    }

    auto texts(ast::Comments const& comments) -> std::vector<std::string>
    {
        return comments | std::views::transform(&lex::Comment::text) | std::ranges::to<std::vector>();
    }

    auto join_first(ast::Application_layout const& layout) -> std::optional<ast::Multiline>
    {
        if (auto const* const join = std::get_if<ast::Join_first>(&layout)) {
            return join->rest;
        }
        return std::nullopt;
    }

    auto is_split_first(ast::Application_layout const& layout) -> bool
    {
        return std::holds_alternative<ast::Split_first>(layout);
    }
} // namespace

TEST("operator chain")
{
    auto const parsed = parse("a + b");
    auto const& binops = root<ast::expr::Binops>(parsed);
    REQUIRE(binops.multiline == ast::Multiline::Join_all);
    REQUIRE(binops.clauses.size() == 1);
    REQUIRE(ast::reference_string(binops.clauses.front().op.value) == "(+)");
    REQUIRE(binops.clauses.front().op.range == utl::Range({ 0, 2 }, { 0, 3 }));
    REQUIRE(par::to_string(parsed.arena, binops.operand) == "a");
    REQUIRE(par::to_string(parsed.arena, binops.clauses.front().operand) == "b");
    REQUIRE(parsed.arena.expressions.size() == 3);
}

TEST("operator chain spanning lines")
{
    REQUIRE(root<ast::expr::Binops>(parse("a +\n  b")).multiline == ast::Multiline::Split_all);
    REQUIRE(root<ast::expr::Binops>(parse("a\n  + b")).multiline == ast::Multiline::Split_all);
    REQUIRE(root<ast::expr::Binops>(parse("a + b + c")).multiline == ast::Multiline::Join_all);
}

TEST("operator comments")
{
    auto const parsed = parse("a {- before -} + {- after -} b");
    auto const& clause = root<ast::expr::Binops>(parsed).clauses.front();
    REQUIRE(texts(clause.before_operator) == std::vector<std::string> { " before " });
    REQUIRE(texts(clause.after_operator) == std::vector<std::string> { " after " });
}

TEST("application layout")
{
    REQUIRE(join_first(root<ast::expr::Application>(parse("f x y")).layout) == ast::Multiline::Join_all);
    REQUIRE(join_first(root<ast::expr::Application>(parse("f x\n  y")).layout) == ast::Multiline::Split_all);
    REQUIRE(join_first(root<ast::expr::Application>(parse("f x y\n  z")).layout) == ast::Multiline::Split_all);
    REQUIRE(is_split_first(root<ast::expr::Application>(parse("f\n  x y")).layout));
    REQUIRE(is_split_first(root<ast::expr::Application>(parse("f (g\n     x) y")).layout));
    REQUIRE(is_split_first(root<ast::expr::Application>(parse("(f\n ) x")).layout));
}

TEST("application argument comments")
{
    auto const parsed      = parse("f {- one -} x y");
    auto const& application = root<ast::expr::Application>(parsed);
    REQUIRE(application.arguments.size() == 2);
    REQUIRE(texts(application.arguments.at(0).before) == std::vector<std::string> { " one " });
    REQUIRE(application.arguments.at(1).before.empty());
}

TEST("if clauses")
{
    auto const parsed = parse("if {- c -} a then b else if c then d else e");
    auto const& if_   = root<ast::expr::If>(parsed);
    REQUIRE(texts(if_.first.condition.before) == std::vector<std::string> { " c " });
    REQUIRE(if_.rest.size() == 1);
    REQUIRE(par::to_string(parsed.arena, if_.rest.front().value.condition.value) == "c");
    REQUIRE(par::to_string(parsed.arena, if_.otherwise.value) == "e");
}

TEST("case branches")
{
    auto const parsed = parse("case x of\n  -- note\n  A -> 1\n  B -> 2");
    auto const& case_ = root<ast::expr::Case>(parsed);
    REQUIRE_FALSE(case_.multiline_subject);
    REQUIRE(case_.branches.size() == 2);
    REQUIRE(texts(case_.branches.at(0).before_pattern) == std::vector<std::string> { " note" });
    REQUIRE(case_.branches.at(1).before_pattern.empty());
    REQUIRE(case_.branches.at(0).range == utl::Range({ 2, 2 }, { 2, 8 }));
    REQUIRE(case_.branches.at(1).range == utl::Range({ 3, 2 }, { 3, 8 }));
}

TEST("case subject spanning lines")
{
    REQUIRE(root<ast::expr::Case>(parse("case\n  x\nof\n  _ -> 1")).multiline_subject);
}

TEST("let declarations in source order")
{
    auto const parsed = parse("let\n  x = 1\n  y = 2\nin x + y");
    auto const& let   = root<ast::expr::Let>(parsed);
    REQUIRE(let.declarations.size() == 2);

    auto const name = [&](ast::expr::Let_declaration const& declaration) {
        auto const* const definition = std::get_if<ast::Definition>(&declaration.variant);
        REQUIRE(definition != nullptr);
        return par::to_string(parsed.arena, definition->pattern);
    };
    REQUIRE(name(let.declarations.at(0)) == "x");
    REQUIRE(name(let.declarations.at(1)) == "y");

    auto const& body = node<ast::expr::Binops>(parsed, let.body);
    REQUIRE(par::to_string(parsed.arena, body.operand) == "x");
    REQUIRE(body.clauses.size() == 1);
    REQUIRE(par::to_string(parsed.arena, body.clauses.front().operand) == "y");
}

TEST("let comments are kept among the declarations")
{
    auto const parsed = parse("let -- first\n  x = 1\n  -- between\n  y = 2\nin x");
    auto const& let   = root<ast::expr::Let>(parsed);
    REQUIRE(let.declarations.size() == 4);
    auto const comment = [](ast::expr::Let_declaration const& declaration) -> std::string {
        auto const* const comment = std::get_if<ast::expr::Let_comment>(&declaration.variant);
        return comment != nullptr ? comment->comment.text : "";
    };
    REQUIRE(comment(let.declarations.at(0)) == " first");
    REQUIRE(std::holds_alternative<ast::Definition>(let.declarations.at(1).variant));
    REQUIRE(comment(let.declarations.at(2)) == " between");
    REQUIRE(std::holds_alternative<ast::Definition>(let.declarations.at(3).variant));
}

TEST("definition comments")
{
    auto const parsed = parse("let x {- e -} = 1 in x");
    auto const& let   = root<ast::expr::Let>(parsed);
    auto const& definition = std::get<ast::Definition>(let.declarations.at(0).variant);
    REQUIRE(texts(definition.equals_comments) == std::vector<std::string> { " e " });
}

TEST("lambda")
{
    auto const parsed  = parse("\\a b -> a");
    auto const& lambda = root<ast::expr::Lambda>(parsed);
    REQUIRE(lambda.parameters.size() == 2);
    REQUIRE(par::to_string(parsed.arena, lambda.parameters.at(0).value) == "a");
    REQUIRE(par::to_string(parsed.arena, lambda.parameters.at(1).value) == "b");
    REQUIRE_FALSE(lambda.multiline);

    REQUIRE(root<ast::expr::Lambda>(parse("\\a ->\n  a")).multiline);
}

TEST("sequence comments and layout")
{
    auto const list = parse("[ {- a -} 1 {- b -}, 2 ]");
    auto const& elements = root<ast::expr::List>(list).elements;
    REQUIRE(texts(elements.elements.at(0).before) == std::vector<std::string> { " a " });
    REQUIRE(texts(elements.elements.at(0).after) == std::vector<std::string> { " b " });
    REQUIRE(elements.multiline == ast::Multiline::Join_all);

    REQUIRE(root<ast::expr::List>(parse("[ 1\n, 2\n]")).elements.multiline == ast::Multiline::Split_all);
    REQUIRE(texts(root<ast::expr::List>(parse("[ {- empty -} ]")).elements.inner)
            == std::vector<std::string> { " empty " });
    REQUIRE(texts(root<ast::expr::Unit>(parse("( {- u -} )")).comments)
            == std::vector<std::string> { " u " });
    REQUIRE(root<ast::expr::Tuple>(parse("(1,\n 2)")).multiline == ast::Multiline::Split_all);
    REQUIRE(root<ast::expr::Tuple>(parse("(1, 2)")).multiline == ast::Multiline::Join_all);
}

TEST("node ranges")
{
    auto const parsed = parse("f x\n  y");
    REQUIRE(parsed.arena.expressions[parsed.root].range == utl::Range({ 0, 0 }, { 1, 3 }));
}

TEST("comments around the root are returned with it")
{
    auto const parsed = parse("-- before\nf x {- after -}\n-- last");
    REQUIRE(texts(parsed.leading) == std::vector<std::string> { " before" });
    REQUIRE(texts(parsed.trailing) == std::vector<std::string> { " after ", " last" });
    REQUIRE(root<ast::expr::Application>(parsed).arguments.size() == 1);

    auto const type = par::parse_type_text("{- t -} Int");
    REQUIRE(type.has_value());
    REQUIRE(texts(type.value().leading) == std::vector<std::string> { " t " });
    REQUIRE(type.value().trailing.empty());
}
