#include <libutl/utilities.hpp>
#include <libparse/parse.hpp>
#include <libparse/fixity.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace knit;

#define TEST(name) TEST_CASE("fixity " name, "[libparse][fixity]") // NOLINT

namespace {
    auto associate(std::string_view const source, par::Fixity_table const& table) -> std::string
    {
        auto const parsed = par::parse_expression_text(source);
        REQUIRE(parsed.has_value());
        auto const& [arena, root] = parsed.value();
        auto const association    = par::associate(arena, root, table);
        if (not association.has_value()) {
            return association.error().message;
        }
        auto const& binops = std::get<ast::expr::Binops>(arena.expressions[root].variant);
        return par::to_string(arena, binops, association.value());
    }

    auto associate(std::string_view const source) -> std::string
    {
        return associate(source, par::default_fixity_table());
    }
} // namespace

TEST("precedence")
{
    REQUIRE(associate("a + b * c - d") == "((a + (b * c)) - d)");
    REQUIRE(associate("a * b + c * d") == "((a * b) + (c * d))");
    REQUIRE(associate("a && b || c") == "((a && b) || c)");
    REQUIRE(associate("a == b + 1") == "(a == (b + 1))");
    REQUIRE(associate("xs ++ ys |> f") == "((xs ++ ys) |> f)");
}

TEST("associativity")
{
    REQUIRE(associate("a - b - c") == "((a - b) - c)");
    REQUIRE(associate("a ^ b ^ c") == "(a ^ (b ^ c))");
    REQUIRE(associate("a |> f |> g") == "((a |> f) |> g)");
    REQUIRE(associate("f <| g <| x") == "(f <| (g <| x))");
    REQUIRE(associate("x :: y :: zs") == "(x :: (y :: zs))");
    REQUIRE(associate("f << g << h") == "((f << g) << h)");
    REQUIRE(associate("f >> g >> h") == "(f >> (g >> h))");
}

TEST("operands keep their structure")
{
    REQUIRE(associate("f x + g y") == "((app f x) + (app g y))");
    REQUIRE(associate("a + (b + c)") == "(a + (paren (binops b + c)))");
}

TEST("unknown operators and functions")
{
    REQUIRE(associate("a `max` b + c") == "((a `max` b) + c)");
    REQUIRE(associate("a <?> b + c") == "((a <?> b) + c)");
}

TEST("non-associative operators can not be chained")
{
    REQUIRE(
        associate("a == b == c")
        == "The non-associative operators == and == have the same precedence 4, "
           "so they can not be chained without parentheses");
    REQUIRE(associate("a < b == c").starts_with("The non-associative operators < and =="));
}

TEST("mixed associativity is an error")
{
    REQUIRE(
        associate("a |> f <| b")
        == "Can not mix |> (left associative) and <| (right associative) "
           "of the same precedence 0 without parentheses");
}

TEST("error location")
{
    auto const parsed = par::parse_expression_text("a == b == c");
    REQUIRE(parsed.has_value());
    auto const association
        = par::associate(parsed.value().arena, parsed.value().root, par::default_fixity_table());
    REQUIRE_FALSE(association.has_value());
    REQUIRE(association.error().left_operator == "==");
    REQUIRE(association.error().right_operator == "==");
    REQUIRE(association.error().range == utl::Range({ 0, 2 }, { 0, 9 }));
}

TEST("custom table")
{
    par::Fixity_table table;
    table.fixities.insert({ "+", { .precedence = 6, .associativity = par::Associativity::Right } });
    REQUIRE(associate("a + b + c", table) == "(a + (b + c))");
    REQUIRE(associate("a * b + c", table) == "((a * b) + c)");
}

TEST("lookup")
{
    auto const table = par::default_fixity_table();
    REQUIRE(par::fixity_key(ast::Op_ref { "++" }) == "++");
    REQUIRE(par::fixity_key(ast::Var_ref { .qualifier = { "Basics" }, .name = "max" }) == "`Basics.max`");
    REQUIRE(par::lookup(table, ast::Op_ref { "^" }) == par::Fixity { 8, par::Associativity::Right });
    REQUIRE(par::lookup(table, ast::Op_ref { "<?>" }) == par::Fixity { 9, par::Associativity::Left });
}
