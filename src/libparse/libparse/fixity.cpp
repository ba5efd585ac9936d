#include <libutl/utilities.hpp>
#include <libparse/fixity.hpp>
#include <libparse/parse.hpp>

using namespace knit;
using namespace knit::par;

namespace {
    auto associativity_string(Associativity const associativity) -> std::string_view
    {
        switch (associativity) {
        case Associativity::Left:  return "left associative";
        case Associativity::Right: return "right associative";
        case Associativity::None:  return "non-associative";
        default:                   cpputil::unreachable();
        }
    }

    struct Resolver {
        ast::expr::Binops const& binops;
        Fixity_table const&      table;
        Association              association;
        std::size_t              next {};

        struct Parent {
            std::size_t clause {};
            Fixity      fixity;
        };

        auto push(std::variant<Association::Operand, Association::Operation> node) -> std::size_t
        {
            association.nodes.push_back(std::move(node));
            return association.nodes.size() - 1;
        }

        auto fixity(std::size_t const clause) const -> Fixity
        {
            return lookup(table, binops.clauses.at(clause).op.value);
        }

        auto conflict(Parent const& parent, std::size_t const clause) const -> Fixity_error
        {
            auto const& left  = binops.clauses.at(parent.clause).op;
            auto const& right = binops.clauses.at(clause).op;
            auto const  right_fixity = fixity(clause);

            Fixity_error error {
                .left_operator  = fixity_key(left.value),
                .right_operator = fixity_key(right.value),
                .range          = utl::Range(left.range.start, right.range.stop),
                .message        = {},
            };
            if (parent.fixity.associativity == Associativity::None
                and right_fixity.associativity == Associativity::None)
            {
                error.message = std::format(
                    "The non-associative operators {} and {} have the same precedence {}, "
                    "so they can not be chained without parentheses",
                    error.left_operator,
                    error.right_operator,
                    right_fixity.precedence);
            }
            else {
                error.message = std::format(
                    "Can not mix {} ({}) and {} ({}) of the same precedence {} without parentheses",
                    error.left_operator,
                    associativity_string(parent.fixity.associativity),
                    error.right_operator,
                    associativity_string(right_fixity.associativity),
                    right_fixity.precedence);
            }
            return error;
        }

        // Consume every clause that binds tighter than `parent` to its right operand `left`.
        auto climb(std::optional<Parent> const parent, std::size_t left)
            -> std::expected<std::size_t, Fixity_error>
        {
            while (next != binops.clauses.size()) {
                auto const current = fixity(next);
                if (parent.has_value()) {
                    auto const previous = parent.value().fixity;
                    if (previous.precedence == current.precedence
                        and (previous.associativity != current.associativity
                             or current.associativity == Associativity::None))
                    {
                        return std::unexpected(conflict(parent.value(), next));
                    }
                    if (previous.precedence > current.precedence
                        or (previous.precedence == current.precedence
                            and current.associativity == Associativity::Left))
                    {
                        return left;
                    }
                }
                auto const clause = next++;
                auto const operand
                    = push(Association::Operand { binops.clauses.at(clause).operand });
                auto const right = climb(Parent { .clause = clause, .fixity = current }, operand);
                if (not right.has_value()) {
                    return right;
                }
                left = push(Association::Operation {
                    .clause = clause,
                    .left   = left,
                    .right  = right.value(),
                });
            }
            return left;
        }
    };

    void render(
        std::string&             output,
        ast::Arena const&        arena,
        ast::expr::Binops const& binops,
        Association const&       association,
        std::size_t const        node)
    {
        auto const visitor = utl::Overload {
            [&](Association::Operand const& operand) {
                output.append(to_string(arena, operand.expression));
            },
            [&](Association::Operation const& operation) {
                output.push_back('(');
                render(output, arena, binops, association, operation.left);
                auto const& op = binops.clauses.at(operation.clause).op.value;
                std::format_to(std::back_inserter(output), " {} ", fixity_key(op));
                render(output, arena, binops, association, operation.right);
                output.push_back(')');
            },
        };
        std::visit(visitor, association.nodes.at(node));
    }
} // namespace

auto knit::par::default_fixity_table() -> Fixity_table
{
    auto const fixity = [](std::uint8_t const precedence, Associativity const associativity) {
        return Fixity { .precedence = precedence, .associativity = associativity };
    };
    return Fixity_table {
        .fixities = {
            { "|>", fixity(0, Associativity::Left) },
            { "<|", fixity(0, Associativity::Right) },
            { "||", fixity(2, Associativity::Right) },
            { "&&", fixity(3, Associativity::Right) },
            { "==", fixity(4, Associativity::None) },
            { "/=", fixity(4, Associativity::None) },
            { "<", fixity(4, Associativity::None) },
            { ">", fixity(4, Associativity::None) },
            { "<=", fixity(4, Associativity::None) },
            { ">=", fixity(4, Associativity::None) },
            { "::", fixity(5, Associativity::Right) },
            { "++", fixity(5, Associativity::Right) },
            { "+", fixity(6, Associativity::Left) },
            { "-", fixity(6, Associativity::Left) },
            { "*", fixity(7, Associativity::Left) },
            { "/", fixity(7, Associativity::Left) },
            { "//", fixity(7, Associativity::Left) },
            { "^", fixity(8, Associativity::Right) },
            { "<<", fixity(9, Associativity::Left) },
            { ">>", fixity(9, Associativity::Right) },
        },
    };
}

auto knit::par::fixity_key(ast::Reference const& reference) -> std::string
{
    if (auto const* const op = std::get_if<ast::Op_ref>(&reference)) {
        return op->symbol;
    }
    return std::format("`{}`", ast::reference_string(reference));
}

auto knit::par::lookup(Fixity_table const& table, ast::Reference const& reference) -> Fixity
{
    auto const it = table.fixities.find(fixity_key(reference));
    return it != table.fixities.end() ? it->second : table.fallback;
}

auto knit::par::associate(
    ast::Arena const& arena, ast::Expression_id const binops, Fixity_table const& table)
    -> std::expected<Association, Fixity_error>
{
    auto const* const chain = std::get_if<ast::expr::Binops>(&arena.expressions[binops].variant);
    cpputil::always_assert(chain != nullptr);

    Resolver resolver { .binops = *chain, .table = table, .association = {}, .next = 0 };
    auto const first = resolver.push(Association::Operand { chain->operand });
    return resolver.climb(std::nullopt, first).transform([&](std::size_t const root) {
        cpputil::always_assert(resolver.next == chain->clauses.size());
        resolver.association.root = root;
        return std::move(resolver.association);
    });
}

auto knit::par::to_string(
    ast::Arena const& arena, ast::expr::Binops const& binops, Association const& association)
    -> std::string
{
    std::string output;
    render(output, arena, binops, association, association.root);
    return output;
}
