#ifndef KNIT_LIBPARSE_FIXITY
#define KNIT_LIBPARSE_FIXITY

#include <libutl/utilities.hpp>
#include <libutl/source.hpp>
#include <libparse/ast.hpp>

namespace knit::par {

    enum struct Associativity : std::uint8_t { Left, Right, None };

    struct Fixity {
        std::uint8_t  precedence {};
        Associativity associativity {};

        auto operator==(Fixity const&) const -> bool = default;
    };

    // Operator fixities keyed by operator symbol, or by "`name`" for backtick functions.
    struct Fixity_table {
        std::unordered_map<std::string, Fixity> fixities;
        Fixity                                  fallback { .precedence = 9, .associativity = Associativity::Left };
    };

    // Binary operator tree over the clauses of an operator chain.
    struct Association {
        struct Operand {
            ast::Expression_id expression;
        };

        struct Operation {
            std::size_t clause {}; // Index of the operator's clause in the chain.
            std::size_t left {};   // Index of the left subtree in `nodes`.
            std::size_t right {};  // Index of the right subtree in `nodes`.
        };

        std::vector<std::variant<Operand, Operation>> nodes;
        std::size_t                                   root {};
    };

    struct Fixity_error {
        std::string left_operator;
        std::string right_operator;
        utl::Range  range;
        std::string message;
    };

    // The standard operator fixities.
    [[nodiscard]] auto default_fixity_table() -> Fixity_table;

    // The key under which `reference` is looked up in a fixity table.
    [[nodiscard]] auto fixity_key(ast::Reference const& reference) -> std::string;

    [[nodiscard]] auto lookup(Fixity_table const& table, ast::Reference const& reference) -> Fixity;

    // Re-associate a flat operator chain into a binary operator tree.
    // `binops` must refer to an operator chain. The arena is not modified.
    [[nodiscard]] auto associate(
        ast::Arena const& arena, ast::Expression_id binops, Fixity_table const& table)
        -> std::expected<Association, Fixity_error>;

    // Render `association` with every operation parenthesized, as in `((a + (b * c)) - d)`.
    [[nodiscard]] auto to_string(
        ast::Arena const&        arena,
        ast::expr::Binops const& binops,
        Association const&       association) -> std::string;

} // namespace knit::par

#endif // KNIT_LIBPARSE_FIXITY
