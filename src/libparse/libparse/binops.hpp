#ifndef KNIT_LIBPARSE_BINOPS
#define KNIT_LIBPARSE_BINOPS

#include <libutl/utilities.hpp>
#include <libparse/internals.hpp>

namespace knit::par {

    template <
        std::invocable<Context&> auto parse_operand,
        std::invocable<Context&> auto parse_last_operand,
        std::invocable<Context&> auto parse_operator>
    auto extract_binops_clauses(Context& ctx) -> std::vector<ast::expr::Binops_clause>
    {
        std::vector<ast::expr::Binops_clause> clauses;
        for (;;) {
            // Once whitespace and an operator are ahead, an operand is required.
            bool const committed = followed_by(ctx, [&] {
                std::ignore = extract_trivia(ctx);
                return parse_operator(ctx).has_value();
            });
            if (not committed) {
                return clauses;
            }

            auto before_operator = whitespace(ctx);
            auto op              = require<parse_operator>(ctx, "an operator");
            auto after_operator  = whitespace(ctx);

            if (auto operand = parse_operand(ctx)) {
                clauses.push_back(ast::expr::Binops_clause {
                    .before_operator = std::move(before_operator),
                    .op              = std::move(op),
                    .after_operator  = std::move(after_operator),
                    .operand         = operand.value(),
                });
                continue;
            }

            // A let, case, if, or lambda ends the chain.
            clauses.push_back(ast::expr::Binops_clause {
                .before_operator = std::move(before_operator),
                .op              = std::move(op),
                .after_operator  = std::move(after_operator),
                .operand         = require<parse_last_operand>(ctx, "an expression"),
            });
            return clauses;
        }
    }

    // Parse an operand followed by any number of operator clauses. The chain is kept flat,
    // in source order, and its precedence is resolved by a separate pass.
    template <
        std::invocable<Context&> auto parse_operand,
        std::invocable<Context&> auto parse_last_operand,
        std::invocable<Context&> auto parse_operator>
    auto parse_binops(Context& ctx) -> std::optional<ast::Expression_id>
    {
        auto const start    = ctx.state.position;
        auto const newlines = ctx.state.newlines;

        auto const operand = parse_operand(ctx);
        if (not operand.has_value()) {
            return std::nullopt;
        }

        auto clauses
            = extract_binops_clauses<parse_operand, parse_last_operand, parse_operator>(ctx);
        if (clauses.empty()) {
            return operand;
        }

        return ctx.arena.expressions.push(
            ast::expr::Binops {
                .operand   = operand.value(),
                .clauses   = std::move(clauses),
                .multiline = multiline_since(ctx, newlines),
            },
            up_to_current(ctx, start));
    }

} // namespace knit::par

#endif // KNIT_LIBPARSE_BINOPS
