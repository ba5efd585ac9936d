#include <libutl/utilities.hpp>
#include <libparse/internals.hpp>

using namespace knit;
using namespace knit::par;

namespace {
    auto push(Context& ctx, ast::Pattern_variant variant, utl::Position const start)
        -> ast::Pattern_id
    {
        return ctx.arena.patterns.push(std::move(variant), up_to_current(ctx, start));
    }

    auto parse_wildcard(Context& ctx) -> std::optional<ast::Pattern_variant>
    {
        if (lex::current(ctx.state) == '_' and not lex::is_name_character(lex::lookahead(ctx.state, 1))) {
            lex::advance(ctx.state);
            return ast::patt::Wildcard {};
        }
        return std::nullopt;
    }

    auto parse_tag(Context& ctx) -> std::optional<ast::Pattern_variant>
    {
        if (lex::current(ctx.state) < 'A' or lex::current(ctx.state) > 'Z') {
            return std::nullopt;
        }
        auto name = lex::extract_qualified_name(ctx.state);
        if (not name.has_value() or not name.value().is_upper) {
            error_expected(ctx, "a constructor pattern");
        }
        return ast::patt::Tag {
            .reference = {
                .qualifier = std::move(name.value().qualifier),
                .name      = std::move(name.value().name),
            },
            .arguments = {},
        };
    }

    auto parse_literal_pattern(Context& ctx) -> std::optional<ast::Pattern_variant>
    {
        bool const negated = lex::current(ctx.state) == '-' and lex::lookahead(ctx.state, 1) >= '0'
                         and lex::lookahead(ctx.state, 1) <= '9';
        if (negated) {
            lex::advance(ctx.state);
        }
        return parse_literal(ctx).transform([&](lex::Literal&& literal) {
            return ast::patt::Literal { .literal = std::move(literal), .negated = negated };
        });
    }

    auto extract_parenthesized(Context& ctx) -> ast::Pattern_variant
    {
        auto before = whitespace(ctx);
        auto first  = parse_pattern(ctx);
        if (not first.has_value()) {
            require_character(ctx, ')', "a pattern or a ')'");
            return ast::patt::Unit { std::move(before) };
        }

        std::vector<ast::Commented<ast::Pattern_id>> elements;
        elements.push_back({ .before = std::move(before), .value = first.value(), .after = whitespace(ctx) });
        while (lex::try_consume(ctx.state, ',')) {
            auto element_before = whitespace(ctx);
            auto element        = require<parse_pattern>(ctx, "a pattern");
            elements.push_back({
                .before = std::move(element_before),
                .value  = element,
                .after  = whitespace(ctx),
            });
        }
        require_character(ctx, ')', "a ',' or a ')'");

        if (elements.size() == 1) {
            return ast::patt::Parenthesized { std::move(elements.front()) };
        }
        return ast::patt::Tuple { std::move(elements) };
    }

    auto dispatch_parse_pattern_term(Context& ctx) -> std::optional<ast::Pattern_variant>
    {
        switch (lex::current(ctx.state)) {
        case '(':
            lex::advance(ctx.state);
            return extract_parenthesized(ctx);
        case '[':
            lex::advance(ctx.state);
            return ast::patt::List { extract_sequence<parse_pattern, "a pattern">(ctx, ']') };
        case '{':
            lex::advance(ctx.state);
            return ast::patt::Record { extract_sequence<parse_lower_name, "a field name">(ctx, '}') };
        case '_':
            return parse_wildcard(ctx);
        default:
            if (auto name = parse_lower_name(ctx)) {
                return ast::patt::Variable { std::move(name).value() };
            }
            if (auto tag = parse_tag(ctx)) {
                return tag;
            }
            return parse_literal_pattern(ctx);
        }
    }

    // A constructor followed by its arguments, or a pattern term.
    auto parse_pattern_application(Context& ctx) -> std::optional<ast::Pattern_id>
    {
        auto const start = ctx.state.position;
        auto       term  = dispatch_parse_pattern_term(ctx);
        if (not term.has_value()) {
            return std::nullopt;
        }
        if (auto* const tag = std::get_if<ast::patt::Tag>(&term.value())) {
            auto arguments = extract_space_prefixed<parse_pattern_term>(ctx, Spacing::Any);
            for (auto& argument : arguments) {
                tag->arguments.push_back(std::move(argument.item));
            }
        }
        return push(ctx, std::move(term).value(), start);
    }

    auto parse_cons_clause(Context& ctx) -> std::optional<ast::patt::Cons_clause>
    {
        bool const ahead = followed_by(ctx, [&] {
            std::ignore = extract_trivia(ctx);
            return try_symbol(ctx, "::");
        });
        if (not ahead) {
            return std::nullopt;
        }
        auto [before_operator, after_operator] = padded_symbol(ctx, "::", "'::'");
        return ast::patt::Cons_clause {
            .before_operator = std::move(before_operator),
            .after_operator  = std::move(after_operator),
            .pattern         = require<parse_pattern_application>(ctx, "a pattern"),
        };
    }

    auto parse_cons(Context& ctx) -> std::optional<ast::Pattern_id>
    {
        auto const start = ctx.state.position;
        auto const head  = parse_pattern_application(ctx);
        if (not head.has_value()) {
            return std::nullopt;
        }
        std::vector<ast::patt::Cons_clause> tail;
        while (auto clause = parse_cons_clause(ctx)) {
            tail.push_back(std::move(clause).value());
        }
        if (tail.empty()) {
            return head;
        }
        return push(ctx, ast::patt::Cons { .head = head.value(), .tail = std::move(tail) }, start);
    }
} // namespace

auto knit::par::parse_pattern_term(Context& ctx) -> std::optional<ast::Pattern_id>
{
    auto const start = ctx.state.position;
    return dispatch_parse_pattern_term(ctx).transform([&](ast::Pattern_variant&& variant) {
        return push(ctx, std::move(variant), start);
    });
}

auto knit::par::parse_pattern(Context& ctx) -> std::optional<ast::Pattern_id>
{
    Depth_guard const guard { ctx, "a shallower pattern" };
    auto const start   = ctx.state.position;
    auto       pattern = parse_cons(ctx);
    if (not pattern.has_value()) {
        return std::nullopt;
    }
    for (;;) {
        bool const ahead = followed_by(ctx, [&] {
            std::ignore = extract_trivia(ctx);
            return try_keyword(ctx, "as");
        });
        if (not ahead) {
            return pattern;
        }
        auto after_pattern = whitespace(ctx);
        require_keyword(ctx, "as", "'as'");
        auto before_name = whitespace(ctx);
        auto name        = parse_lower_name(ctx);
        if (not name.has_value()) {
            error_expected(ctx, "an alias name");
        }
        pattern = push(
            ctx,
            ast::patt::Alias {
                .pattern = { .value = pattern.value(), .after = std::move(after_pattern) },
                .name    = { .before = std::move(before_name), .value = std::move(name).value() },
            },
            start);
    }
}
