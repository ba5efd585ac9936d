#include <libutl/utilities.hpp>
#include <libparse/internals.hpp>

using namespace knit;
using namespace knit::par;

namespace {
    auto push(Context& ctx, ast::Type_variant variant, utl::Position const start) -> ast::Type_id
    {
        return ctx.arena.types.push(std::move(variant), up_to_current(ctx, start));
    }

    auto parse_constructor(Context& ctx) -> std::optional<ast::Type_variant>
    {
        if (lex::current(ctx.state) < 'A' or lex::current(ctx.state) > 'Z') {
            return std::nullopt;
        }
        auto name = lex::extract_qualified_name(ctx.state);
        if (not name.has_value() or not name.value().is_upper) {
            error_expected(ctx, "a type constructor");
        }
        return ast::type::Constructor {
            .reference = {
                .qualifier = std::move(name.value().qualifier),
                .name      = std::move(name.value().name),
            },
            .arguments = {},
        };
    }

    auto extract_parenthesized(Context& ctx) -> ast::Type_variant
    {
        auto const newlines = ctx.state.newlines;
        auto       before   = whitespace(ctx);
        auto       first    = parse_type(ctx);
        if (not first.has_value()) {
            require_character(ctx, ')', "a type or a ')'");
            return ast::type::Unit { std::move(before) };
        }

        std::vector<ast::Commented<ast::Type_id>> elements;
        elements.push_back({ .before = std::move(before), .value = first.value(), .after = whitespace(ctx) });
        while (lex::try_consume(ctx.state, ',')) {
            auto element_before = whitespace(ctx);
            auto element        = require<parse_type>(ctx, "a type");
            elements.push_back({
                .before = std::move(element_before),
                .value  = element,
                .after  = whitespace(ctx),
            });
        }
        auto const multiline = multiline_since(ctx, newlines);
        require_character(ctx, ')', "a ',' or a ')'");

        if (elements.size() == 1) {
            return ast::type::Parenthesized { std::move(elements.front()) };
        }
        return ast::type::Tuple { .elements = std::move(elements), .multiline = multiline };
    }

    auto parse_record_field(Context& ctx) -> std::optional<ast::type::Record_field>
    {
        return parse_located_lower_name(ctx).transform([&](ast::Located<std::string>&& name) {
            auto [before_colon, after_colon] = padded_symbol(ctx, ":", "a ':'");
            return ast::type::Record_field {
                .name         = std::move(name),
                .before_colon = std::move(before_colon),
                .after_colon  = std::move(after_colon),
                .type         = require<parse_type>(ctx, "a type"),
            };
        });
    }

    auto parse_record_base(Context& ctx) -> std::optional<ast::Commented<ast::Located<std::string>>>
    {
        auto before = whitespace(ctx);
        auto name   = parse_located_lower_name(ctx);
        if (not name.has_value()) {
            return std::nullopt;
        }
        auto after = whitespace(ctx);
        if (not try_symbol(ctx, "|")) {
            return std::nullopt;
        }
        return ast::Commented<ast::Located<std::string>> {
            .before = std::move(before),
            .value  = std::move(name).value(),
            .after  = std::move(after),
        };
    }

    auto extract_record(Context& ctx) -> ast::Type_variant
    {
        auto const newlines = ctx.state.newlines;
        auto       base     = attempt(ctx, [&] { return parse_record_base(ctx); });
        auto       fields   = extract_sequence<parse_record_field, "a record field">(ctx, '}');
        if (base.has_value() and fields.elements.empty()) {
            error_expected(ctx, "a record field");
        }
        fields.multiline = multiline_since(ctx, newlines);
        return ast::type::Record { .base = std::move(base), .fields = std::move(fields) };
    }

    auto dispatch_parse_type_term(Context& ctx) -> std::optional<ast::Type_variant>
    {
        switch (lex::current(ctx.state)) {
        case '(':
            lex::advance(ctx.state);
            return extract_parenthesized(ctx);
        case '{':
            lex::advance(ctx.state);
            return extract_record(ctx);
        default:
            if (auto name = parse_lower_name(ctx)) {
                return ast::type::Variable { std::move(name).value() };
            }
            return parse_constructor(ctx);
        }
    }

    // A type constructor followed by its arguments, or a type term.
    auto parse_type_application(Context& ctx) -> std::optional<ast::Type_id>
    {
        auto const start = ctx.state.position;
        auto       term  = dispatch_parse_type_term(ctx);
        if (not term.has_value()) {
            return std::nullopt;
        }
        if (auto* const constructor = std::get_if<ast::type::Constructor>(&term.value())) {
            auto arguments = extract_space_prefixed<parse_type_term>(ctx, Spacing::Any);
            for (auto& argument : arguments) {
                constructor->arguments.push_back(std::move(argument.item));
            }
        }
        return push(ctx, std::move(term).value(), start);
    }

    auto parse_function_clause(Context& ctx) -> std::optional<ast::type::Function_clause>
    {
        bool const ahead = followed_by(ctx, [&] {
            std::ignore = extract_trivia(ctx);
            return try_symbol(ctx, "->");
        });
        if (not ahead) {
            return std::nullopt;
        }
        auto [before_arrow, after_arrow] = padded_symbol(ctx, "->", "'->'");
        return ast::type::Function_clause {
            .before_arrow = std::move(before_arrow),
            .after_arrow  = std::move(after_arrow),
            .type         = require<parse_type_application>(ctx, "a type"),
        };
    }
} // namespace

auto knit::par::parse_type_term(Context& ctx) -> std::optional<ast::Type_id>
{
    auto const start = ctx.state.position;
    return dispatch_parse_type_term(ctx).transform(
        [&](ast::Type_variant&& variant) { return push(ctx, std::move(variant), start); });
}

auto knit::par::parse_type(Context& ctx) -> std::optional<ast::Type_id>
{
    Depth_guard const guard { ctx, "a shallower type" };
    auto const start    = ctx.state.position;
    auto const newlines = ctx.state.newlines;
    auto const first    = parse_type_application(ctx);
    if (not first.has_value()) {
        return std::nullopt;
    }
    std::vector<ast::type::Function_clause> rest;
    while (auto clause = parse_function_clause(ctx)) {
        rest.push_back(std::move(clause).value());
    }
    if (rest.empty()) {
        return first;
    }
    return push(
        ctx,
        ast::type::Function {
            .first     = first.value(),
            .rest      = std::move(rest),
            .multiline = multiline_since(ctx, newlines),
        },
        start);
}
