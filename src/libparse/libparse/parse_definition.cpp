#include <libutl/utilities.hpp>
#include <libparse/internals.hpp>

using namespace knit;
using namespace knit::par;

namespace {
    struct Definition_head {
        ast::Pattern_id                             pattern;
        std::vector<ast::Pre_commented<ast::Pattern_id>> parameters;
    };

    // Only variables and operators take parameters. Any other pattern binds without them.
    auto takes_parameters(ast::Pattern const& pattern) -> bool
    {
        return std::holds_alternative<ast::patt::Variable>(pattern.variant)
            or std::holds_alternative<ast::patt::Operator>(pattern.variant);
    }

    auto parse_head_pattern(Context& ctx) -> std::optional<ast::Pattern_id>
    {
        if (auto pattern = attempt(ctx, [&] { return parse_pattern_term(ctx); })) {
            return pattern;
        }
        auto const start = ctx.state.position;
        return parse_parenthesized_operator(ctx).transform([&](std::string&& symbol) {
            return ctx.arena.patterns.push(
                ast::Pattern_variant(ast::patt::Operator { std::move(symbol) }),
                up_to_current(ctx, start));
        });
    }

    auto parse_definition_head(Context& ctx) -> std::optional<Definition_head>
    {
        return parse_head_pattern(ctx).transform([&](ast::Pattern_id const pattern) {
            Definition_head head { .pattern = pattern, .parameters = {} };
            if (takes_parameters(ctx.arena.patterns[pattern])) {
                for (auto& parameter : extract_space_prefixed<parse_pattern_term>(ctx, Spacing::Any)) {
                    head.parameters.push_back(std::move(parameter.item));
                }
            }
            return head;
        });
    }

    auto parse_annotated_name(Context& ctx) -> std::optional<ast::Reference>
    {
        if (auto name = parse_lower_name(ctx)) {
            return ast::Var_ref { .qualifier = {}, .name = std::move(name).value() };
        }
        return parse_parenthesized_operator(ctx).transform(
            [](std::string&& symbol) -> ast::Reference { return ast::Op_ref { std::move(symbol) }; });
    }

    struct Annotation_head {
        ast::Reference name;
        Padding        colon;
    };

    auto parse_annotation_head(Context& ctx) -> std::optional<Annotation_head>
    {
        return parse_annotated_name(ctx).transform([&](ast::Reference&& name) {
            return Annotation_head {
                .name  = std::move(name),
                .colon = padded_symbol(ctx, ":", "a ':'"),
            };
        });
    }

    auto parse_declaration(Context& ctx) -> std::optional<ast::Declaration>
    {
        auto const make = [](auto declaration, utl::Range const range) {
            return ast::Declaration { .variant = std::move(declaration), .range = range };
        };
        if (auto annotation = parse_type_annotation(ctx, make)) {
            return annotation;
        }
        return parse_definition(ctx, make);
    }

    void append_comments(ast::Module& result, ast::Comments comments)
    {
        for (lex::Comment& comment : comments) {
            auto const range = comment.range;
            result.declarations.push_back(
                ast::Declaration { .variant = std::move(comment), .range = range });
        }
    }
} // namespace

auto knit::par::parse_plain_definition(Context& ctx) -> std::optional<ast::Definition>
{
    return with_position(ctx, [&]() -> std::optional<ast::Definition> {
        auto head = parse_definition_head(ctx);
        if (not head.has_value()) {
            return std::nullopt;
        }
        auto [before_equals, after_equals] = padded_symbol(ctx, "=", "a '='");
        before_equals.append_range(std::move(after_equals));
        return ast::Definition {
            .pattern         = head.value().pattern,
            .parameters      = std::move(head.value().parameters),
            .equals_comments = std::move(before_equals),
            .body            = require<parse_expression>(ctx, "an expression"),
        };
    });
}

auto knit::par::parse_plain_type_annotation(Context& ctx) -> std::optional<ast::Type_annotation>
{
    auto head = attempt(ctx, [&] { return parse_annotation_head(ctx); });
    if (not head.has_value()) {
        return std::nullopt;
    }
    return ast::Type_annotation {
        .name = { .value = std::move(head.value().name), .after = std::move(head.value().colon.before) },
        .type = { .before = std::move(head.value().colon.after), .value = require<parse_type>(ctx, "a type") },
    };
}

auto knit::par::parse_module(Context& ctx) -> ast::Module
{
    ast::Module result;
    append_comments(result, whitespace(ctx));
    while (not lex::is_finished(ctx.state)) {
        if (not check_indent(ctx)) {
            error_expected(ctx, "a declaration at the start of a line");
        }
        if (auto declaration = parse_declaration(ctx)) {
            debug(ctx, "Parsed a declaration at {}", declaration.value().range);
            result.declarations.push_back(std::move(declaration).value());
        }
        else {
            error_expected(ctx, "the definition of a variable (x = ...)");
        }
        append_comments(result, whitespace(ctx));
    }
    return result;
}
