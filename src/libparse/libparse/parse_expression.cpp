#include <libutl/utilities.hpp>
#include <libparse/internals.hpp>
#include <libparse/binops.hpp>

using namespace knit;
using namespace knit::par;

namespace {
    auto push(Context& ctx, ast::Expression_variant variant, utl::Position const start)
        -> ast::Expression_id
    {
        return ctx.arena.expressions.push(std::move(variant), up_to_current(ctx, start));
    }

    auto commented(ast::Comments before, ast::Expression_id const expression, ast::Comments after)
        -> ast::Commented<ast::Expression_id>
    {
        return { .before = std::move(before), .value = expression, .after = std::move(after) };
    }

    auto parse_variable(Context& ctx) -> std::optional<ast::Expression_variant>
    {
        return lex::extract_qualified_name(ctx.state).transform(
            [](lex::Qualified_name&& name) -> ast::Expression_variant {
                if (not name.is_upper) {
                    return ast::expr::Variable { ast::Var_ref {
                        .qualifier = std::move(name.qualifier),
                        .name      = std::move(name.name),
                    } };
                }
                if (name.qualifier.empty() and (name.name == "True" or name.name == "False")) {
                    return lex::Literal { lex::Boolean { name.name == "True" } };
                }
                return ast::expr::Variable { ast::Tag_ref {
                    .qualifier = std::move(name.qualifier),
                    .name      = std::move(name.name),
                } };
            });
    }

    auto parse_accessor(Context& ctx) -> std::optional<ast::Expression_variant>
    {
        if (not lex::try_consume(ctx.state, '.')) {
            return std::nullopt;
        }
        return parse_lower_name(ctx).transform(
            [](std::string&& field) { return ast::expr::Access_function { std::move(field) }; });
    }

    auto parse_negation(Context& ctx) -> std::optional<ast::Expression_variant>
    {
        if (not lex::try_consume(ctx.state, '-')) {
            return std::nullopt;
        }
        if (lex::current(ctx.state) == '.' or lex::current(ctx.state) == '-') {
            return std::nullopt;
        }
        return parse_term(ctx).transform(
            [](ast::Expression_id const operand) { return ast::expr::Negation { operand }; });
    }

    auto extract_list(Context& ctx) -> ast::Expression_variant
    {
        auto const newlines = ctx.state.newlines;
        auto       before   = whitespace(ctx);
        auto       first    = parse_expression(ctx);
        if (not first.has_value()) {
            auto const multiline = multiline_since(ctx, newlines);
            require_character(ctx, ']', "an expression or a ']'");
            return ast::expr::List { {
                .elements  = {},
                .inner     = std::move(before),
                .multiline = multiline,
            } };
        }

        auto after = whitespace(ctx);
        if (lex::try_consume(ctx.state, "..")) {
            auto high_before = whitespace(ctx);
            auto high        = require<parse_expression>(ctx, "an expression");
            auto high_after  = whitespace(ctx);
            require_character(ctx, ']', "a ']'");
            return ast::expr::Range {
                .low  = commented(std::move(before), first.value(), std::move(after)),
                .high = commented(std::move(high_before), high, std::move(high_after)),
            };
        }

        ast::Sequence<ast::Expression_id> elements;
        elements.elements.push_back(commented(std::move(before), first.value(), std::move(after)));
        extract_sequence_tail<parse_expression, "an expression">(ctx, elements, ']', newlines);
        return ast::expr::List { std::move(elements) };
    }

    auto parse_list_term(Context& ctx) -> std::optional<ast::Expression_id>
    {
        auto const start = ctx.state.position;
        if (lex::starts_shader(ctx.state)) {
            if (auto source = lex::extract_shader(ctx.state)) {
                return push(ctx, ast::expr::Shader { std::move(source).value() }, start);
            }
            else {
                error_lexical(source.error());
            }
        }
        if (not lex::try_consume(ctx.state, '[')) {
            return std::nullopt;
        }
        return push(ctx, extract_list(ctx), start);
    }

    auto parse_tuple_function(Context& ctx) -> std::optional<ast::Expression_variant>
    {
        if (not lex::try_consume(ctx.state, '(')) {
            return std::nullopt;
        }
        std::size_t commas = 0;
        while (lex::try_consume(ctx.state, ',')) {
            ++commas;
        }
        if (commas == 0 or not lex::try_consume(ctx.state, ')')) {
            return std::nullopt;
        }
        return ast::expr::Tuple_function { commas + 1 };
    }

    auto extract_parenthesized(Context& ctx) -> ast::Expression_variant
    {
        auto const newlines = ctx.state.newlines;
        auto       before   = whitespace(ctx);
        auto       first    = parse_expression(ctx);
        if (not first.has_value()) {
            require_character(ctx, ')', "an expression or a ')'");
            return ast::expr::Unit { std::move(before) };
        }

        std::vector<ast::Commented<ast::Expression_id>> elements;
        elements.push_back(commented(std::move(before), first.value(), whitespace(ctx)));
        while (lex::try_consume(ctx.state, ',')) {
            auto element_before = whitespace(ctx);
            auto element        = require<parse_expression>(ctx, "an expression");
            elements.push_back(commented(std::move(element_before), element, whitespace(ctx)));
        }
        auto const multiline = multiline_since(ctx, newlines);
        require_character(ctx, ')', "a ',' or a ')'");

        if (elements.size() == 1) {
            return ast::expr::Parenthesized { std::move(elements.front()) };
        }
        return ast::expr::Tuple { .elements = std::move(elements), .multiline = multiline };
    }

    auto parse_parens_term(Context& ctx) -> std::optional<ast::Expression_variant>
    {
        if (lex::current(ctx.state) != '(') {
            return std::nullopt;
        }
        if (auto symbol = parse_parenthesized_operator(ctx)) {
            return ast::expr::Variable { ast::Op_ref { std::move(symbol).value() } };
        }
        if (auto function = attempt(ctx, [&] { return parse_tuple_function(ctx); })) {
            return function;
        }
        lex::advance(ctx.state);
        return extract_parenthesized(ctx);
    }

    auto parse_record_field(Context& ctx) -> std::optional<ast::expr::Record_field>
    {
        return parse_located_lower_name(ctx).transform([&](ast::Located<std::string>&& name) {
            auto [before_equals, after_equals] = padded_symbol(ctx, "=", "a '='");
            return ast::expr::Record_field {
                .name          = std::move(name),
                .before_equals = std::move(before_equals),
                .after_equals  = std::move(after_equals),
                .value         = require<parse_expression>(ctx, "an expression"),
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

    auto parse_record_term(Context& ctx) -> std::optional<ast::Expression_variant>
    {
        if (not lex::try_consume(ctx.state, '{')) {
            return std::nullopt;
        }
        auto const newlines = ctx.state.newlines;
        auto       base     = attempt(ctx, [&] { return parse_record_base(ctx); });
        auto       fields   = extract_sequence<parse_record_field, "a record field">(ctx, '}');
        if (base.has_value() and fields.elements.empty()) {
            error_expected(ctx, "a record field");
        }
        fields.multiline = multiline_since(ctx, newlines);
        return ast::expr::Record { .base = std::move(base), .fields = std::move(fields) };
    }

    auto parse_accessible_term(Context& ctx) -> std::optional<ast::Expression_variant>
    {
        if (auto variable = parse_variable(ctx)) {
            return variable;
        }
        if (auto parens = parse_parens_term(ctx)) {
            return parens;
        }
        return parse_record_term(ctx);
    }

    // Field accesses directly following a term, as in `model.user.name`.
    auto extract_accesses(Context& ctx, ast::Expression_id record, utl::Position const start)
        -> ast::Expression_id
    {
        while (lex::current(ctx.state) == '.' and lex::lookahead(ctx.state, 1) >= 'a'
               and lex::lookahead(ctx.state, 1) <= 'z')
        {
            lex::advance(ctx.state);
            auto field = parse_located_lower_name(ctx);
            if (not field.has_value()) {
                error_expected(ctx, "a field name");
            }
            record = push(
                ctx,
                ast::expr::Access { .record = record, .field = std::move(field).value() },
                start);
        }
        return record;
    }

    auto application_layout(
        ast::Multiline const head, std::span<Spaced<ast::Expression_id> const> const arguments)
        -> ast::Application_layout
    {
        cpputil::always_assert(not arguments.empty());
        if (head == ast::Multiline::Split_all) {
            return ast::Split_first {};
        }
        if (arguments.front().multiline == ast::Multiline::Split_all) {
            return ast::Split_first {};
        }
        bool const later_multiline
            = std::ranges::any_of(arguments | std::views::drop(1), [](auto const& argument) {
                  return argument.multiline == ast::Multiline::Split_all;
              });
        return ast::Join_first {
            later_multiline ? ast::Multiline::Split_all : ast::Multiline::Join_all,
        };
    }

    auto parse_if_clause(Context& ctx) -> std::optional<ast::expr::If_clause>
    {
        if (not try_keyword(ctx, "if")) {
            return std::nullopt;
        }
        auto before_condition = whitespace(ctx);
        auto condition        = require<parse_expression>(ctx, "an expression");
        auto [after_condition, before_body] = padded_keyword(ctx, "then", "'then'");
        auto body        = require<parse_expression>(ctx, "an expression");
        auto before_else = whitespace(ctx);
        return ast::expr::If_clause {
            .condition = commented(std::move(before_condition), condition, std::move(after_condition)),
            .body      = commented(std::move(before_body), body, std::move(before_else)),
        };
    }

    auto parse_else_if_clause(Context& ctx)
        -> std::optional<ast::Pre_commented<ast::expr::If_clause>>
    {
        if (not try_keyword(ctx, "else")) {
            return std::nullopt;
        }
        auto before = whitespace(ctx);
        return parse_if_clause(ctx).transform([&](ast::expr::If_clause&& clause) {
            return ast::Pre_commented<ast::expr::If_clause> {
                .before = std::move(before),
                .value  = std::move(clause),
            };
        });
    }

    auto parse_if(Context& ctx) -> std::optional<ast::Expression_id>
    {
        auto const start = ctx.state.position;
        auto       first = parse_if_clause(ctx);
        if (not first.has_value()) {
            return std::nullopt;
        }

        std::vector<ast::Pre_commented<ast::expr::If_clause>> rest;
        while (auto clause = attempt(ctx, [&] { return parse_else_if_clause(ctx); })) {
            rest.push_back(std::move(clause).value());
        }

        require_keyword(ctx, "else", "an 'else' branch");
        auto before_otherwise = whitespace(ctx);
        auto otherwise        = require<parse_expression>(ctx, "an expression");

        return push(
            ctx,
            ast::expr::If {
                .first     = std::move(first).value(),
                .rest      = std::move(rest),
                .otherwise = { .before = std::move(before_otherwise), .value = otherwise },
            },
            start);
    }

    struct Case_branch_head {
        ast::Comments before_pattern;
        ast::Pattern_id pattern;
        Padding         arrow;
        utl::Position   start;
    };

    auto parse_case_branch_head(Context& ctx) -> std::optional<Case_branch_head>
    {
        auto before_pattern = whitespace(ctx);
        if (not check_indent(ctx)) {
            return std::nullopt;
        }
        auto const start   = ctx.state.position;
        auto const pattern = parse_pattern(ctx);
        if (not pattern.has_value()) {
            return std::nullopt;
        }
        return Case_branch_head {
            .before_pattern = std::move(before_pattern),
            .pattern        = pattern.value(),
            .arrow          = padded_symbol(ctx, "->", "'->'"),
            .start          = start,
        };
    }

    auto parse_case_branch(Context& ctx, ast::Comments preceding_comments)
        -> std::optional<ast::expr::Case_branch>
    {
        auto head = attempt(ctx, [&] { return parse_case_branch_head(ctx); });
        if (not head.has_value()) {
            return std::nullopt;
        }
        preceding_comments.append_range(std::move(head.value().before_pattern));
        auto const body = require<parse_expression>(ctx, "an expression");
        return ast::expr::Case_branch {
            .before_pattern = std::move(preceding_comments),
            .pattern        = head.value().pattern,
            .before_arrow   = std::move(head.value().arrow.before),
            .after_arrow    = std::move(head.value().arrow.after),
            .body           = body,
            .range          = up_to_current(ctx, head.value().start),
        };
    }

    auto parse_case(Context& ctx) -> std::optional<ast::Expression_id>
    {
        auto const start = ctx.state.position;
        if (not try_keyword(ctx, "case")) {
            return std::nullopt;
        }

        auto [subject, multiline_subject] = track_newline(ctx, [&] {
            auto before  = whitespace(ctx);
            auto subject = require<parse_expression>(ctx, "an expression");
            return commented(std::move(before), subject, whitespace(ctx));
        });
        require_keyword(ctx, "of", "'of'");
        auto first_comments = whitespace(ctx);
        if (not is_indented(ctx)) {
            error_expected(ctx, "a case branch");
        }

        auto branches = with_position(ctx, [&] {
            std::vector<ast::expr::Case_branch> branches;
            if (auto first = parse_case_branch(ctx, std::move(first_comments))) {
                branches.push_back(std::move(first).value());
            }
            else {
                error_expected(ctx, "a case branch");
            }
            while (auto branch = parse_case_branch(ctx, {})) {
                branches.push_back(std::move(branch).value());
            }
            return branches;
        });

        return push(
            ctx,
            ast::expr::Case {
                .subject           = std::move(subject),
                .multiline_subject = multiline_subject == ast::Multiline::Split_all,
                .branches          = std::move(branches),
            },
            start);
    }

    void append_let_comments(std::vector<ast::expr::Let_declaration>& declarations, ast::Comments comments)
    {
        for (lex::Comment& comment : comments) {
            auto const range = comment.range;
            declarations.push_back(ast::expr::Let_declaration {
                .variant = ast::expr::Let_comment { std::move(comment) },
                .range   = range,
            });
        }
    }

    auto parse_let_declaration(Context& ctx) -> std::optional<ast::expr::Let_declaration>
    {
        auto const make = [](auto declaration, utl::Range const range) {
            return ast::expr::Let_declaration { .variant = std::move(declaration), .range = range };
        };
        if (auto annotation = parse_type_annotation(ctx, make)) {
            return annotation;
        }
        return parse_definition(ctx, make);
    }

    auto parse_let(Context& ctx) -> std::optional<ast::Expression_id>
    {
        auto const start = ctx.state.position;
        if (not try_keyword(ctx, "let")) {
            return std::nullopt;
        }

        std::vector<ast::expr::Let_declaration> declarations;
        append_let_comments(declarations, whitespace(ctx));
        if (not is_indented(ctx)) {
            error_expected(ctx, "the definition of a variable (x = ...)");
        }

        with_position(ctx, [&] {
            for (bool first = true; check_indent(ctx); first = false) {
                auto declaration = parse_let_declaration(ctx);
                if (not declaration.has_value()) {
                    if (first) {
                        error_expected(ctx, "the definition of a variable (x = ...)");
                    }
                    return;
                }
                declarations.push_back(std::move(declaration).value());
                append_let_comments(declarations, whitespace(ctx));
            }
        });

        require_keyword(ctx, "in", "'in'");
        auto before_body = whitespace(ctx);
        auto body        = require<parse_expression>(ctx, "an expression");

        return push(
            ctx,
            ast::expr::Let {
                .declarations = std::move(declarations),
                .before_body  = std::move(before_body),
                .body         = body,
            },
            start);
    }

    auto try_lambda_introducer(Context& ctx) -> bool
    {
        if (lex::try_consume(ctx.state, '\\')) {
            return true;
        }
        return ctx.config.unicode_lambda and lex::try_consume(ctx.state, "λ");
    }

    auto parse_lambda(Context& ctx) -> std::optional<ast::Expression_id>
    {
        auto const start    = ctx.state.position;
        auto const newlines = ctx.state.newlines;
        if (not try_lambda_introducer(ctx)) {
            return std::nullopt;
        }

        auto parameters = extract_space_prefixed<parse_pattern_term>(ctx, Spacing::Any);
        if (parameters.empty()) {
            error_expected(ctx, "a lambda parameter");
        }
        auto [before_arrow, after_arrow] = padded_symbol(ctx, "->", "'->'");
        auto const body                  = require<parse_expression>(ctx, "an expression");

        ast::Comments arrow_comments = std::move(before_arrow);
        arrow_comments.append_range(std::move(after_arrow));

        return push(
            ctx,
            ast::expr::Lambda {
                .parameters = std::ranges::to<std::vector>(
                    std::views::as_rvalue(parameters)
                    | std::views::transform(&Spaced<ast::Pattern_id>::item)),
                .arrow_comments = std::move(arrow_comments),
                .body           = body,
                .multiline      = multiline_since(ctx, newlines) == ast::Multiline::Split_all,
            },
            start);
    }

    constexpr auto parse_binary_expression
        = parse_binops<parse_application, parse_control_flow, parse_operator>;
} // namespace

auto knit::par::parse_term(Context& ctx) -> std::optional<ast::Expression_id>
{
    auto const start = ctx.state.position;
    if (auto literal = parse_literal(ctx)) {
        return push(ctx, std::move(literal).value(), start);
    }
    if (auto list = parse_list_term(ctx)) {
        return list;
    }
    if (auto accessor = attempt(ctx, [&] { return parse_accessor(ctx); })) {
        return push(ctx, std::move(accessor).value(), start);
    }
    if (auto negation = attempt(ctx, [&] { return parse_negation(ctx); })) {
        return push(ctx, std::move(negation).value(), start);
    }
    if (auto term = parse_accessible_term(ctx)) {
        return extract_accesses(ctx, push(ctx, std::move(term).value(), start), start);
    }
    return std::nullopt;
}

auto knit::par::parse_application(Context& ctx) -> std::optional<ast::Expression_id>
{
    auto const start = ctx.state.position;
    return with_position(ctx, [&]() -> std::optional<ast::Expression_id> {
        auto [head, head_multiline] = track_newline(ctx, [&] { return parse_term(ctx); });
        if (not head.has_value()) {
            return std::nullopt;
        }

        auto arguments = extract_space_prefixed<parse_term>(ctx, Spacing::Not_adjacent_minus);
        if (arguments.empty()) {
            return head;
        }

        auto const layout = application_layout(head_multiline, arguments);
        return push(
            ctx,
            ast::expr::Application {
                .head      = head.value(),
                .arguments = std::ranges::to<std::vector>(
                    std::views::as_rvalue(arguments)
                    | std::views::transform(&Spaced<ast::Expression_id>::item)),
                .layout = layout,
            },
            start);
    });
}

auto knit::par::parse_control_flow(Context& ctx) -> std::optional<ast::Expression_id>
{
    if (auto let = parse_let(ctx)) {
        return let;
    }
    if (auto case_ = parse_case(ctx)) {
        return case_;
    }
    if (auto if_ = parse_if(ctx)) {
        return if_;
    }
    return parse_lambda(ctx);
}

auto knit::par::parse_expression(Context& ctx) -> std::optional<ast::Expression_id>
{
    Depth_guard const guard { ctx, "a shallower expression" };
    if (auto expression = parse_control_flow(ctx)) {
        return expression;
    }
    return parse_binary_expression(ctx);
}
