#include <libutl/utilities.hpp>
#include <libparse/parse.hpp>

using namespace knit;

namespace {
    struct Context {
        ast::Arena const& arena;
        std::string&      output;
    };

    template <typename... Args>
    void write(Context& ctx, std::format_string<Args...> const fmt, Args&&... args)
    {
        std::format_to(std::back_inserter(ctx.output), fmt, std::forward<Args>(args)...);
    }

    void format(Context& ctx, ast::Expression_id id);
    void format(Context& ctx, ast::Pattern_id id);
    void format(Context& ctx, ast::Type_id id);

    // Each element preceded by a space.
    template <typename T>
    void format_spaced(Context& ctx, std::vector<T> const& elements, auto const& project)
    {
        for (T const& element : elements) {
            write(ctx, " ");
            format(ctx, project(element));
        }
    }

    template <typename Id>
    void format_spaced(Context& ctx, std::vector<ast::Pre_commented<Id>> const& elements)
    {
        format_spaced(ctx, elements, [](auto const& element) { return element.value; });
    }

    template <typename Id>
    void format_spaced(Context& ctx, std::vector<ast::Commented<Id>> const& elements)
    {
        format_spaced(ctx, elements, [](auto const& element) { return element.value; });
    }

    auto operator_string(ast::Reference const& reference) -> std::string
    {
        if (auto const* const op = std::get_if<ast::Op_ref>(&reference)) {
            return op->symbol;
        }
        return std::format("`{}`", ast::reference_string(reference));
    }

    void format_definition(Context& ctx, ast::Definition const& definition)
    {
        write(ctx, "(= ");
        if (definition.parameters.empty()) {
            format(ctx, definition.pattern);
        }
        else {
            write(ctx, "(");
            format(ctx, definition.pattern);
            format_spaced(ctx, definition.parameters);
            write(ctx, ")");
        }
        write(ctx, " ");
        format(ctx, definition.body);
        write(ctx, ")");
    }

    void format_annotation(Context& ctx, ast::Type_annotation const& annotation)
    {
        write(ctx, "(: {} ", ast::reference_string(annotation.name.value));
        format(ctx, annotation.type.value);
        write(ctx, ")");
    }

    void format_comment(Context& ctx, lex::Comment const& comment)
    {
        write(ctx, "(comment \"{}\")", utl::escape(comment.text));
    }

    struct Expression_format_visitor {
        Context& ctx;

        void operator()(lex::Literal const& literal)
        {
            write(ctx, "{}", literal);
        }

        void operator()(ast::expr::Variable const& variable)
        {
            write(ctx, "{}", ast::reference_string(variable.reference));
        }

        void operator()(ast::expr::Negation const& negation)
        {
            write(ctx, "(negate ");
            format(ctx, negation.operand);
            write(ctx, ")");
        }

        void operator()(ast::expr::Range const& range)
        {
            write(ctx, "(range ");
            format(ctx, range.low.value);
            write(ctx, " ");
            format(ctx, range.high.value);
            write(ctx, ")");
        }

        void operator()(ast::expr::List const& list)
        {
            write(ctx, "(list");
            format_spaced(ctx, list.elements.elements);
            write(ctx, ")");
        }

        void operator()(ast::expr::Shader const& shader)
        {
            write(ctx, "(glsl \"{}\")", utl::escape(shader.source));
        }

        void operator()(ast::expr::Application const& application)
        {
            write(ctx, "(app ");
            format(ctx, application.head);
            format_spaced(ctx, application.arguments);
            write(ctx, ")");
        }

        void operator()(ast::expr::Binops const& binops)
        {
            write(ctx, "(binops ");
            format(ctx, binops.operand);
            for (ast::expr::Binops_clause const& clause : binops.clauses) {
                write(ctx, " {} ", operator_string(clause.op.value));
                format(ctx, clause.operand);
            }
            write(ctx, ")");
        }

        void operator()(ast::expr::If const& if_)
        {
            auto const clause = [&](ast::expr::If_clause const& clause) {
                write(ctx, " (");
                format(ctx, clause.condition.value);
                write(ctx, " ");
                format(ctx, clause.body.value);
                write(ctx, ")");
            };
            write(ctx, "(if");
            clause(if_.first);
            for (auto const& rest : if_.rest) {
                clause(rest.value);
            }
            write(ctx, " ");
            format(ctx, if_.otherwise.value);
            write(ctx, ")");
        }

        void operator()(ast::expr::Case const& case_)
        {
            write(ctx, "(case ");
            format(ctx, case_.subject.value);
            for (ast::expr::Case_branch const& branch : case_.branches) {
                write(ctx, " (");
                format(ctx, branch.pattern);
                write(ctx, " ");
                format(ctx, branch.body);
                write(ctx, ")");
            }
            write(ctx, ")");
        }

        void operator()(ast::expr::Let const& let)
        {
            write(ctx, "(let (");
            bool first = true;
            for (ast::expr::Let_declaration const& declaration : let.declarations) {
                if (std::holds_alternative<ast::expr::Let_comment>(declaration.variant)) {
                    continue;
                }
                if (not std::exchange(first, false)) {
                    write(ctx, " ");
                }
                std::visit(
                    utl::Overload {
                        [&](ast::Definition const& definition) { format_definition(ctx, definition); },
                        [&](ast::Type_annotation const& annotation) {
                            format_annotation(ctx, annotation);
                        },
                        [](ast::expr::Let_comment const&) { cpputil::unreachable(); },
                    },
                    declaration.variant);
            }
            write(ctx, ") ");
            format(ctx, let.body);
            write(ctx, ")");
        }

        void operator()(ast::expr::Lambda const& lambda)
        {
            write(ctx, "(lambda (");
            bool first = true;
            for (auto const& parameter : lambda.parameters) {
                if (not std::exchange(first, false)) {
                    write(ctx, " ");
                }
                format(ctx, parameter.value);
            }
            write(ctx, ") ");
            format(ctx, lambda.body);
            write(ctx, ")");
        }

        void operator()(ast::expr::Tuple const& tuple)
        {
            write(ctx, "(tuple");
            format_spaced(ctx, tuple.elements);
            write(ctx, ")");
        }

        void operator()(ast::expr::Parenthesized const& parenthesized)
        {
            write(ctx, "(paren ");
            format(ctx, parenthesized.expression.value);
            write(ctx, ")");
        }

        void operator()(ast::expr::Unit const&)
        {
            write(ctx, "()");
        }

        void operator()(ast::expr::Record const& record)
        {
            if (record.base.has_value()) {
                write(ctx, "(record-update {}", record.base.value().value.value);
            }
            else {
                write(ctx, "(record");
            }
            for (auto const& field : record.fields.elements) {
                write(ctx, " ({} ", field.value.name.value);
                format(ctx, field.value.value);
                write(ctx, ")");
            }
            write(ctx, ")");
        }

        void operator()(ast::expr::Access const& access)
        {
            write(ctx, "(access ");
            format(ctx, access.record);
            write(ctx, " {})", access.field.value);
        }

        void operator()(ast::expr::Access_function const& function)
        {
            write(ctx, ".{}", function.field);
        }

        void operator()(ast::expr::Tuple_function const& function)
        {
            write(ctx, "({})", std::string(function.arity - 1, ','));
        }
    };

    struct Pattern_format_visitor {
        Context& ctx;

        void operator()(ast::patt::Wildcard const&)
        {
            write(ctx, "_");
        }

        void operator()(ast::patt::Variable const& variable)
        {
            write(ctx, "{}", variable.name);
        }

        void operator()(ast::patt::Literal const& literal)
        {
            write(ctx, "{}{}", literal.negated ? "-" : "", literal.literal);
        }

        void operator()(ast::patt::Operator const& op)
        {
            write(ctx, "({})", op.symbol);
        }

        void operator()(ast::patt::Tag const& tag)
        {
            auto const name = ast::reference_string(tag.reference);
            if (tag.arguments.empty()) {
                write(ctx, "{}", name);
                return;
            }
            write(ctx, "({}", name);
            format_spaced(ctx, tag.arguments);
            write(ctx, ")");
        }

        void operator()(ast::patt::Unit const&)
        {
            write(ctx, "()");
        }

        void operator()(ast::patt::Parenthesized const& parenthesized)
        {
            write(ctx, "(paren ");
            format(ctx, parenthesized.pattern.value);
            write(ctx, ")");
        }

        void operator()(ast::patt::Tuple const& tuple)
        {
            write(ctx, "(tuple");
            format_spaced(ctx, tuple.elements);
            write(ctx, ")");
        }

        void operator()(ast::patt::List const& list)
        {
            write(ctx, "(list");
            format_spaced(ctx, list.elements.elements);
            write(ctx, ")");
        }

        void operator()(ast::patt::Record const& record)
        {
            write(ctx, "(record");
            for (auto const& field : record.fields.elements) {
                write(ctx, " {}", field.value);
            }
            write(ctx, ")");
        }

        void operator()(ast::patt::Cons const& cons)
        {
            write(ctx, "(:: ");
            format(ctx, cons.head);
            format_spaced(ctx, cons.tail, [](ast::patt::Cons_clause const& clause) {
                return clause.pattern;
            });
            write(ctx, ")");
        }

        void operator()(ast::patt::Alias const& alias)
        {
            write(ctx, "(as ");
            format(ctx, alias.pattern.value);
            write(ctx, " {})", alias.name.value);
        }
    };

    struct Type_format_visitor {
        Context& ctx;

        void operator()(ast::type::Variable const& variable)
        {
            write(ctx, "{}", variable.name);
        }

        void operator()(ast::type::Constructor const& constructor)
        {
            auto const name = ast::reference_string(constructor.reference);
            if (constructor.arguments.empty()) {
                write(ctx, "{}", name);
                return;
            }
            write(ctx, "({}", name);
            format_spaced(ctx, constructor.arguments);
            write(ctx, ")");
        }

        void operator()(ast::type::Unit const&)
        {
            write(ctx, "()");
        }

        void operator()(ast::type::Parenthesized const& parenthesized)
        {
            write(ctx, "(paren ");
            format(ctx, parenthesized.type.value);
            write(ctx, ")");
        }

        void operator()(ast::type::Tuple const& tuple)
        {
            write(ctx, "(tuple");
            format_spaced(ctx, tuple.elements);
            write(ctx, ")");
        }

        void operator()(ast::type::Record const& record)
        {
            if (record.base.has_value()) {
                write(ctx, "(record-extension {}", record.base.value().value.value);
            }
            else {
                write(ctx, "(record");
            }
            for (auto const& field : record.fields.elements) {
                write(ctx, " ({} ", field.value.name.value);
                format(ctx, field.value.type);
                write(ctx, ")");
            }
            write(ctx, ")");
        }

        void operator()(ast::type::Function const& function)
        {
            write(ctx, "(-> ");
            format(ctx, function.first);
            format_spaced(ctx, function.rest, [](ast::type::Function_clause const& clause) {
                return clause.type;
            });
            write(ctx, ")");
        }
    };

    void format(Context& ctx, ast::Expression_id const id)
    {
        std::visit(Expression_format_visitor { ctx }, ctx.arena.expressions[id].variant);
    }

    void format(Context& ctx, ast::Pattern_id const id)
    {
        std::visit(Pattern_format_visitor { ctx }, ctx.arena.patterns[id].variant);
    }

    void format(Context& ctx, ast::Type_id const id)
    {
        std::visit(Type_format_visitor { ctx }, ctx.arena.types[id].variant);
    }

    template <typename Node>
    auto render(ast::Arena const& arena, Node const& node) -> std::string
    {
        std::string output;
        Context     ctx { .arena = arena, .output = output };
        format(ctx, node);
        return output;
    }
} // namespace

auto knit::par::to_string(ast::Arena const& arena, ast::Expression_id const id) -> std::string
{
    return render(arena, id);
}

auto knit::par::to_string(ast::Arena const& arena, ast::Pattern_id const id) -> std::string
{
    return render(arena, id);
}

auto knit::par::to_string(ast::Arena const& arena, ast::Type_id const id) -> std::string
{
    return render(arena, id);
}

auto knit::par::to_string(ast::Arena const& arena, ast::Declaration const& declaration)
    -> std::string
{
    std::string output;
    Context     ctx { .arena = arena, .output = output };
    std::visit(
        utl::Overload {
            [&](ast::Definition const& definition) { format_definition(ctx, definition); },
            [&](ast::Type_annotation const& annotation) { format_annotation(ctx, annotation); },
            [&](lex::Comment const& comment) { format_comment(ctx, comment); },
        },
        declaration.variant);
    return output;
}
