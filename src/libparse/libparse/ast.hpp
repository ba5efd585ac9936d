#ifndef KNIT_LIBPARSE_AST
#define KNIT_LIBPARSE_AST

#include <libutl/utilities.hpp>
#include <libutl/index_vector.hpp>
#include <libutl/source.hpp>
#include <liblex/lex.hpp>

/*

    The syntax tree keeps every comment of the source text, attached to the
    syntactic position it was written in, along with layout tags that record
    whether the author split a construct over several lines. A pretty-printer
    can reproduce the intended layout from the tree alone.

    Nodes live in an arena and refer to each other by index. Each node is
    constructed once and never modified afterwards.

*/

#define DEFINE_INDEX(name)                      \
    struct name : utl::Vector_index<name> {     \
        using Vector_index<name>::Vector_index; \
    }

namespace knit::ast {

    struct Expression;
    struct Pattern;
    struct Type;
    DEFINE_INDEX(Expression_id);
    DEFINE_INDEX(Pattern_id);
    DEFINE_INDEX(Type_id);

    using Comments = std::vector<lex::Comment>;

    template <typename T>
    struct Commented {
        Comments before;
        T        value;
        Comments after;
    };

    template <typename T>
    struct Pre_commented {
        Comments before;
        T        value;
    };

    template <typename T>
    struct Post_commented {
        T        value;
        Comments after;
    };

    template <typename T>
    struct Located {
        T          value;
        utl::Range range;
    };

    // Whether a construct was written on one line or split across several.
    enum struct Multiline : std::uint8_t { Join_all, Split_all };

    // The head of an application and its first argument are on separate lines.
    struct Split_first {
        auto operator==(Split_first const&) const -> bool = default;
    };

    // The head of an application and its first argument are on the same line.
    struct Join_first {
        Multiline rest {}; // Whether any later argument spans several lines.

        auto operator==(Join_first const&) const -> bool = default;
    };

    struct Application_layout : std::variant<Split_first, Join_first> {
        using variant::variant;
    };

    struct Var_ref {
        std::vector<std::string> qualifier;
        std::string              name;
    };

    struct Tag_ref {
        std::vector<std::string> qualifier;
        std::string              name;
    };

    struct Op_ref {
        std::string symbol;
    };

    struct Reference : std::variant<Var_ref, Tag_ref, Op_ref> {
        using variant::variant;
    };

    // Bracketed, comma separated elements.
    template <typename T>
    struct Sequence {
        std::vector<Commented<T>> elements;
        Comments                  inner; // Comments inside an empty sequence.
        Multiline                 multiline {};
    };

    struct Definition {
        Pattern_id                             pattern;
        std::vector<Pre_commented<Pattern_id>> parameters;
        Comments                               equals_comments;
        Expression_id                          body;
    };

    struct Type_annotation {
        Post_commented<Reference> name;
        Pre_commented<Type_id>    type;
    };

    namespace expr {
        struct Variable {
            Reference reference;
        };

        struct Negation {
            Expression_id operand;
        };

        struct Range {
            Commented<Expression_id> low;
            Commented<Expression_id> high;
        };

        struct List {
            Sequence<Expression_id> elements;
        };

        struct Shader {
            std::string source;
        };

        struct Application {
            Expression_id                             head;
            std::vector<Pre_commented<Expression_id>> arguments;
            Application_layout                        layout;
        };

        struct Binops_clause {
            Comments           before_operator;
            Located<Reference> op;
            Comments           after_operator;
            Expression_id      operand;
        };

        // Operator chain with unresolved precedence.
        struct Binops {
            Expression_id              operand;
            std::vector<Binops_clause> clauses;
            Multiline                  multiline {};
        };

        struct If_clause {
            Commented<Expression_id> condition;
            Commented<Expression_id> body;
        };

        struct If {
            If_clause                             first;
            std::vector<Pre_commented<If_clause>> rest;
            Pre_commented<Expression_id>          otherwise;
        };

        struct Case_branch {
            Comments      before_pattern;
            Pattern_id    pattern;
            Comments      before_arrow;
            Comments      after_arrow;
            Expression_id body;
            utl::Range    range;
        };

        struct Case {
            Commented<Expression_id> subject;
            bool                     multiline_subject {};
            std::vector<Case_branch> branches;
        };

        // A comment between let declarations.
        struct Let_comment {
            lex::Comment comment;
        };

        struct Let_declaration_variant : std::variant<Definition, Type_annotation, Let_comment> {
            using variant::variant;
        };

        struct Let_declaration {
            Let_declaration_variant variant;
            utl::Range              range;
        };

        struct Let {
            std::vector<Let_declaration> declarations;
            Comments                     before_body;
            Expression_id                body;
        };

        struct Lambda {
            std::vector<Pre_commented<Pattern_id>> parameters;
            Comments                               arrow_comments;
            Expression_id                          body;
            bool                                   multiline {};
        };

        struct Tuple {
            std::vector<Commented<Expression_id>> elements;
            Multiline                             multiline {};
        };

        struct Parenthesized {
            Commented<Expression_id> expression;
        };

        struct Unit {
            Comments comments;
        };

        struct Record_field {
            Located<std::string> name;
            Comments             before_equals;
            Comments             after_equals;
            Expression_id        value;
        };

        struct Record {
            std::optional<Commented<Located<std::string>>> base;
            Sequence<Record_field>                         fields;
        };

        struct Access {
            Expression_id        record;
            Located<std::string> field;
        };

        struct Access_function {
            std::string field;
        };

        struct Tuple_function {
            std::size_t arity {};
        };
    } // namespace expr

    struct Expression_variant
        : std::variant<
              lex::Literal,
              expr::Variable,
              expr::Negation,
              expr::Range,
              expr::List,
              expr::Shader,
              expr::Application,
              expr::Binops,
              expr::If,
              expr::Case,
              expr::Let,
              expr::Lambda,
              expr::Tuple,
              expr::Parenthesized,
              expr::Unit,
              expr::Record,
              expr::Access,
              expr::Access_function,
              expr::Tuple_function> {
        using variant::variant;
    };

    struct Expression {
        Expression_variant variant;
        utl::Range         range;
    };

    namespace patt {
        struct Wildcard {};

        struct Variable {
            std::string name;
        };

        struct Literal {
            lex::Literal literal;
            bool         negated {};
        };

        // Parenthesized operator, as in `(+)`.
        struct Operator {
            std::string symbol;
        };

        struct Tag {
            Tag_ref                                reference;
            std::vector<Pre_commented<Pattern_id>> arguments;
        };

        struct Unit {
            Comments comments;
        };

        struct Parenthesized {
            Commented<Pattern_id> pattern;
        };

        struct Tuple {
            std::vector<Commented<Pattern_id>> elements;
        };

        struct List {
            Sequence<Pattern_id> elements;
        };

        struct Record {
            Sequence<std::string> fields;
        };

        struct Cons_clause {
            Comments   before_operator;
            Comments   after_operator;
            Pattern_id pattern;
        };

        struct Cons {
            Pattern_id               head;
            std::vector<Cons_clause> tail;
        };

        struct Alias {
            Post_commented<Pattern_id> pattern;
            Pre_commented<std::string> name;
        };
    } // namespace patt

    struct Pattern_variant
        : std::variant<
              patt::Wildcard,
              patt::Variable,
              patt::Literal,
              patt::Operator,
              patt::Tag,
              patt::Unit,
              patt::Parenthesized,
              patt::Tuple,
              patt::List,
              patt::Record,
              patt::Cons,
              patt::Alias> {
        using variant::variant;
    };

    struct Pattern {
        Pattern_variant variant;
        utl::Range      range;
    };

    namespace type {
        struct Variable {
            std::string name;
        };

        struct Constructor {
            Tag_ref                             reference;
            std::vector<Pre_commented<Type_id>> arguments;
        };

        struct Unit {
            Comments comments;
        };

        struct Parenthesized {
            Commented<Type_id> type;
        };

        struct Tuple {
            std::vector<Commented<Type_id>> elements;
            Multiline                       multiline {};
        };

        struct Record_field {
            Located<std::string> name;
            Comments             before_colon;
            Comments             after_colon;
            Type_id              type;
        };

        struct Record {
            std::optional<Commented<Located<std::string>>> base;
            Sequence<Record_field>                         fields;
        };

        struct Function_clause {
            Comments before_arrow;
            Comments after_arrow;
            Type_id  type;
        };

        // Function type chain, as in `a -> b -> c`.
        struct Function {
            Type_id                      first;
            std::vector<Function_clause> rest;
            Multiline                    multiline {};
        };
    } // namespace type

    struct Type_variant
        : std::variant<
              type::Variable,
              type::Constructor,
              type::Unit,
              type::Parenthesized,
              type::Tuple,
              type::Record,
              type::Function> {
        using variant::variant;
    };

    struct Type {
        Type_variant variant;
        utl::Range   range;
    };

    struct Declaration_variant : std::variant<Definition, Type_annotation, lex::Comment> {
        using variant::variant;
    };

    struct Declaration {
        Declaration_variant variant;
        utl::Range          range;
    };

    struct Module {
        std::vector<Declaration> declarations;
    };

    struct Arena {
        utl::Index_vector<Expression_id, Expression> expressions;
        utl::Index_vector<Pattern_id, Pattern>       patterns;
        utl::Index_vector<Type_id, Type>             types;
    };

    // Render `reference` the way it is written in source code.
    [[nodiscard]] auto reference_string(Reference const& reference) -> std::string;

} // namespace knit::ast

#undef DEFINE_INDEX

#endif // KNIT_LIBPARSE_AST
