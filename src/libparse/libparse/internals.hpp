#ifndef KNIT_LIBPARSE_INTERNALS
#define KNIT_LIBPARSE_INTERNALS

#include <libutl/utilities.hpp>
#include <liblex/lex.hpp>
#include <libparse/ast.hpp>
#include <libparse/parse.hpp>

namespace knit::par {

    struct Failure : std::exception {
        utl::Position position;
        std::string   message;

        Failure(utl::Position position, std::string message);

        [[nodiscard]] auto what() const noexcept -> char const* override;
    };

    struct Context {
        Configuration              config;
        ast::Arena                 arena;
        lex::State                 state;
        std::vector<std::uint32_t> indentation;
        std::size_t                depth {};
    };

    // Everything a rewound trial parse has to restore.
    struct Snapshot {
        lex::State                 state;
        std::vector<std::uint32_t> indentation;
        std::size_t                expressions {};
        std::size_t                patterns {};
        std::size_t                types {};
    };

    // Create a parse context.
    [[nodiscard]] auto context(std::string_view source, Configuration const& config) -> Context;

    [[nodiscard]] auto snapshot(Context const& ctx) -> Snapshot;

    void restore(Context& ctx, Snapshot const& snapshot);

    template <typename... Args>
    void debug(Context const& ctx, std::format_string<Args...> const fmt, Args&&... args)
    {
        if (ctx.config.log_level == Log_level::Debug) {
            std::println(std::cerr, "[debug] {}", std::format(fmt, std::forward<Args>(args)...));
        }
    }

    // Throw a failure that describes an expectation failure:
    // Encountered the current character where `description` was expected.
    [[noreturn]] void error_expected(Context& ctx, std::string_view description);

    // Throw a failure that describes a lexical error.
    [[noreturn]] void error_lexical(lex::Error const& error);

    // Source range from `start` up to the current position.
    [[nodiscard]] auto up_to_current(Context const& ctx, utl::Position start) -> utl::Range;

    // Consume whitespace and comments.
    [[nodiscard]] auto extract_trivia(Context& ctx) -> lex::Trivia;

    // Consume whitespace and comments, and return the comments.
    [[nodiscard]] auto whitespace(Context& ctx) -> ast::Comments;

    // Consume `keyword` if it is the next word.
    [[nodiscard]] auto try_keyword(Context& ctx, std::string_view keyword) -> bool;

    // Consume `symbol` if it is not part of a longer operator.
    [[nodiscard]] auto try_symbol(Context& ctx, std::string_view symbol) -> bool;

    void require_keyword(Context& ctx, std::string_view keyword, std::string_view description);
    void require_symbol(Context& ctx, std::string_view symbol, std::string_view description);
    void require_character(Context& ctx, char character, std::string_view description);

    // Comments on both sides of a delimiter.
    struct Padding {
        ast::Comments before;
        ast::Comments after;
    };

    // Whitespace, the symbol `symbol`, then whitespace.
    [[nodiscard]] auto padded_symbol(
        Context& ctx, std::string_view symbol, std::string_view description) -> Padding;

    // Whitespace, the keyword `keyword`, then whitespace.
    [[nodiscard]] auto padded_keyword(
        Context& ctx, std::string_view keyword, std::string_view description) -> Padding;

    // One level of expression, pattern, or type nesting. Beyond `max_depth`, construction
    // throws a failure labelled `description`.
    struct Depth_guard {
        Depth_guard(Context& ctx, std::string_view description);
        Depth_guard(Depth_guard const&)                    = delete;
        auto operator=(Depth_guard const&) -> Depth_guard& = delete;
        ~Depth_guard();

        std::size_t& depth;
    };

    [[nodiscard]] auto current_column(Context const& ctx) noexcept -> std::uint32_t;

    // Check whether the current column is exactly the innermost reference column.
    [[nodiscard]] auto check_indent(Context const& ctx) -> bool;

    // Check whether the current column is beyond the innermost reference column.
    [[nodiscard]] auto is_indented(Context const& ctx) -> bool;

    [[nodiscard]] auto multiline_since(Context const& ctx, std::uint32_t newlines) noexcept
        -> ast::Multiline;

    // Run `parser` with the current column as the innermost reference column.
    template <std::invocable F>
    auto with_position(Context& ctx, F const& parser) -> std::invoke_result_t<F>
    {
        ctx.indentation.push_back(current_column(ctx));
        struct Pop {
            Context& ctx;
            std::size_t size;
            ~Pop()
            {
                ctx.indentation.resize(size - 1);
            }
        } const pop { ctx, ctx.indentation.size() };
        return parser();
    }

    // Run `parser` and report whether it crossed a newline.
    template <std::invocable F>
    auto track_newline(Context& ctx, F const& parser)
        -> std::pair<std::invoke_result_t<F>, ast::Multiline>
    {
        auto const newlines = ctx.state.newlines;
        auto       result   = parser();
        return { std::move(result), multiline_since(ctx, newlines) };
    }

    // Run `parser` as a trial. If it fails or produces nothing, the context is restored
    // to the state it was in before the trial and nothing is returned.
    template <std::invocable F>
    auto attempt(Context& ctx, F const& parser) -> std::invoke_result_t<F>
    {
        auto const saved = snapshot(ctx);
        try {
            if (auto result = parser()) {
                return result;
            }
            restore(ctx, saved);
            return std::nullopt;
        }
        catch (Failure const& failure) {
            debug(ctx, "Rewinding trial at {}: {}", saved.state.position, failure.message);
            restore(ctx, saved);
            return std::nullopt;
        }
    }

    // Check whether `parser` would succeed here, without consuming anything.
    template <std::invocable F>
    auto followed_by(Context& ctx, F const& parser) -> bool
    {
        auto const saved = snapshot(ctx);
        try {
            bool const result = parser();
            restore(ctx, saved);
            return result;
        }
        catch (Failure const&) {
            restore(ctx, saved);
            return false;
        }
    }

    template <std::invocable<Context&> auto parser>
    auto require(Context& ctx, std::string_view const description)
        -> decltype(parser(ctx))::value_type
    {
        if (auto result = parser(ctx)) {
            return std::move(result).value();
        }
        error_expected(ctx, description);
    }

    template <std::invocable<Context&> auto parser, utl::Metastring description>
    auto require(Context& ctx) -> decltype(parser(ctx))::value_type
    {
        return require<parser>(ctx, description.view());
    }

    // How an item may follow the one before it in a space separated sequence.
    enum struct Spacing : std::uint8_t {
        Any,
        Not_adjacent_minus, // Without whitespace in between, the item may not begin with '-'.
    };

    template <typename T>
    struct Spaced {
        ast::Pre_commented<T> item;
        ast::Multiline        multiline {};
    };

    // Zero or more items, each preceded by whitespace and beyond the innermost reference column.
    template <std::invocable<Context&> auto parser>
    auto extract_space_prefixed(Context& ctx, Spacing const spacing)
        -> std::vector<Spaced<typename decltype(parser(ctx))::value_type>>
    {
        using T = decltype(parser(ctx))::value_type;
        std::vector<Spaced<T>> items;
        for (;;) {
            auto [item, multiline] = track_newline(ctx, [&] {
                return attempt(ctx, [&]() -> std::optional<ast::Pre_commented<T>> {
                    auto trivia = extract_trivia(ctx);
                    if (spacing == Spacing::Not_adjacent_minus and not trivia.consumed
                        and lex::current(ctx.state) == '-')
                    {
                        return std::nullopt;
                    }
                    if (not is_indented(ctx)) {
                        return std::nullopt;
                    }
                    return parser(ctx).transform([&](T value) {
                        return ast::Pre_commented<T> {
                            .before = std::move(trivia.comments),
                            .value  = std::move(value),
                        };
                    });
                });
            });
            if (not item.has_value()) {
                return items;
            }
            items.push_back(Spaced<T> { .item = std::move(item).value(), .multiline = multiline });
        }
    }

    // The remaining elements of a bracketed comma separated sequence, and the closing bracket.
    template <std::invocable<Context&> auto parser, utl::Metastring description, typename T>
    void extract_sequence_tail(
        Context& ctx, ast::Sequence<T>& sequence, char const close, std::uint32_t const newlines)
    {
        while (lex::try_consume(ctx.state, ',')) {
            auto before  = whitespace(ctx);
            auto element = require<parser>(ctx, description.view());
            sequence.elements.push_back(ast::Commented<T> {
                .before = std::move(before),
                .value  = std::move(element),
                .after  = whitespace(ctx),
            });
        }
        sequence.multiline = multiline_since(ctx, newlines);
        require_character(ctx, close, std::format("a ',' or a '{}'", close));
    }

    // Bracketed comma separated elements. The opening bracket has been consumed.
    template <std::invocable<Context&> auto parser, utl::Metastring description>
    auto extract_sequence(Context& ctx, char const close)
        -> ast::Sequence<typename decltype(parser(ctx))::value_type>
    {
        using T = decltype(parser(ctx))::value_type;
        ast::Sequence<T> sequence;
        auto const newlines = ctx.state.newlines;
        auto       before   = whitespace(ctx);
        if (auto first = parser(ctx)) {
            sequence.elements.push_back(ast::Commented<T> {
                .before = std::move(before),
                .value  = std::move(first).value(),
                .after  = whitespace(ctx),
            });
            extract_sequence_tail<parser, description>(ctx, sequence, close, newlines);
        }
        else {
            sequence.inner     = std::move(before);
            sequence.multiline = multiline_since(ctx, newlines);
            require_character(ctx, close, std::format("{} or a '{}'", description.view(), close));
        }
        return sequence;
    }

    auto parse_lower_name(Context& ctx) -> std::optional<std::string>;
    auto parse_located_lower_name(Context& ctx) -> std::optional<ast::Located<std::string>>;

    // Parenthesized symbolic operator, as in `(+)`.
    auto parse_parenthesized_operator(Context& ctx) -> std::optional<std::string>;

    // Symbolic operator or backtick quoted function name.
    auto parse_operator(Context& ctx) -> std::optional<ast::Located<ast::Reference>>;

    // Numeric, character, or string literal.
    auto parse_literal(Context& ctx) -> std::optional<lex::Literal>;

    auto parse_term(Context& ctx) -> std::optional<ast::Expression_id>;
    auto parse_application(Context& ctx) -> std::optional<ast::Expression_id>;
    auto parse_expression(Context& ctx) -> std::optional<ast::Expression_id>;

    // Expressions that may only appear as the last operand of an operator chain.
    auto parse_control_flow(Context& ctx) -> std::optional<ast::Expression_id>;

    auto parse_pattern_term(Context& ctx) -> std::optional<ast::Pattern_id>;
    auto parse_pattern(Context& ctx) -> std::optional<ast::Pattern_id>;

    auto parse_type_term(Context& ctx) -> std::optional<ast::Type_id>;
    auto parse_type(Context& ctx) -> std::optional<ast::Type_id>;

    // `name args = body`, where arguments are only accepted after a variable or operator.
    auto parse_plain_definition(Context& ctx) -> std::optional<ast::Definition>;

    // `name : type`, where the name is a lowercase name or a parenthesized operator.
    auto parse_plain_type_annotation(Context& ctx) -> std::optional<ast::Type_annotation>;

    // Parse a definition and wrap it with `make`, which receives the definition and its range.
    template <std::invocable<ast::Definition, utl::Range> Make>
    auto parse_definition(Context& ctx, Make const& make)
        -> std::optional<std::invoke_result_t<Make, ast::Definition, utl::Range>>
    {
        auto const start = ctx.state.position;
        return parse_plain_definition(ctx).transform([&](ast::Definition&& definition) {
            return make(std::move(definition), up_to_current(ctx, start));
        });
    }

    // Parse a type annotation and wrap it with `make`, which receives the annotation and its range.
    template <std::invocable<ast::Type_annotation, utl::Range> Make>
    auto parse_type_annotation(Context& ctx, Make const& make)
        -> std::optional<std::invoke_result_t<Make, ast::Type_annotation, utl::Range>>
    {
        auto const start = ctx.state.position;
        return parse_plain_type_annotation(ctx).transform([&](ast::Type_annotation&& annotation) {
            return make(std::move(annotation), up_to_current(ctx, start));
        });
    }

    auto parse_module(Context& ctx) -> ast::Module;

} // namespace knit::par

#endif // KNIT_LIBPARSE_INTERNALS
