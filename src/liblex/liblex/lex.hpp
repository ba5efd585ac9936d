#ifndef KNIT_LIBLEX_LEX
#define KNIT_LIBLEX_LEX

#include <libutl/utilities.hpp>
#include <libutl/source.hpp>
#include <liblex/literal.hpp>

namespace knit::lex {

    // Character cursor over the source text. Copying a state is how the parser
    // saves a position it may have to return to.
    struct State {
        utl::Position    position;
        std::uint32_t    offset {};
        std::string_view text;
        std::uint32_t    newlines {}; // Newlines consumed as whitespace so far.
    };

    struct Error {
        utl::Position position;
        std::string   message;
    };

    template <typename T>
    using Expected = std::expected<T, Error>;

    enum struct Comment_kind : std::uint8_t { Line, Block, Documentation };

    struct Comment {
        std::string  text;
        utl::Range   range;
        Comment_kind kind {};

        auto operator==(Comment const&) const -> bool = default;
    };

    // Whitespace and comments between two tokens.
    struct Trivia {
        std::vector<Comment> comments;
        bool                 consumed {};
    };

    // Possibly qualified reference such as `List.map` or `Maybe.Just`.
    struct Qualified_name {
        std::vector<std::string> qualifier;
        std::string              name;
        bool                     is_upper {};
    };

    // Construct a lexical analysis state.
    [[nodiscard]] auto state(std::string_view text) -> State;

    [[nodiscard]] auto is_finished(State const& state) noexcept -> bool;

    // The current character, or the null character at the end of input.
    [[nodiscard]] auto current(State const& state) noexcept -> char;

    // The character `distance` characters ahead, or the null character past the end of input.
    [[nodiscard]] auto lookahead(State const& state, std::size_t distance) noexcept -> char;

    // The unconsumed part of the source text.
    [[nodiscard]] auto remaining(State const& state) noexcept -> std::string_view;

    void advance(State& state, std::size_t distance = 1);

    [[nodiscard]] auto try_consume(State& state, char character) -> bool;
    [[nodiscard]] auto try_consume(State& state, std::string_view string) -> bool;

    // Consume `keyword` if it is not immediately followed by a name character.
    [[nodiscard]] auto try_consume_keyword(State& state, std::string_view keyword) -> bool;

    [[nodiscard]] auto is_reserved(std::string_view name) noexcept -> bool;
    [[nodiscard]] auto is_name_character(char character) noexcept -> bool;
    [[nodiscard]] auto is_symbol_character(char character) noexcept -> bool;

    // Consume whitespace and comments.
    [[nodiscard]] auto skip_trivia(State& state) -> Expected<Trivia>;

    // Extract an unqualified lowercase name that is not a reserved word.
    [[nodiscard]] auto extract_lower_name(State& state) -> std::optional<std::string>;

    // Extract an unqualified uppercase name.
    [[nodiscard]] auto extract_upper_name(State& state) -> std::optional<std::string>;

    // Extract a possibly qualified lowercase or uppercase name.
    [[nodiscard]] auto extract_qualified_name(State& state) -> std::optional<Qualified_name>;

    // Extract a symbolic operator that is not a reserved symbol.
    [[nodiscard]] auto extract_operator(State& state) -> std::optional<std::string>;

    // Check whether a literal begins at the current position.
    [[nodiscard]] auto starts_literal(State const& state) noexcept -> bool;

    // Extract a numeric, character, or string literal. Requires `starts_literal(state)`.
    [[nodiscard]] auto extract_literal(State& state) -> Expected<Literal>;

    // Check whether a shader block begins at the current position.
    [[nodiscard]] auto starts_shader(State const& state) noexcept -> bool;

    // Extract the raw source of a shader block. Requires `starts_shader(state)`.
    [[nodiscard]] auto extract_shader(State& state) -> Expected<std::string>;

    // Describe the current character for an error message.
    [[nodiscard]] auto describe_current(State const& state) -> std::string;

} // namespace knit::lex

#endif // KNIT_LIBLEX_LEX
