#include <libutl/utilities.hpp>
#include <liblex/lex.hpp>

using namespace knit;
using namespace knit::lex;

namespace {

    constexpr auto reserved_words = std::to_array<std::string_view>({
        "if",
        "then",
        "else",
        "case",
        "of",
        "let",
        "in",
        "type",
        "module",
        "where",
        "import",
        "exposing",
        "as",
        "port",
        "infix",
    });

    constexpr auto reserved_symbols = std::to_array<std::string_view>({
        "=",
        "..",
        "->",
        "--",
        "|",
        ":",
    });

    template <utl::Metastring string>
    constexpr auto is_one_of(char const c) noexcept -> bool
    {
        return string.view().contains(c);
    }

    template <char a, char b>
    constexpr auto is_in_range(char const c) noexcept -> bool
        requires(a < b)
    {
        return a <= c and c <= b;
    }

    template <std::predicate<char> auto... predicates>
    constexpr auto satisfies_one_of(char const c) noexcept -> bool
    {
        return (predicates(c) or ...);
    }

    constexpr auto is_space     = is_one_of<" \t\r">;
    constexpr auto is_lowercase = is_in_range<'a', 'z'>;
    constexpr auto is_uppercase = is_in_range<'A', 'Z'>;
    constexpr auto is_digit     = is_in_range<'0', '9'>;
    constexpr auto is_name      = satisfies_one_of<is_lowercase, is_uppercase, is_digit, is_one_of<"_">>;
    constexpr auto is_symbol    = is_one_of<"+-/*=.$<>:&|^?%#@~!">;

    void consume(State& state, std::predicate<char> auto const& predicate)
    {
        while (not is_finished(state) and predicate(current(state))) {
            advance(state);
        }
    }

    auto extract(State& state, std::predicate<char> auto const& predicate) -> std::string_view
    {
        auto const offset = state.offset;
        consume(state, predicate);
        return state.text.substr(offset, state.offset - offset);
    }

    auto extract_line_comment(State& state) -> Comment
    {
        auto const start = state.position;
        advance(state, 2);
        auto const text = extract(state, [](char c) { return c != '\n'; });
        return Comment {
            .text  = std::string(text),
            .range = utl::Range(start, state.position),
            .kind  = Comment_kind::Line,
        };
    }

    auto extract_block_comment(State& state) -> Expected<Comment>
    {
        auto const start = state.position;
        advance(state, 2);
        auto const kind = try_consume(state, '|') ? Comment_kind::Documentation : Comment_kind::Block;
        auto const text_offset = state.offset;
        for (std::size_t depth = 1;;) {
            if (is_finished(state)) [[unlikely]] {
                return std::unexpected(Error { start, "Unterminated block comment" });
            }
            if (remaining(state).starts_with("-}")) {
                if (--depth == 0) {
                    break;
                }
                advance(state, 2);
            }
            else if (remaining(state).starts_with("{-")) {
                ++depth;
                advance(state, 2);
            }
            else {
                advance(state);
            }
        }
        auto const text = state.text.substr(text_offset, state.offset - text_offset);
        advance(state, 2);
        return Comment {
            .text  = std::string(text),
            .range = utl::Range(start, state.position),
            .kind  = kind,
        };
    }

    auto extract_name_segment(State& state) -> std::string_view
    {
        return extract(state, is_name);
    }

} // namespace

auto knit::lex::state(std::string_view const text) -> State
{
    return State { .position = {}, .offset = 0, .text = text, .newlines = 0 };
}

auto knit::lex::is_finished(State const& state) noexcept -> bool
{
    return state.offset == state.text.size();
}

auto knit::lex::current(State const& state) noexcept -> char
{
    return lookahead(state, 0);
}

auto knit::lex::lookahead(State const& state, std::size_t const distance) noexcept -> char
{
    auto const offset = state.offset + distance;
    return offset < state.text.size() ? state.text[offset] : '\0';
}

auto knit::lex::remaining(State const& state) noexcept -> std::string_view
{
    return state.text.substr(state.offset);
}

void knit::lex::advance(State& state, std::size_t const distance)
{
    cpputil::always_assert(state.offset + distance <= state.text.size());
    for (std::size_t i = 0; i != distance; ++i) {
        state.position = utl::advance(state.position, state.text[state.offset++]);
    }
}

auto knit::lex::try_consume(State& state, char const character) -> bool
{
    if (not is_finished(state) and current(state) == character) {
        advance(state);
        return true;
    }
    return false;
}

auto knit::lex::try_consume(State& state, std::string_view const string) -> bool
{
    if (remaining(state).starts_with(string)) {
        advance(state, string.size());
        return true;
    }
    return false;
}

auto knit::lex::try_consume_keyword(State& state, std::string_view const keyword) -> bool
{
    if (remaining(state).starts_with(keyword) and not is_name(lookahead(state, keyword.size()))) {
        advance(state, keyword.size());
        return true;
    }
    return false;
}

auto knit::lex::is_reserved(std::string_view const name) noexcept -> bool
{
    return std::ranges::contains(reserved_words, name);
}

auto knit::lex::is_name_character(char const character) noexcept -> bool
{
    return is_name(character);
}

auto knit::lex::is_symbol_character(char const character) noexcept -> bool
{
    return is_symbol(character);
}

auto knit::lex::skip_trivia(State& state) -> Expected<Trivia>
{
    Trivia trivia;
    auto const start_offset = state.offset;
    for (;;) {
        consume(state, is_space);
        if (try_consume(state, '\n')) {
            ++state.newlines;
        }
        else if (remaining(state).starts_with("--")) {
            trivia.comments.push_back(extract_line_comment(state));
        }
        else if (remaining(state).starts_with("{-")) {
            auto comment = extract_block_comment(state);
            if (not comment.has_value()) {
                return std::unexpected(std::move(comment).error());
            }
            trivia.comments.push_back(std::move(comment).value());
        }
        else {
            break;
        }
    }
    trivia.consumed = state.offset != start_offset;
    return trivia;
}

auto knit::lex::extract_lower_name(State& state) -> std::optional<std::string>
{
    if (not is_lowercase(current(state))) {
        return std::nullopt;
    }
    auto const saved = state;
    auto const name  = extract_name_segment(state);
    if (is_reserved(name)) {
        state = saved;
        return std::nullopt;
    }
    return std::string(name);
}

auto knit::lex::extract_upper_name(State& state) -> std::optional<std::string>
{
    if (not is_uppercase(current(state))) {
        return std::nullopt;
    }
    return std::string(extract_name_segment(state));
}

auto knit::lex::extract_qualified_name(State& state) -> std::optional<Qualified_name>
{
    if (auto lower = extract_lower_name(state)) {
        return Qualified_name { .qualifier = {}, .name = std::move(lower).value(), .is_upper = false };
    }
    auto upper = extract_upper_name(state);
    if (not upper.has_value()) {
        return std::nullopt;
    }

    Qualified_name name { .qualifier = {}, .name = std::move(upper).value(), .is_upper = true };

    // A dot directly followed by a name continues the qualified name.
    while (current(state) == '.') {
        auto const saved = state;
        advance(state);
        if (auto segment = extract_upper_name(state)) {
            name.qualifier.push_back(std::exchange(name.name, std::move(segment).value()));
        }
        else if (auto segment = extract_lower_name(state)) {
            name.qualifier.push_back(std::exchange(name.name, std::move(segment).value()));
            name.is_upper = false;
            break;
        }
        else {
            state = saved;
            break;
        }
    }
    return name;
}

auto knit::lex::extract_operator(State& state) -> std::optional<std::string>
{
    auto const saved  = state;
    auto const symbol = extract(state, is_symbol);
    if (symbol.empty()) {
        return std::nullopt;
    }
    if (std::ranges::contains(reserved_symbols, symbol)
        or (symbol == "." and is_lowercase(current(state))))
    {
        state = saved;
        return std::nullopt;
    }
    return std::string(symbol);
}

auto knit::lex::describe_current(State const& state) -> std::string
{
    if (is_finished(state)) {
        return "the end of input";
    }
    switch (char const c = current(state)) {
    case '\n': return "a newline";
    case '\t': return "a tab";
    case ' ':  return "a space";
    default:
        if (is_name(c)) {
            auto copy = state;
            return std::format("'{}'", extract_name_segment(copy));
        }
        return std::format("'{}'", c);
    }
}
