#include <libutl/utilities.hpp>
#include <liblex/lex.hpp>

using namespace knit;
using namespace knit::lex;

namespace {

    constexpr auto is_digit(char const c) noexcept -> bool
    {
        return '0' <= c and c <= '9';
    }

    constexpr auto is_hex_digit(char const c) noexcept -> bool
    {
        return is_digit(c) or ('a' <= c and c <= 'f') or ('A' <= c and c <= 'F');
    }

    auto error(utl::Position const position, std::string message) -> std::unexpected<Error>
    {
        return std::unexpected(Error { position, std::move(message) });
    }

    auto extract_digits(State& state, auto const& predicate) -> std::string_view
    {
        auto const offset = state.offset;
        while (predicate(current(state))) {
            advance(state);
        }
        return state.text.substr(offset, state.offset - offset);
    }

    template <class T>
    auto parse_impl(std::string_view const string, std::same_as<int> auto const... base)
        -> std::optional<T>
    {
        char const* const begin = string.data();
        char const* const end   = begin + string.size();
        cpputil::always_assert(begin != end);

        T value {};
        auto const [ptr, ec] = std::from_chars(begin, end, value, base...);
        if (ptr != end or ec != std::errc {}) {
            return std::nullopt;
        }
        return value;
    }

    auto extract_number(State& state) -> Expected<Literal>
    {
        auto const start  = state.position;
        auto const offset = state.offset;

        if (current(state) == '0' and (lookahead(state, 1) == 'x' or lookahead(state, 1) == 'X')) {
            advance(state, 2);
            auto const digits = extract_digits(state, is_hex_digit);
            if (digits.empty()) {
                return error(state.position, "Expected a hexadecimal digit");
            }
            if (auto const value = parse_impl<std::uint64_t>(digits, 16)) {
                return Integer { *value, Integer_representation::Hexadecimal };
            }
            return error(start, "Hexadecimal literal is too large");
        }

        std::ignore = extract_digits(state, is_digit);

        bool floating = false;
        bool exponent = false;
        if (current(state) == '.' and is_digit(lookahead(state, 1))) {
            floating = true;
            advance(state);
            std::ignore = extract_digits(state, is_digit);
        }
        if (current(state) == 'e' or current(state) == 'E') {
            auto const sign = lookahead(state, 1) == '+' or lookahead(state, 1) == '-';
            if (is_digit(lookahead(state, sign ? 2 : 1))) {
                floating = exponent = true;
                advance(state, sign ? 2 : 1);
                std::ignore = extract_digits(state, is_digit);
            }
        }
        if (is_name_character(current(state))) {
            return error(state.position, "Unexpected character after numeric literal");
        }

        auto const text = state.text.substr(offset, state.offset - offset);
        if (floating) {
            if (auto const value = parse_impl<double>(text)) {
                return Floating {
                    *value,
                    exponent ? Floating_representation::Exponent : Floating_representation::Decimal,
                };
            }
            return error(start, "Floating point literal is out of range");
        }
        if (auto const value = parse_impl<std::uint64_t>(text, 10)) {
            return Integer { *value, Integer_representation::Decimal };
        }
        return error(start, "Integer literal is too large");
    }

    void encode_utf8(std::string& output, char32_t const code_point)
    {
        if (code_point < 0x80) {
            output.push_back(static_cast<char>(code_point));
        }
        else if (code_point < 0x800) {
            output.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
            output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        }
        else if (code_point < 0x10000) {
            output.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
            output.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        }
        else {
            output.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
            output.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
            output.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        }
    }

    // Append the character denoted by the escape sequence at the current position.
    auto extract_escape(State& state, std::string& output) -> Expected<void>
    {
        auto const start = state.position;
        advance(state); // backslash
        switch (current(state)) {
        case 'n':  output.push_back('\n'); break;
        case 'r':  output.push_back('\r'); break;
        case 't':  output.push_back('\t'); break;
        case '"':  output.push_back('"'); break;
        case '\'': output.push_back('\''); break;
        case '\\': output.push_back('\\'); break;
        case 'u':
        {
            advance(state);
            if (not try_consume(state, '{')) {
                return error(state.position, "Expected '{' after \\u");
            }
            auto const digits = extract_digits(state, is_hex_digit);
            if (digits.empty() or digits.size() > 6) {
                return error(start, "Invalid unicode escape sequence");
            }
            auto const code_point = parse_impl<std::uint32_t>(digits, 16);
            if (not code_point.has_value() or *code_point > 0x10FFFF) {
                return error(start, "Invalid unicode code point");
            }
            if (current(state) != '}') {
                return error(state.position, "Expected '}' to close the unicode escape sequence");
            }
            encode_utf8(output, static_cast<char32_t>(*code_point));
            break;
        }
        default:
            return error(start, "Unrecognized escape sequence");
        }
        advance(state);
        return {};
    }

    // Append one possibly multibyte UTF-8 sequence.
    void extract_code_unit_sequence(State& state, std::string& output)
    {
        auto const lead = static_cast<unsigned char>(current(state));
        std::size_t length = 1;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
        }
        else if ((lead & 0xF0) == 0xE0) {
            length = 3;
        }
        else if ((lead & 0xF8) == 0xF0) {
            length = 4;
        }
        length = std::min(length, remaining(state).size());
        output.append(remaining(state).substr(0, length));
        advance(state, length);
    }

    auto extract_character(State& state) -> Expected<Literal>
    {
        auto const start = state.position;
        advance(state); // opening quote
        std::string value;
        if (is_finished(state) or current(state) == '\n') {
            return error(start, "Unterminated character literal");
        }
        if (current(state) == '\'') {
            return error(start, "Empty character literal");
        }
        if (current(state) == '\\') {
            if (auto result = extract_escape(state, value); not result.has_value()) {
                return std::unexpected(std::move(result).error());
            }
        }
        else {
            extract_code_unit_sequence(state, value);
        }
        if (not try_consume(state, '\'')) {
            return error(start, "Expected a closing ' for the character literal");
        }
        return Character { std::move(value) };
    }

    auto extract_string(State& state) -> Expected<Literal>
    {
        auto const start  = state.position;
        auto const triple = remaining(state).starts_with(R"(""")");
        advance(state, triple ? 3 : 1);

        std::string value;
        for (;;) {
            if (is_finished(state) or (not triple and current(state) == '\n')) {
                return error(start, "Unterminated string literal");
            }
            if (triple ? try_consume(state, R"(""")") : try_consume(state, '"')) {
                break;
            }
            if (current(state) == '\\') {
                if (auto result = extract_escape(state, value); not result.has_value()) {
                    return std::unexpected(std::move(result).error());
                }
            }
            else {
                extract_code_unit_sequence(state, value);
            }
        }
        return String {
            std::move(value),
            triple ? String_representation::Triple_quoted : String_representation::Single_quoted,
        };
    }

} // namespace

auto knit::lex::starts_literal(State const& state) noexcept -> bool
{
    char const c = current(state);
    return is_digit(c) or c == '\'' or c == '"';
}

auto knit::lex::extract_literal(State& state) -> Expected<Literal>
{
    switch (current(state)) {
    case '\'': return extract_character(state);
    case '"':  return extract_string(state);
    default:
        cpputil::always_assert(is_digit(current(state)));
        return extract_number(state);
    }
}

auto knit::lex::starts_shader(State const& state) noexcept -> bool
{
    return remaining(state).starts_with("[glsl|");
}

auto knit::lex::extract_shader(State& state) -> Expected<std::string>
{
    cpputil::always_assert(starts_shader(state));
    auto const start = state.position;
    advance(state, 6);

    std::string source;
    for (;;) {
        if (is_finished(state)) {
            return error(start, "Unterminated shader block");
        }
        if (try_consume(state, "|]")) {
            return source;
        }
        if (current(state) != '\r') {
            source.push_back(current(state));
        }
        advance(state);
    }
}
