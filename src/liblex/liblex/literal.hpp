#ifndef KNIT_LIBLEX_LITERAL
#define KNIT_LIBLEX_LITERAL

#include <libutl/utilities.hpp>

namespace knit::lex {

    enum struct Integer_representation : std::uint8_t { Decimal, Hexadecimal };
    enum struct Floating_representation : std::uint8_t { Decimal, Exponent };
    enum struct String_representation : std::uint8_t { Single_quoted, Triple_quoted };

    struct Integer {
        std::uint64_t          value {};
        Integer_representation representation {};

        auto operator==(Integer const&) const -> bool = default;
    };

    struct Floating {
        double                  value {};
        Floating_representation representation {};

        auto operator==(Floating const&) const -> bool = default;
    };

    // UTF-8 encoded code point.
    struct Character {
        std::string value;

        auto operator==(Character const&) const -> bool = default;
    };

    struct String {
        std::string           value;
        String_representation representation {};

        auto operator==(String const&) const -> bool = default;
    };

    struct Boolean {
        bool value {};

        auto operator==(Boolean const&) const -> bool = default;
    };

    struct Literal : std::variant<Integer, Floating, Character, String, Boolean> {
        using variant::variant;
    };

} // namespace knit::lex

template <>
struct std::formatter<knit::lex::Literal> {
    static constexpr auto parse(auto& ctx)
    {
        return ctx.begin();
    }

    static auto format(knit::lex::Literal const& literal, auto& ctx)
    {
        using namespace knit;
        auto const visitor = utl::Overload {
            [&](lex::Integer const& integer) {
                return integer.representation == lex::Integer_representation::Hexadecimal
                         ? std::format_to(ctx.out(), "0x{:X}", integer.value)
                         : std::format_to(ctx.out(), "{}", integer.value);
            },
            [&](lex::Floating const& floating) {
                return std::format_to(ctx.out(), "{}", floating.value);
            },
            [&](lex::Character const& character) {
                return std::format_to(ctx.out(), "'{}'", utl::escape(character.value));
            },
            [&](lex::String const& string) {
                return string.representation == lex::String_representation::Triple_quoted
                         ? std::format_to(ctx.out(), "\"\"\"{}\"\"\"", utl::escape(string.value))
                         : std::format_to(ctx.out(), "\"{}\"", utl::escape(string.value));
            },
            [&](lex::Boolean const& boolean) {
                return std::format_to(ctx.out(), "{}", boolean.value ? "True" : "False");
            },
        };
        return std::visit(visitor, static_cast<knit::lex::Literal::variant const&>(literal));
    }
};

#endif // KNIT_LIBLEX_LITERAL
