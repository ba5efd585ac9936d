#ifndef KNIT_LIBUTL_SOURCE
#define KNIT_LIBUTL_SOURCE

#include <libutl/utilities.hpp>

namespace knit::utl {

    // Zero-based source position.
    struct Position {
        std::uint32_t line {};
        std::uint32_t column {};

        auto operator==(Position const&) const -> bool                  = default;
        auto operator<=>(Position const&) const -> std::strong_ordering = default;
    };

    struct Range {
        Position start; // Inclusive
        Position stop;  // Exclusive

        // Deliberately non-aggregate.
        explicit constexpr Range(Position start, Position stop) noexcept
            : start { start }
            , stop { stop }
        {}

        auto operator==(Range const&) const -> bool                  = default;
        auto operator<=>(Range const&) const -> std::strong_ordering = default;
    };

    enum struct Severity : std::uint8_t { Error, Warning, Information };

    struct Diagnostic {
        std::string message;
        Range       range;
        Severity    severity {};
    };

    enum struct Read_error : std::uint8_t { Does_not_exist, Failed_to_open, Failed_to_read };

    // Advance `position` with `character`.
    [[nodiscard]] auto advance(Position position, char character) noexcept -> Position;

    // Create a zero-width range for `position`.
    [[nodiscard]] auto to_range(Position position) noexcept -> Range;

    // Capitalized severity description.
    [[nodiscard]] auto severity_string(Severity severity) -> std::string_view;

    // Describe a file read failure.
    [[nodiscard]] auto describe_read_error(Read_error error) -> std::string_view;

    // Render `diagnostic` with the relevant line of `source` and a caret under the range.
    [[nodiscard]] auto format_diagnostic(std::string_view source, Diagnostic const& diagnostic)
        -> std::string;

    auto read_file(std::filesystem::path const& path) -> std::expected<std::string, Read_error>;

} // namespace knit::utl

template <>
struct std::formatter<knit::utl::Position> {
    static constexpr auto parse(auto& ctx)
    {
        return ctx.begin();
    }

    static auto format(knit::utl::Position const position, auto& ctx)
    {
        return std::format_to(ctx.out(), "{}:{}", position.line + 1, position.column + 1);
    }
};

template <>
struct std::formatter<knit::utl::Range> {
    static constexpr auto parse(auto& ctx)
    {
        return ctx.begin();
    }

    static auto format(knit::utl::Range const range, auto& ctx)
    {
        return std::format_to(ctx.out(), "({}-{})", range.start, range.stop);
    }
};

#endif // KNIT_LIBUTL_SOURCE
