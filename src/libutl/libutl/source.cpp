#include <libutl/utilities.hpp>
#include <libutl/source.hpp>
#include <cpputil/io.hpp>

namespace {
    auto find_line(std::string_view const source, std::uint32_t const line) -> std::string_view
    {
        std::size_t offset = 0;
        for (std::uint32_t i = 0; i != line; ++i) {
            offset = source.find('\n', offset);
            if (offset == std::string_view::npos) {
                return {};
            }
            ++offset;
        }
        auto const newline = source.find('\n', offset);
        return source.substr(offset, newline == std::string_view::npos ? newline : newline - offset);
    }
} // namespace

auto knit::utl::advance(Position position, char const character) noexcept -> Position
{
    if (character == '\n') {
        ++position.line;
        position.column = 0;
    }
    else {
        ++position.column;
    }
    return position;
}

auto knit::utl::to_range(Position const position) noexcept -> Range
{
    return Range(position, position);
}

auto knit::utl::severity_string(Severity const severity) -> std::string_view
{
    switch (severity) {
    case Severity::Error:       return "Error";
    case Severity::Warning:     return "Warning";
    case Severity::Information: return "Information";
    default:                    cpputil::unreachable();
    }
}

auto knit::utl::describe_read_error(Read_error const error) -> std::string_view
{
    switch (error) {
    case Read_error::Does_not_exist: return "File does not exist";
    case Read_error::Failed_to_open: return "Failed to open file";
    case Read_error::Failed_to_read: return "Failed to read file";
    default:                         cpputil::unreachable();
    }
}

auto knit::utl::format_diagnostic(std::string_view const source, Diagnostic const& diagnostic)
    -> std::string
{
    auto const [start, stop] = diagnostic.range;

    auto output = std::format(
        "{}: {}: {}", start, severity_string(diagnostic.severity), diagnostic.message);

    auto const line = find_line(source, start.line);
    if (line.empty()) {
        return output;
    }

    auto const width = stop.line == start.line and stop.column > start.column
                         ? stop.column - start.column
                         : 1U;

    std::format_to(
        std::back_inserter(output),
        "\n {:>4} | {}\n      | {}{}",
        start.line + 1,
        line,
        std::string(start.column, ' '),
        std::string(width, '^'));
    return output;
}

auto knit::utl::read_file(std::filesystem::path const& path)
    -> std::expected<std::string, Read_error>
{
    if (auto file = cpputil::io::File::open_read(path.c_str())) {
        if (auto content = cpputil::io::read(file.get())) {
            return std::move(content).value();
        }
        return std::unexpected(Read_error::Failed_to_read);
    }
    if (std::filesystem::exists(path)) {
        return std::unexpected(Read_error::Failed_to_open);
    }
    return std::unexpected(Read_error::Does_not_exist);
}
