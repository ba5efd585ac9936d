#include <libutl/utilities.hpp>
#include <libparse/parse.hpp>
#include <libparse/test_interface.hpp>

using namespace knit;

namespace {
    auto describe_failure(utl::Diagnostic const& diagnostic) -> std::string
    {
        return std::format("{}: {}", diagnostic.range.start, diagnostic.message);
    }

    template <typename Id>
    auto render(par::Result<Id> const& result) -> std::string
    {
        if (result.has_value()) {
            return par::to_string(result.value().arena, result.value().root);
        }
        return describe_failure(result.error());
    }
} // namespace

auto knit::par::test_parse_expression(std::string_view const source) -> std::string
{
    return render(parse_expression_text(source));
}

auto knit::par::test_parse_pattern(std::string_view const source) -> std::string
{
    return render(parse_pattern_text(source));
}

auto knit::par::test_parse_type(std::string_view const source) -> std::string
{
    return render(parse_type_text(source));
}

auto knit::par::test_parse_module(std::string_view const source) -> std::string
{
    auto const result = parse_module_text(source);
    if (not result.has_value()) {
        return describe_failure(result.error());
    }
    auto const& [arena, root] = result.value();
    return utl::join(
        root.declarations | std::views::transform([&](ast::Declaration const& declaration) {
            return to_string(arena, declaration);
        }),
        "\n");
}
