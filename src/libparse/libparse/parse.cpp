#include <libutl/utilities.hpp>
#include <libparse/parse.hpp>
#include <libparse/internals.hpp>

using namespace knit;
using namespace knit::par;

namespace {
    // Parse the entire source text with `parser`, which receives the context and the
    // list that collects the comments before the root node.
    template <typename Root>
    auto parse_text(
        std::string_view const                               source,
        Configuration const&                                 config,
        std::string_view const                               description,
        std::invocable<Context&, ast::Comments&> auto const& parser) -> Result<Root>
    {
        auto ctx = context(source, config);
        debug(ctx, "Parsing {} from {} bytes of source text", description, source.size());
        try {
            ast::Comments leading;
            Root          root     = parser(ctx, leading);
            ast::Comments trailing = whitespace(ctx);
            if (not lex::is_finished(ctx.state)) {
                error_expected(ctx, "the end of input");
            }
            debug(ctx, "Finished parsing {} at {}", description, ctx.state.position);
            return Parsed<Root> {
                .arena    = std::move(ctx.arena),
                .root     = std::move(root),
                .leading  = std::move(leading),
                .trailing = std::move(trailing),
            };
        }
        catch (Failure const& failure) {
            debug(ctx, "Parsing {} failed at {}: {}", description, failure.position, failure.message);
            return std::unexpected(utl::Diagnostic {
                .message  = failure.message,
                .range    = utl::to_range(failure.position),
                .severity = utl::Severity::Error,
            });
        }
    }

    template <std::invocable<Context&> auto parser>
    auto parse_root(std::string_view const description)
    {
        return [description](Context& ctx, ast::Comments& leading) {
            leading = whitespace(ctx);
            return require<parser>(ctx, description);
        };
    }
} // namespace

auto knit::par::parse_module_text(std::string_view const source, Configuration const& config)
    -> Result<ast::Module>
{
    return parse_text<ast::Module>(
        source, config, "module", [](Context& ctx, ast::Comments&) { return parse_module(ctx); });
}

auto knit::par::parse_expression_text(std::string_view const source, Configuration const& config)
    -> Result<ast::Expression_id>
{
    return parse_text<ast::Expression_id>(
        source, config, "expression", parse_root<parse_expression>("an expression"));
}

auto knit::par::parse_pattern_text(std::string_view const source, Configuration const& config)
    -> Result<ast::Pattern_id>
{
    return parse_text<ast::Pattern_id>(
        source, config, "pattern", parse_root<parse_pattern>("a pattern"));
}

auto knit::par::parse_type_text(std::string_view const source, Configuration const& config)
    -> Result<ast::Type_id>
{
    return parse_text<ast::Type_id>(source, config, "type", parse_root<parse_type>("a type"));
}
