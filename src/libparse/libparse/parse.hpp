#ifndef KNIT_LIBPARSE_PARSE
#define KNIT_LIBPARSE_PARSE

#include <libutl/utilities.hpp>
#include <libutl/source.hpp>
#include <libparse/ast.hpp>

namespace knit::par {

    enum struct Log_level : std::uint8_t { None, Debug };

    // Parser configuration.
    struct Configuration {
        Log_level   log_level      = Log_level::None;
        std::size_t max_depth      = 256;  // Maximum nesting depth.
        bool        unicode_lambda = true; // Accept 'λ' as a lambda introducer.
    };

    // A parsed root node and the comments around it. A module keeps its comments
    // among its declarations, so its leading and trailing comments are always empty.
    template <typename Root>
    struct Parsed {
        ast::Arena    arena;
        Root          root;
        ast::Comments leading;
        ast::Comments trailing;
    };

    template <typename Root>
    using Result = std::expected<Parsed<Root>, utl::Diagnostic>;

    // Parse a sequence of top-level definitions and type annotations.
    [[nodiscard]] auto parse_module_text(std::string_view source, Configuration const& config = {})
        -> Result<ast::Module>;

    // Parse a single expression that spans the entire source text.
    [[nodiscard]] auto parse_expression_text(
        std::string_view source, Configuration const& config = {}) -> Result<ast::Expression_id>;

    // Parse a single pattern that spans the entire source text.
    [[nodiscard]] auto parse_pattern_text(
        std::string_view source, Configuration const& config = {}) -> Result<ast::Pattern_id>;

    // Parse a single type that spans the entire source text.
    [[nodiscard]] auto parse_type_text(std::string_view source, Configuration const& config = {})
        -> Result<ast::Type_id>;

    // Render a node as a compact S-expression without comments.
    [[nodiscard]] auto to_string(ast::Arena const& arena, ast::Expression_id id) -> std::string;
    [[nodiscard]] auto to_string(ast::Arena const& arena, ast::Pattern_id id) -> std::string;
    [[nodiscard]] auto to_string(ast::Arena const& arena, ast::Type_id id) -> std::string;
    [[nodiscard]] auto to_string(ast::Arena const& arena, ast::Declaration const& declaration)
        -> std::string;

} // namespace knit::par

#endif // KNIT_LIBPARSE_PARSE
