#include <libutl/utilities.hpp>
#include <libutl/source.hpp>
#include <libparse/parse.hpp>
#include <libparse/fixity.hpp>

using namespace knit;

namespace {
    template <typename... Args>
    [[noreturn]] void die(std::format_string<Args...> fmt, Args&&... args)
    {
        std::println(std::cerr, fmt, std::forward<Args>(args)...);
        std::quick_exit(EXIT_FAILURE);
    }

    auto read_source(std::string_view const path) -> std::string
    {
        if (auto source = utl::read_file(path)) {
            return std::move(source).value();
        }
        else {
            die("Error: {}: '{}'", utl::describe_read_error(source.error()), path);
        }
    }

    auto parse_module(std::string_view const source, par::Configuration const& config)
        -> par::Parsed<ast::Module>
    {
        auto result = par::parse_module_text(source, config);
        if (not result.has_value()) {
            die("{}", utl::format_diagnostic(source, result.error()));
        }
        return std::move(result).value();
    }

    void parse(std::string_view const path, par::Configuration const& config)
    {
        auto const source = read_source(path);
        auto const parsed = parse_module(source, config);
        std::println("{}: {} declarations", path, parsed.root.declarations.size());
    }

    void dump_ast(std::string_view const path, par::Configuration const& config)
    {
        auto const source = read_source(path);
        auto const parsed = parse_module(source, config);
        for (ast::Declaration const& declaration : parsed.root.declarations) {
            std::println("{}", par::to_string(parsed.arena, declaration));
        }
    }

    void print_association(ast::Arena const& arena, ast::Expression_id const root)
    {
        auto const* const binops = std::get_if<ast::expr::Binops>(&arena.expressions[root].variant);
        if (binops == nullptr) {
            return;
        }
        if (auto association = par::associate(arena, root, par::default_fixity_table())) {
            std::println("{}", par::to_string(arena, *binops, association.value()));
        }
        else {
            std::println(std::cerr, "Error: {}", association.error().message);
        }
    }

    void expression(std::string_view const text, par::Configuration const& config)
    {
        auto const result = par::parse_expression_text(text, config);
        if (not result.has_value()) {
            die("{}", utl::format_diagnostic(text, result.error()));
        }
        auto const& [arena, root] = result.value();
        std::println("{}", par::to_string(arena, root));
        print_association(arena, root);
    }

    auto const help_text = R"(Usage: knit [OPTIONS] [COMMAND]

Options:
    -v, --version   Show version information
    -h, --help      Show this help text
    -d, --debug     Trace the parser to standard error

Commands:
    parse [PATH]    Parse the given module and print diagnostics
    ast [PATH]      Parse the given module and display every declaration
    expr [TEXT]     Parse a single expression and display it)";
} // namespace

auto main(int argc, char const* const* argv) -> int
{
    auto next = [=, arg = argv + 1](std::string_view desc) mutable {
        if (arg != argv + argc) {
            return std::string_view(*arg++);
        }
        die("Missing required argument {}", desc);
    };

    try {
        if (argc == 1) {
            std::println("{}", help_text);
            return EXIT_SUCCESS;
        }

        par::Configuration config;

        auto arg = next("[ARG]");
        while (arg == "-d" or arg == "--debug") {
            config.log_level = par::Log_level::Debug;
            arg              = next("[COMMAND]");
        }

        if (arg == "-v" or arg == "--version") {
            std::println("knit 0.1.0");
        }
        else if (arg == "-h" or arg == "--help") {
            std::println("{}", help_text);
        }
        else if (arg == "parse") {
            parse(next("[PATH]"), config);
        }
        else if (arg == "ast") {
            dump_ast(next("[PATH]"), config);
        }
        else if (arg == "expr") {
            expression(next("[TEXT]"), config);
        }
        else {
            char const* desc = arg.starts_with('-') ? "option" : "command";
            die("Unrecognized {}: '{}'\n\nFor help, try 'knit --help'", desc, arg);
        }

        return EXIT_SUCCESS;
    }
    catch (std::exception const& exception) {
        std::println(std::cerr, "Error: Unhandled exception: {}", exception.what());
    }

    return EXIT_FAILURE;
}
