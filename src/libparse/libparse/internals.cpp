#include <libutl/utilities.hpp>
#include <libparse/internals.hpp>

using namespace knit;
using namespace knit::par;

knit::par::Failure::Failure(utl::Position const position, std::string message)
    : position { position }
    , message { std::move(message) }
{}

auto knit::par::Failure::what() const noexcept -> char const*
{
    return message.c_str();
}

auto knit::par::context(std::string_view const source, Configuration const& config) -> Context
{
    return Context {
        .config      = config,
        .arena       = {},
        .state       = lex::state(source),
        .indentation = { 0 },
        .depth       = 0,
    };
}

auto knit::par::snapshot(Context const& ctx) -> Snapshot
{
    return Snapshot {
        .state       = ctx.state,
        .indentation = ctx.indentation,
        .expressions = ctx.arena.expressions.size(),
        .patterns    = ctx.arena.patterns.size(),
        .types       = ctx.arena.types.size(),
    };
}

void knit::par::restore(Context& ctx, Snapshot const& snapshot)
{
    ctx.state       = snapshot.state;
    ctx.indentation = snapshot.indentation;
    ctx.arena.expressions.truncate(snapshot.expressions);
    ctx.arena.patterns.truncate(snapshot.patterns);
    ctx.arena.types.truncate(snapshot.types);
}

void knit::par::error_expected(Context& ctx, std::string_view const description)
{
    throw Failure(
        ctx.state.position,
        std::format("Expected {}, but found {}", description, lex::describe_current(ctx.state)));
}

void knit::par::error_lexical(lex::Error const& error)
{
    throw Failure(error.position, error.message);
}

auto knit::par::up_to_current(Context const& ctx, utl::Position const start) -> utl::Range
{
    return utl::Range(start, ctx.state.position);
}

auto knit::par::extract_trivia(Context& ctx) -> lex::Trivia
{
    if (auto trivia = lex::skip_trivia(ctx.state)) {
        return std::move(trivia).value();
    }
    else {
        error_lexical(trivia.error());
    }
}

auto knit::par::whitespace(Context& ctx) -> ast::Comments
{
    return extract_trivia(ctx).comments;
}

auto knit::par::try_keyword(Context& ctx, std::string_view const keyword) -> bool
{
    return lex::try_consume_keyword(ctx.state, keyword);
}

auto knit::par::try_symbol(Context& ctx, std::string_view const symbol) -> bool
{
    if (lex::remaining(ctx.state).starts_with(symbol)
        and not lex::is_symbol_character(lex::lookahead(ctx.state, symbol.size())))
    {
        lex::advance(ctx.state, symbol.size());
        return true;
    }
    return false;
}

void knit::par::require_keyword(
    Context& ctx, std::string_view const keyword, std::string_view const description)
{
    if (not try_keyword(ctx, keyword)) {
        error_expected(ctx, description);
    }
}

void knit::par::require_symbol(
    Context& ctx, std::string_view const symbol, std::string_view const description)
{
    if (not try_symbol(ctx, symbol)) {
        error_expected(ctx, description);
    }
}

void knit::par::require_character(
    Context& ctx, char const character, std::string_view const description)
{
    if (not lex::try_consume(ctx.state, character)) {
        error_expected(ctx, description);
    }
}

auto knit::par::padded_symbol(
    Context& ctx, std::string_view const symbol, std::string_view const description) -> Padding
{
    auto before = whitespace(ctx);
    require_symbol(ctx, symbol, description);
    return Padding { .before = std::move(before), .after = whitespace(ctx) };
}

auto knit::par::padded_keyword(
    Context& ctx, std::string_view const keyword, std::string_view const description) -> Padding
{
    auto before = whitespace(ctx);
    require_keyword(ctx, keyword, description);
    return Padding { .before = std::move(before), .after = whitespace(ctx) };
}

knit::par::Depth_guard::Depth_guard(Context& ctx, std::string_view const description)
    : depth { ctx.depth }
{
    if (depth >= ctx.config.max_depth) {
        error_expected(ctx, description);
    }
    ++depth;
}

knit::par::Depth_guard::~Depth_guard()
{
    --depth;
}

auto knit::par::current_column(Context const& ctx) noexcept -> std::uint32_t
{
    return ctx.state.position.column;
}

auto knit::par::check_indent(Context const& ctx) -> bool
{
    cpputil::always_assert(not ctx.indentation.empty());
    return current_column(ctx) == ctx.indentation.back();
}

auto knit::par::is_indented(Context const& ctx) -> bool
{
    cpputil::always_assert(not ctx.indentation.empty());
    return current_column(ctx) > ctx.indentation.back();
}

auto knit::par::multiline_since(Context const& ctx, std::uint32_t const newlines) noexcept
    -> ast::Multiline
{
    return ctx.state.newlines == newlines ? ast::Multiline::Join_all : ast::Multiline::Split_all;
}

auto knit::par::parse_lower_name(Context& ctx) -> std::optional<std::string>
{
    return lex::extract_lower_name(ctx.state);
}

auto knit::par::parse_located_lower_name(Context& ctx) -> std::optional<ast::Located<std::string>>
{
    auto const start = ctx.state.position;
    return parse_lower_name(ctx).transform([&](std::string&& name) {
        return ast::Located<std::string> {
            .value = std::move(name),
            .range = up_to_current(ctx, start),
        };
    });
}

auto knit::par::parse_parenthesized_operator(Context& ctx) -> std::optional<std::string>
{
    if (lex::current(ctx.state) != '(') {
        return std::nullopt;
    }
    return attempt(ctx, [&]() -> std::optional<std::string> {
        lex::advance(ctx.state);
        auto symbol = lex::extract_operator(ctx.state);
        if (symbol.has_value() and lex::try_consume(ctx.state, ')')) {
            return symbol;
        }
        return std::nullopt;
    });
}

auto knit::par::parse_operator(Context& ctx) -> std::optional<ast::Located<ast::Reference>>
{
    auto const start = ctx.state.position;
    if (auto symbol = lex::extract_operator(ctx.state)) {
        return ast::Located<ast::Reference> {
            .value = ast::Op_ref { std::move(symbol).value() },
            .range = up_to_current(ctx, start),
        };
    }
    if (lex::try_consume(ctx.state, '`')) {
        auto name = lex::extract_qualified_name(ctx.state);
        if (not name.has_value() or name.value().is_upper) {
            error_expected(ctx, "a function name");
        }
        require_character(ctx, '`', "a closing '`'");
        return ast::Located<ast::Reference> {
            .value = ast::Var_ref {
                .qualifier = std::move(name.value().qualifier),
                .name      = std::move(name.value().name),
            },
            .range = up_to_current(ctx, start),
        };
    }
    return std::nullopt;
}

auto knit::par::parse_literal(Context& ctx) -> std::optional<lex::Literal>
{
    if (not lex::starts_literal(ctx.state)) {
        return std::nullopt;
    }
    if (auto literal = lex::extract_literal(ctx.state)) {
        return std::move(literal).value();
    }
    else {
        error_lexical(literal.error());
    }
}

auto knit::ast::reference_string(Reference const& reference) -> std::string
{
    auto const qualified = [](std::vector<std::string> const& qualifier, std::string const& name) {
        if (qualifier.empty()) {
            return name;
        }
        return std::format("{}.{}", utl::join(qualifier, "."), name);
    };
    return std::visit(
        utl::Overload {
            [&](Var_ref const& ref) { return qualified(ref.qualifier, ref.name); },
            [&](Tag_ref const& ref) { return qualified(ref.qualifier, ref.name); },
            [&](Op_ref const& ref) { return std::format("({})", ref.symbol); },
        },
        static_cast<Reference::variant const&>(reference));
}
