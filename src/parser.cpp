#include "calcexpr/parser.hpp"
#include "calcexpr/errors.hpp"
#include "calcexpr/lexer.hpp"

#include <string>
#include <utility>

namespace calcexpr {

static const Token& end_token() {
    static const Token end{TokKind::End};
    return end;
}

bool ParserContext::at_end() const {
    return pos_ >= tokens_.size() || tokens_[pos_].kind == TokKind::End;
}

const Token& ParserContext::peek() const {
    return pos_ < tokens_.size() ? tokens_[pos_] : end_token();
}

const Token& ParserContext::peek_next() const {
    return pos_ + 1 < tokens_.size() ? tokens_[pos_ + 1] : end_token();
}

const Token& ParserContext::advance() {
    if (at_end()) return end_token();
    return tokens_[pos_++];
}

const Token& ParserContext::consume(TokKind kind) {
    if (!check(kind)) {
        throw ParseError(ParseErrorKind::UnexpectedToken,
                         "Unexpected token at position " + std::to_string(pos_) + ": expected '" +
                             to_string(kind) + "', found '" + to_string(peek().kind) + "'",
                         pos_, kind);
    }
    return advance();
}

// -----------------------------
// Expressions
// -----------------------------
static ExprPtr parse_expr(ParserContext& ctx);

// |expr| is sugar for abs((expr)).
static ExprPtr parse_abs(ParserContext& ctx) {
    ctx.consume(TokKind::Pipe);
    ExprPtr inner = parse_expr(ctx);
    ctx.consume(TokKind::Pipe);

    std::vector<ExprPtr> args;
    args.push_back(make_expr(GroupExpr{std::move(inner)}));
    return make_expr(CallExpr{"abs", std::move(args)});
}

static ExprPtr parse_group(ParserContext& ctx) {
    ctx.consume(TokKind::LParen);
    ExprPtr inner = parse_expr(ctx);
    ctx.consume(TokKind::RParen);
    return make_expr(GroupExpr{std::move(inner)});
}

static ExprPtr parse_identifier(ParserContext& ctx) {
    std::string name = ctx.consume(TokKind::Ident).text;

    // sqrt64: a known function directly followed by a number
    if (ctx.check(TokKind::Literal) && ctx.symbol_table().contains_fn(name)) {
        std::vector<ExprPtr> args;
        args.push_back(make_expr(LiteralExpr{ctx.advance().text}));
        return make_expr(CallExpr{std::move(name), std::move(args)});
    }

    // Calls and declarations look the same here; the statement level decides.
    if (ctx.check(TokKind::LParen)) {
        ctx.advance();
        std::vector<ExprPtr> args;
        args.push_back(parse_expr(ctx));
        while (ctx.check(TokKind::Comma)) {
            ctx.advance();
            args.push_back(parse_expr(ctx));
        }
        ctx.consume(TokKind::RParen);
        return make_expr(CallExpr{std::move(name), std::move(args)});
    }

    return make_expr(VarExpr{std::move(name)});
}

static ExprPtr parse_primary(ParserContext& ctx) {
    ExprPtr expr;
    switch (ctx.peek().kind) {
        case TokKind::LParen: expr = parse_group(ctx); break;
        case TokKind::Pipe:   expr = parse_abs(ctx); break;
        case TokKind::Ident:  expr = parse_identifier(ctx); break;
        default:
            expr = make_expr(LiteralExpr{ctx.consume(TokKind::Literal).text});
            break;
    }

    if (is_unit(ctx.peek().kind)) {
        TokKind unit = ctx.advance().kind;
        return make_expr(UnitExpr{std::move(expr), unit});
    }
    return expr;
}

// Right associative: 2^3^2 == 2^(3^2)
static ExprPtr parse_exponent(ParserContext& ctx) {
    ParserContext::NestingGuard nesting(ctx);
    ExprPtr left = parse_primary(ctx);
    if (ctx.check(TokKind::Power)) {
        TokKind op = ctx.advance().kind;
        ExprPtr right = parse_exponent(ctx);
        return make_expr(BinaryExpr{std::move(left), op, std::move(right)});
    }
    return left;
}

static ExprPtr parse_unary(ParserContext& ctx) {
    ParserContext::NestingGuard nesting(ctx);
    if (ctx.check(TokKind::Minus)) {
        TokKind op = ctx.advance().kind;
        return make_expr(UnaryExpr{op, parse_unary(ctx)});
    }
    return parse_exponent(ctx);
}

static ExprPtr parse_factor(ParserContext& ctx) {
    ExprPtr left = parse_unary(ctx);

    while (ctx.check(TokKind::Star) || ctx.check(TokKind::Slash) || ctx.check(TokKind::Ident)) {
        TokKind op = TokKind::Star;
        // An identifier where an operator belongs is implicit multiplication (3y).
        // It stays in the stream as the right operand.
        if (!ctx.check(TokKind::Ident)) op = ctx.advance().kind;

        ExprPtr right = parse_unary(ctx);
        left = make_expr(BinaryExpr{std::move(left), op, std::move(right)});
    }
    return left;
}

static ExprPtr parse_sum(ParserContext& ctx) {
    ExprPtr left = parse_factor(ctx);

    while (ctx.check(TokKind::Plus) || ctx.check(TokKind::Minus)) {
        TokKind op = ctx.advance().kind;
        ExprPtr right = parse_factor(ctx);
        left = make_expr(BinaryExpr{std::move(left), op, std::move(right)});
    }
    return left;
}

static ExprPtr parse_expr(ParserContext& ctx) {
    return parse_sum(ctx);
}

// -----------------------------
// Statements
// -----------------------------
static Stmt parse_var_decl(ParserContext& ctx) {
    std::string name = ctx.consume(TokKind::Ident).text;
    ctx.consume(TokKind::Assign);
    return Stmt{VarDecl{std::move(name), parse_expr(ctx)}};
}

// "f(x) = ..." declares, "f(x) + 1" calls. Parse a call first and
// reinterpret it once an '=' shows up; otherwise rewind and parse again.
static Stmt parse_identifier_stmt(ParserContext& ctx) {
    const std::size_t start = ctx.position();
    ParserContext::Speculation attempt(ctx);
    ExprPtr primary = parse_primary(ctx);

    if (!ctx.check(TokKind::Assign)) {
        attempt.restore();
        return Stmt{ExprStmt{parse_expr(ctx)}};
    }
    attempt.commit();
    ctx.advance(); // '='

    auto* call = std::get_if<CallExpr>(&primary->node);
    if (!call) {
        throw ParseError(ParseErrorKind::InvalidFunctionParameterList,
                         "Invalid function declaration at position " + std::to_string(start), start);
    }

    std::vector<std::string> params;
    params.reserve(call->args.size());
    for (const auto& arg : call->args) {
        const auto* var = std::get_if<VarExpr>(&arg->node);
        if (!var) {
            throw ParseError(ParseErrorKind::InvalidFunctionParameterList,
                             "Invalid parameter list for function '" + call->name + "': parameters must be names",
                             start);
        }
        params.push_back(var->name);
    }

    FnDecl decl{call->name, std::move(params), parse_expr(ctx)};

    // Later statements (and later inputs) can now recognize the function.
    ctx.symbol_table().declare(decl);
    return Stmt{std::move(decl)};
}

static Stmt parse_stmt(ParserContext& ctx) {
    if (ctx.check(TokKind::Ident)) {
        switch (ctx.peek_next().kind) {
            case TokKind::Assign: return parse_var_decl(ctx);
            case TokKind::LParen: return parse_identifier_stmt(ctx);
            default: break;
        }
    }
    return Stmt{ExprStmt{parse_expr(ctx)}};
}

std::vector<Stmt> parse_tokens(ParserContext& context, std::vector<Token> tokens) {
    context.load(std::move(tokens));

    std::vector<Stmt> statements;
    while (!context.at_end()) statements.push_back(parse_stmt(context));
    return statements;
}

std::vector<Stmt> parse_statements(ParserContext& context, std::string_view input) {
    return parse_tokens(context, lex(input));
}

} // namespace calcexpr
