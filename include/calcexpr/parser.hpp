#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "calcexpr/ast.hpp"
#include "calcexpr/errors.hpp"
#include "calcexpr/interpreter.hpp"
#include "calcexpr/magnitude.hpp"
#include "calcexpr/number.hpp"
#include "calcexpr/symbol_table.hpp"
#include "calcexpr/token.hpp"

namespace calcexpr {

/// Parse session: the loaded token stream, a cursor into it and the symbol
/// table. The symbol table outlives individual inputs, so functions and
/// variables declared in one parse are visible to the next.
///
/// Every token access is bounds-checked; past the end, peek() and advance()
/// return the End sentinel.
class ParserContext {
public:
    /// Cursor snapshot for a speculative parse. Unless commit() is called,
    /// the cursor goes back to the snapshot on restore() or destruction.
    class Speculation {
    public:
        explicit Speculation(ParserContext& ctx) : ctx_(ctx), pos_(ctx.pos_) {}
        ~Speculation() {
            if (!done_) ctx_.pos_ = pos_;
        }

        Speculation(const Speculation&) = delete;
        Speculation& operator=(const Speculation&) = delete;

        void commit() { done_ = true; }
        void restore() {
            ctx_.pos_ = pos_;
            done_ = true;
        }

    private:
        ParserContext& ctx_;
        std::size_t pos_;
        bool done_{false};
    };

    /// Counts one level of recursive descent for as long as it lives.
    class NestingGuard {
    public:
        explicit NestingGuard(ParserContext& ctx) : ctx_(ctx) {
            if (ctx_.depth_ >= kMaxNesting) {
                throw ParseError(ParseErrorKind::NestingTooDeep,
                                 "Expression nested too deeply at position " + std::to_string(ctx_.pos_),
                                 ctx_.pos_);
            }
            ++ctx_.depth_;
        }
        ~NestingGuard() { --ctx_.depth_; }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

    private:
        ParserContext& ctx_;
    };

    static constexpr int kMaxNesting = 512;

    void load(std::vector<Token> tokens) {
        tokens_ = std::move(tokens);
        pos_ = 0;
        depth_ = 0;
    }

    std::size_t position() const { return pos_; }
    bool at_end() const;

    const Token& peek() const;
    const Token& peek_next() const;
    bool check(TokKind kind) const { return !at_end() && peek().kind == kind; }

    const Token& advance();
    /// Advance past a token of `kind` or throw ParseError (UnexpectedToken).
    const Token& consume(TokKind kind);

    SymbolTable& symbol_table() { return symbol_table_; }
    const SymbolTable& symbol_table() const { return symbol_table_; }

private:
    std::vector<Token> tokens_;
    std::size_t pos_{0};
    int depth_{0};
    SymbolTable symbol_table_;
};

/// Parse a token stream (terminated by TokKind::End) into statements.
/// Registers function declarations in the context's symbol table as they
/// are parsed. Throws ParseError.
std::vector<Stmt> parse_tokens(ParserContext& context, std::vector<Token> tokens);

/// Lex + parse_tokens.
std::vector<Stmt> parse_statements(ParserContext& context, std::string_view input);

/// Parse `input` and evaluate it with magnitude type M.
/// Throws ParseError on malformed input and EvalError when evaluation fails.
template <class M = Float>
std::optional<BasicNumber<M>> parse(ParserContext& context, std::string_view input, AngleUnit angle_unit) {
    std::vector<Stmt> statements = parse_statements(context, input);
    Interpreter<M> interpreter(angle_unit, context.symbol_table());
    return interpreter.interpret(statements);
}

} // namespace calcexpr
