#include <gtest/gtest.h>
#include <calcexpr/errors.hpp>
#include <calcexpr/lexer.hpp>
#include <calcexpr/parser.hpp>

#include <string>
#include <vector>

namespace {

using calcexpr::ParseError;
using calcexpr::ParseErrorKind;
using calcexpr::ParserContext;
using calcexpr::TokKind;

std::string parse_one(ParserContext& ctx, std::string_view input) {
    auto statements = calcexpr::parse_statements(ctx, input);
    if (statements.size() != 1) return "<" + std::to_string(statements.size()) + " statements>";
    return calcexpr::to_string(statements[0]);
}

std::string parse_one(std::string_view input) {
    ParserContext ctx;
    return parse_one(ctx, input);
}

ParseError parse_error(ParserContext& ctx, std::string_view input) {
    try {
        calcexpr::parse_statements(ctx, input);
    } catch (const ParseError& e) {
        return e;
    }
    ADD_FAILURE() << "no ParseError for: " << input;
    return ParseError(ParseErrorKind::UnexpectedToken, "", 0);
}

TEST(Parser, Precedence) {
    EXPECT_EQ(parse_one("2 + 3 * 4"), "(+ 2 (* 3 4))");
    EXPECT_EQ(parse_one("8 - 2 - 1"), "(- (- 8 2) 1)");
    EXPECT_EQ(parse_one("2^3^2"), "(^ 2 (^ 3 2))");
    EXPECT_EQ(parse_one("-2^2"), "(- (^ 2 2))");
    EXPECT_EQ(parse_one("(1 + 2) / 3"), "(/ (group (+ 1 2)) 3)");
}

TEST(Parser, ImplicitMultiplication) {
    EXPECT_EQ(parse_one("3y"), "(* 3 y)");
    EXPECT_EQ(parse_one("3*y"), "(* 3 y)");
    EXPECT_EQ(parse_one("2 x y"), "(* (* 2 x) y)");
}

TEST(Parser, AbsoluteValueBars) {
    EXPECT_EQ(parse_one("|x|"), "(call abs (group x))");
    EXPECT_EQ(parse_one("|1 - 3| + 1"), "(+ (call abs (group (- 1 3))) 1)");
}

TEST(Parser, UnitSuffix) {
    EXPECT_EQ(parse_one("90deg"), "(deg 90)");
    EXPECT_EQ(parse_one("sin(90\xC2\xB0)"), "(call sin (deg 90))");
}

TEST(Parser, VariableDeclaration) {
    EXPECT_EQ(parse_one("x = 2"), "(let x 2)");
    EXPECT_EQ(parse_one("x = 2y + 1"), "(let x (+ (* 2 y) 1))");
}

TEST(Parser, FunctionDeclarationRegistersName) {
    ParserContext ctx;
    EXPECT_FALSE(ctx.symbol_table().contains_fn("f"));
    EXPECT_EQ(parse_one(ctx, "f(x) = x^2"), "(fn f (x) (^ x 2))");
    ASSERT_TRUE(ctx.symbol_table().contains_fn("f"));
    EXPECT_EQ(ctx.symbol_table().get_fn("f")->params, std::vector<std::string>{"x"});
    EXPECT_FALSE(ctx.symbol_table().contains_var("f"));
}

TEST(Parser, MultipleParameters) {
    ParserContext ctx;
    EXPECT_EQ(parse_one(ctx, "f(x, y) = x y"), "(fn f (x y) (* x y))");
}

TEST(Parser, CallBeforeDeclarationIsJustACall) {
    ParserContext ctx;
    EXPECT_EQ(parse_one(ctx, "f(2)"), "(call f 2)");
    EXPECT_FALSE(ctx.symbol_table().contains_fn("f"));
}

TEST(Parser, CallRewindsWhenNoAssignment) {
    ParserContext ctx;
    EXPECT_EQ(parse_one(ctx, "f(2) + 1"), "(+ (call f 2) 1)");
    EXPECT_EQ(parse_one(ctx, "f(2)(3)"), "<2 statements>");
}

TEST(Parser, JuxtaposedFunctionArgument) {
    ParserContext ctx;
    EXPECT_EQ(parse_one(ctx, "sqrt64"), "(call sqrt 64)");

    // g is unknown, so "g3" is a variable followed by a separate literal
    EXPECT_EQ(calcexpr::parse_statements(ctx, "g3").size(), 2u);

    parse_one(ctx, "g(x) = x + 1");
    EXPECT_EQ(parse_one(ctx, "g3"), "(call g 3)");
}

TEST(Parser, DeclarationsVisibleToLaterStatements) {
    ParserContext ctx;
    auto statements = calcexpr::parse_statements(ctx, "f(x) = 2x (f5)");
    ASSERT_EQ(statements.size(), 2u);
    EXPECT_EQ(calcexpr::to_string(statements[0]), "(fn f (x) (* 2 x))");
    EXPECT_EQ(calcexpr::to_string(statements[1]), "(group (call f 5))");
}

TEST(Parser, InvalidParameterList) {
    ParserContext ctx;
    EXPECT_EQ(parse_error(ctx, "f(2x) = 1").kind, ParseErrorKind::InvalidFunctionParameterList);
    EXPECT_EQ(parse_error(ctx, "f(1) = 1").kind, ParseErrorKind::InvalidFunctionParameterList);
    EXPECT_FALSE(ctx.symbol_table().contains_fn("f"));
}

TEST(Parser, MissingClosingTokens) {
    ParserContext ctx;

    ParseError paren = parse_error(ctx, "(1 + 2");
    EXPECT_EQ(paren.kind, ParseErrorKind::UnexpectedToken);
    ASSERT_TRUE(paren.expected.has_value());
    EXPECT_EQ(*paren.expected, TokKind::RParen);

    ParseError pipe = parse_error(ctx, "|1");
    EXPECT_EQ(pipe.kind, ParseErrorKind::UnexpectedToken);
    ASSERT_TRUE(pipe.expected.has_value());
    EXPECT_EQ(*pipe.expected, TokKind::Pipe);
}

TEST(Parser, DanglingOperator) {
    ParserContext ctx;
    EXPECT_EQ(parse_error(ctx, "1 +").kind, ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(parse_error(ctx, "2^-1").kind, ParseErrorKind::UnexpectedToken);
}

TEST(Parser, InvalidCharacterSurfacesFromLexer) {
    ParserContext ctx;
    EXPECT_EQ(parse_error(ctx, "1 # 2").kind, ParseErrorKind::InvalidCharacter);
}

TEST(Parser, DeepNestingIsAnError) {
    ParserContext ctx;
    EXPECT_EQ(parse_error(ctx, std::string(10000, '(') + "1").kind, ParseErrorKind::NestingTooDeep);
    EXPECT_EQ(parse_error(ctx, std::string(10000, '-') + "1").kind, ParseErrorKind::NestingTooDeep);

    std::string powers = "2";
    for (int i = 0; i < 10000; ++i) powers += "^2";
    EXPECT_EQ(parse_error(ctx, powers).kind, ParseErrorKind::NestingTooDeep);
}

TEST(Parser, ModerateNestingIsFine) {
    ParserContext ctx;
    const std::string input = std::string(200, '(') + "1" + std::string(200, ')');
    EXPECT_EQ(calcexpr::parse_statements(ctx, input).size(), 1u);

    // the counter starts over for every input
    EXPECT_EQ(parse_error(ctx, std::string(10000, '(') + "1").kind, ParseErrorKind::NestingTooDeep);
    EXPECT_EQ(calcexpr::parse_statements(ctx, input).size(), 1u);
}

TEST(Parser, EmptyInputHasNoStatements) {
    ParserContext ctx;
    EXPECT_TRUE(calcexpr::parse_statements(ctx, "").empty());
}

TEST(Parser, SpeculationRestoresOnDestruction) {
    ParserContext ctx;
    ctx.load(calcexpr::lex("1 + 2"));
    {
        ParserContext::Speculation attempt(ctx);
        ctx.advance();
        ctx.advance();
        EXPECT_EQ(ctx.position(), 2u);
    }
    EXPECT_EQ(ctx.position(), 0u);
}

TEST(Parser, SpeculationCommitKeepsCursor) {
    ParserContext ctx;
    ctx.load(calcexpr::lex("1 + 2"));
    {
        ParserContext::Speculation attempt(ctx);
        ctx.advance();
        attempt.commit();
    }
    EXPECT_EQ(ctx.position(), 1u);
    EXPECT_EQ(ctx.peek().kind, TokKind::Plus);
}

TEST(Parser, CursorStopsAtEnd) {
    ParserContext ctx;
    ctx.load(calcexpr::lex("1"));
    ctx.advance();
    EXPECT_TRUE(ctx.at_end());
    EXPECT_EQ(ctx.advance().kind, TokKind::End);
    EXPECT_EQ(ctx.peek_next().kind, TokKind::End);
}

} // namespace
