#include <gtest/gtest.h>
#include <calcexpr/errors.hpp>
#include <calcexpr/lexer.hpp>

#include <vector>

namespace {

using calcexpr::TokKind;

std::vector<TokKind> kinds(std::string_view input) {
    std::vector<TokKind> out;
    for (const auto& t : calcexpr::lex(input)) out.push_back(t.kind);
    return out;
}

TEST(Lexer, OperatorsAndGrouping) {
    EXPECT_EQ(kinds("(1 + 2) * 3 / 4 ^ 5 - |x|"),
              (std::vector<TokKind>{TokKind::LParen, TokKind::Literal, TokKind::Plus, TokKind::Literal,
                                    TokKind::RParen, TokKind::Star, TokKind::Literal, TokKind::Slash,
                                    TokKind::Literal, TokKind::Power, TokKind::Literal, TokKind::Minus,
                                    TokKind::Pipe, TokKind::Ident, TokKind::Pipe, TokKind::End}));
}

TEST(Lexer, ImplicitMultiplicationSplitsNumberAndName) {
    auto tokens = calcexpr::lex("3y");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokKind::Literal);
    EXPECT_EQ(tokens[0].text, "3");
    EXPECT_EQ(tokens[1].kind, TokKind::Ident);
    EXPECT_EQ(tokens[1].text, "y");
}

TEST(Lexer, DigitsEndAnIdentifier) {
    auto tokens = calcexpr::lex("sqrt64");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].text, "sqrt");
    EXPECT_EQ(tokens[1].kind, TokKind::Literal);
    EXPECT_EQ(tokens[1].text, "64");
}

TEST(Lexer, UnitSuffixes) {
    EXPECT_EQ(kinds("90deg"), (std::vector<TokKind>{TokKind::Literal, TokKind::Deg, TokKind::End}));
    EXPECT_EQ(kinds("90\xC2\xB0"), (std::vector<TokKind>{TokKind::Literal, TokKind::Deg, TokKind::End}));
    EXPECT_EQ(kinds("2 rad"), (std::vector<TokKind>{TokKind::Literal, TokKind::Rad, TokKind::End}));
}

TEST(Lexer, Utf8Symbols) {
    auto tokens = calcexpr::lex("2\xCF\x80 \xC3\x97 \xE2\x88\x9A" "4");
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[1].kind, TokKind::Ident);
    EXPECT_EQ(tokens[1].text, "pi");
    EXPECT_EQ(tokens[2].kind, TokKind::Star);
    EXPECT_EQ(tokens[3].kind, TokKind::Ident);
    EXPECT_EQ(tokens[3].text, "sqrt");
    EXPECT_EQ(tokens[4].text, "4");
}

TEST(Lexer, LiteralsTakeOneDecimalPoint) {
    auto tokens = calcexpr::lex("1.25.5");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].text, "1.25");
    EXPECT_EQ(tokens[1].text, ".5");
}

TEST(Lexer, EmptyInputIsJustEnd) {
    EXPECT_EQ(kinds("   "), (std::vector<TokKind>{TokKind::End}));
}

TEST(Lexer, RejectsUnknownCharacters) {
    try {
        calcexpr::lex("1 + @");
        FAIL() << "expected ParseError";
    } catch (const calcexpr::ParseError& e) {
        EXPECT_EQ(e.kind, calcexpr::ParseErrorKind::InvalidCharacter);
        EXPECT_EQ(e.position, 4u);
    }
}

} // namespace
