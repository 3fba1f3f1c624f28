#include <gtest/gtest.h>
#include <calcexpr/big_float.hpp>
#include <calcexpr/errors.hpp>
#include <calcexpr/parser.hpp>
#include <calcexpr/rounding.hpp>

#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

using calcexpr::AngleUnit;
using calcexpr::BigFloat;
using calcexpr::BigNumber;
using calcexpr::Component;
using calcexpr::EvalError;

BigNumber eval(calcexpr::ParserContext& ctx, std::string_view input) {
    std::optional<BigNumber> result = calcexpr::parse<BigFloat>(ctx, input, AngleUnit::Radians);
    if (!result) throw std::runtime_error("no value for: " + std::string(input));
    return *result;
}

TEST(BigFloat, ParseAndRender) {
    EXPECT_EQ(BigFloat::parse("2.5").to_string(10), "2.5");
    EXPECT_EQ(BigFloat::parse(".5").to_string(10), "0.5");
    EXPECT_EQ(BigFloat::parse("12").to_fixed_string(0), "12");
    EXPECT_THROW(BigFloat::parse("abc"), EvalError);
    EXPECT_THROW(BigFloat::parse(""), EvalError);
}

TEST(BigFloat, Decomposition) {
    const BigFloat v = BigFloat::parse("-2.75");
    EXPECT_DOUBLE_EQ(v.trunc().to_double(), -2.0);
    EXPECT_DOUBLE_EQ(v.fract().to_double(), -0.75);
    EXPECT_DOUBLE_EQ(v.floor().to_double(), -3.0);
    EXPECT_DOUBLE_EQ(v.ceil().to_double(), -2.0);
    EXPECT_DOUBLE_EQ(v.round().to_double(), -3.0);
    EXPECT_DOUBLE_EQ(v.abs().to_double(), 2.75);
    EXPECT_TRUE(BigFloat(4.0).is_integer());
    EXPECT_FALSE(v.is_integer());
}

TEST(BigFloat, Logarithms) {
    EXPECT_NEAR(BigFloat(1000.0).log10().to_double(), 3.0, 1e-9);
    EXPECT_NEAR(BigFloat::e().ln().to_double(), 1.0, 1e-9);
    EXPECT_LT(BigFloat(0.0).log10().to_double(), -1e300);
}

TEST(BigFloat, Errors) {
    EXPECT_THROW(BigFloat(1.0) / BigFloat(0.0), EvalError);
    EXPECT_THROW(BigFloat(-4.0).sqrt(), EvalError);
    EXPECT_THROW(BigFloat{std::numeric_limits<double>::infinity()}, EvalError);
}

TEST(BigFloat, ExactThirds) {
    calcexpr::ParserContext ctx;
    BigNumber third = eval(ctx, "1/3");
    EXPECT_EQ(third.real.to_string(10), "0.3333333333");
    EXPECT_EQ(calcexpr::estimate(third, Component::Real), "1/3");
    EXPECT_EQ(calcexpr::estimate(eval(ctx, "7/3"), Component::Real), "2 + 1/3");
}

TEST(BigFloat, EstimatesThroughParse) {
    calcexpr::ParserContext ctx;
    EXPECT_EQ(calcexpr::estimate(eval(ctx, "sqrt(2)"), Component::Real), "√2");
    EXPECT_EQ(calcexpr::estimate(eval(ctx, "pi/2"), Component::Real), "π/2");
    EXPECT_EQ(calcexpr::estimate(eval(ctx, "sqrt(5)"), Component::Real), "√5");
    EXPECT_EQ(calcexpr::estimate(eval(ctx, "1/2"), Component::Real), "1/2");
    EXPECT_EQ(calcexpr::estimate(eval(ctx, "4"), Component::Real), std::nullopt);
}

TEST(BigFloat, SmallMultiplesOfConstantsStayUnnamed) {
    calcexpr::ParserContext ctx;
    EXPECT_EQ(calcexpr::estimate(eval(ctx, "0.00001 pi"), Component::Real), std::nullopt);
    EXPECT_EQ(calcexpr::decimal_string(eval(ctx, "0.00001 pi").real), "0.00003141592654");
}

TEST(BigFloat, Interpreter) {
    calcexpr::ParserContext ctx;
    EXPECT_FALSE(calcexpr::parse<BigFloat>(ctx, "f(x) = x^2 + 1", AngleUnit::Radians).has_value());
    EXPECT_EQ(calcexpr::format(eval(ctx, "f(3)")), "10");
    EXPECT_EQ(calcexpr::format(eval(ctx, "sqrt(-9)")), "3i");
    EXPECT_THROW(eval(ctx, "1/0"), EvalError);
}

} // namespace
