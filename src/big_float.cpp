#include "calcexpr/big_float.hpp"
#include "calcexpr/errors.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace calcexpr {

namespace {

const char* const kPiDigits =
    "3.14159265358979323846264338327950288419716939937510582097494459230781640628620899863";
const char* const kEDigits =
    "2.71828182845904523536028747135266249775724709369995957496696762772407663035354759457";

std::string format_mpf(const char* fmt, int precision, const mpf_class& v) {
    const int n = gmp_snprintf(nullptr, 0, fmt, precision, v.get_mpf_t());
    if (n < 0) return {};
    std::vector<char> buf(static_cast<std::size_t>(n) + 1);
    gmp_snprintf(buf.data(), buf.size(), fmt, precision, v.get_mpf_t());
    return std::string(buf.data(), static_cast<std::size_t>(n));
}

// log2 of a positive value from GMP's mantissa/exponent split, so values far
// outside double range still get a finite logarithm.
double log2_of(const mpf_class& v) {
    signed long int exponent = 0;
    const double mantissa = mpf_get_d_2exp(&exponent, v.get_mpf_t());
    return std::log2(mantissa) + static_cast<double>(exponent);
}

} // namespace

BigFloat::BigFloat(double v) : v_(0.0, kPrecisionBits) {
    if (!std::isfinite(v)) throw EvalError("Result is not a finite number");
    v_ = v;
}

BigFloat BigFloat::parse(std::string_view text) {
    std::string s(text);
    if (!s.empty() && s.front() == '.') s.insert(0, "0");
    if (!s.empty() && s.back() == '.') s.pop_back();
    BigFloat out;
    if (s.empty() || mpf_set_str(out.v_.get_mpf_t(), s.c_str(), 10) != 0) {
        throw EvalError("Invalid number: " + std::string(text));
    }
    return out;
}

BigFloat BigFloat::pi() { return parse(kPiDigits); }
BigFloat BigFloat::e() { return parse(kEDigits); }

BigFloat BigFloat::abs() const {
    BigFloat r;
    mpf_abs(r.v_.get_mpf_t(), v_.get_mpf_t());
    return r;
}

BigFloat BigFloat::fract() const {
    return *this - trunc();
}

BigFloat BigFloat::trunc() const {
    BigFloat r;
    mpf_trunc(r.v_.get_mpf_t(), v_.get_mpf_t());
    return r;
}

BigFloat BigFloat::floor() const {
    BigFloat r;
    mpf_floor(r.v_.get_mpf_t(), v_.get_mpf_t());
    return r;
}

BigFloat BigFloat::ceil() const {
    BigFloat r;
    mpf_ceil(r.v_.get_mpf_t(), v_.get_mpf_t());
    return r;
}

// Half away from zero, like std::round.
BigFloat BigFloat::round() const {
    BigFloat r = (abs() + BigFloat(0.5)).floor();
    return *this < BigFloat() ? -r : r;
}

BigFloat BigFloat::sqrt() const {
    if (*this < BigFloat()) throw EvalError("Square root of a negative number");
    BigFloat r;
    mpf_sqrt(r.v_.get_mpf_t(), v_.get_mpf_t());
    return r;
}

BigFloat BigFloat::cbrt() const { return BigFloat(std::cbrt(to_double())); }

// Zero maps to the lowest double, standing in for -inf.
BigFloat BigFloat::log10() const {
    if (mpf_sgn(v_.get_mpf_t()) <= 0) return BigFloat(std::numeric_limits<double>::lowest());
    return BigFloat(log2_of(v_) * std::log10(2.0));
}

BigFloat BigFloat::ln() const {
    if (mpf_sgn(v_.get_mpf_t()) <= 0) return BigFloat(std::numeric_limits<double>::lowest());
    return BigFloat(log2_of(v_) * std::log(2.0));
}

BigFloat BigFloat::exp() const { return BigFloat(std::exp(to_double())); }

BigFloat BigFloat::pow(const BigFloat& y) const {
    if (y.is_integer() && y.abs() <= BigFloat(1e6)) {
        BigFloat r;
        mpf_pow_ui(r.v_.get_mpf_t(), v_.get_mpf_t(), static_cast<unsigned long>(y.abs().to_double()));
        if (y < BigFloat()) return BigFloat(1.0) / r;
        return r;
    }
    return BigFloat(std::pow(to_double(), y.to_double()));
}

BigFloat BigFloat::sin() const { return BigFloat(std::sin(to_double())); }
BigFloat BigFloat::cos() const { return BigFloat(std::cos(to_double())); }
BigFloat BigFloat::tan() const { return BigFloat(std::tan(to_double())); }
BigFloat BigFloat::asin() const { return BigFloat(std::asin(to_double())); }
BigFloat BigFloat::acos() const { return BigFloat(std::acos(to_double())); }
BigFloat BigFloat::atan() const { return BigFloat(std::atan(to_double())); }
BigFloat BigFloat::sinh() const { return BigFloat(std::sinh(to_double())); }
BigFloat BigFloat::cosh() const { return BigFloat(std::cosh(to_double())); }
BigFloat BigFloat::tanh() const { return BigFloat(std::tanh(to_double())); }

std::string BigFloat::to_string(int digits) const {
    return format_mpf("%.*Fg", digits, v_);
}

std::string BigFloat::to_fixed_string(int decimals) const {
    return format_mpf("%.*Ff", decimals, v_);
}

BigFloat operator+(const BigFloat& a, const BigFloat& b) {
    BigFloat r;
    mpf_add(r.v_.get_mpf_t(), a.v_.get_mpf_t(), b.v_.get_mpf_t());
    return r;
}

BigFloat operator-(const BigFloat& a, const BigFloat& b) {
    BigFloat r;
    mpf_sub(r.v_.get_mpf_t(), a.v_.get_mpf_t(), b.v_.get_mpf_t());
    return r;
}

BigFloat operator*(const BigFloat& a, const BigFloat& b) {
    BigFloat r;
    mpf_mul(r.v_.get_mpf_t(), a.v_.get_mpf_t(), b.v_.get_mpf_t());
    return r;
}

BigFloat operator/(const BigFloat& a, const BigFloat& b) {
    if (mpf_sgn(b.v_.get_mpf_t()) == 0) throw EvalError("Division by zero");
    BigFloat r;
    mpf_div(r.v_.get_mpf_t(), a.v_.get_mpf_t(), b.v_.get_mpf_t());
    return r;
}

BigFloat operator-(const BigFloat& a) {
    BigFloat r;
    mpf_neg(r.v_.get_mpf_t(), a.v_.get_mpf_t());
    return r;
}

} // namespace calcexpr
