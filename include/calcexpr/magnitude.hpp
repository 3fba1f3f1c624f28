#pragma once
#include <cmath>
#include <string>
#include <string_view>

namespace calcexpr {

/// Fixed-precision magnitude backed by a native double.
///
/// A magnitude is the scalar type behind BasicNumber, Interpreter and
/// estimate(). Every magnitude type (Float, BigFloat) provides the same
/// surface:
///   - construction from double, parse() of literal text, pi() and e()
///   - + - * / and unary -, == != < <= > >=
///   - abs, fract, trunc, floor, ceil, round
///   - sqrt, cbrt, log10, ln, exp, pow and the trigonometric functions
///   - is_integer, to_double
///   - to_string(digits): significant digits, trailing zeroes dropped
///   - to_fixed_string(decimals): fixed notation
class Float {
public:
    Float() = default;
    Float(double v) : v_(v) {}

    /// Throws EvalError if `text` is not a complete decimal number.
    static Float parse(std::string_view text);
    static Float pi() { return 3.14159265358979323846; }
    static Float e() { return 2.71828182845904523536; }

    double to_double() const { return v_; }
    bool is_integer() const { return std::isfinite(v_) && v_ == std::trunc(v_); }

    Float abs() const { return std::fabs(v_); }
    Float fract() const { return v_ - std::trunc(v_); }
    Float trunc() const { return std::trunc(v_); }
    Float floor() const { return std::floor(v_); }
    Float ceil() const { return std::ceil(v_); }
    Float round() const { return std::round(v_); }

    Float sqrt() const { return std::sqrt(v_); }
    Float cbrt() const { return std::cbrt(v_); }
    Float log10() const { return std::log10(v_); }
    Float ln() const { return std::log(v_); }
    Float exp() const { return std::exp(v_); }
    Float pow(const Float& y) const { return std::pow(v_, y.v_); }

    Float sin() const { return std::sin(v_); }
    Float cos() const { return std::cos(v_); }
    Float tan() const { return std::tan(v_); }
    Float asin() const { return std::asin(v_); }
    Float acos() const { return std::acos(v_); }
    Float atan() const { return std::atan(v_); }
    Float sinh() const { return std::sinh(v_); }
    Float cosh() const { return std::cosh(v_); }
    Float tanh() const { return std::tanh(v_); }

    std::string to_string(int digits) const;
    std::string to_fixed_string(int decimals) const;

    friend Float operator+(const Float& a, const Float& b) { return a.v_ + b.v_; }
    friend Float operator-(const Float& a, const Float& b) { return a.v_ - b.v_; }
    friend Float operator*(const Float& a, const Float& b) { return a.v_ * b.v_; }
    friend Float operator/(const Float& a, const Float& b) { return a.v_ / b.v_; }
    friend Float operator-(const Float& a) { return -a.v_; }

    friend bool operator==(const Float& a, const Float& b) { return a.v_ == b.v_; }
    friend bool operator!=(const Float& a, const Float& b) { return a.v_ != b.v_; }
    friend bool operator<(const Float& a, const Float& b) { return a.v_ < b.v_; }
    friend bool operator<=(const Float& a, const Float& b) { return a.v_ <= b.v_; }
    friend bool operator>(const Float& a, const Float& b) { return a.v_ > b.v_; }
    friend bool operator>=(const Float& a, const Float& b) { return a.v_ >= b.v_; }

private:
    double v_{0.0};
};

} // namespace calcexpr
