#pragma once
#include <gmpxx.h>
#include <string>
#include <string_view>

namespace calcexpr {

/// Arbitrary-precision magnitude backed by GMP's mpf_class.
///
/// Arithmetic, sqrt, integer powers and the decomposition helpers run at
/// kPrecisionBits. log10/ln are computed from the mantissa/exponent split, the
/// remaining transcendental functions go through double.
/// Operations GMP cannot represent (division by zero, square root of a
/// negative number, non-finite results) throw EvalError instead of trapping.
class BigFloat {
public:
    static constexpr mp_bitcnt_t kPrecisionBits = 256;

    BigFloat() : v_(0.0, kPrecisionBits) {}
    BigFloat(double v);
    explicit BigFloat(const mpf_class& v) : v_(v, kPrecisionBits) {}

    static BigFloat parse(std::string_view text);
    static BigFloat pi();
    static BigFloat e();

    double to_double() const { return v_.get_d(); }
    bool is_integer() const { return mpf_integer_p(v_.get_mpf_t()) != 0; }
    const mpf_class& value() const { return v_; }

    BigFloat abs() const;
    BigFloat fract() const;
    BigFloat trunc() const;
    BigFloat floor() const;
    BigFloat ceil() const;
    BigFloat round() const;

    BigFloat sqrt() const;
    BigFloat cbrt() const;
    BigFloat log10() const;
    BigFloat ln() const;
    BigFloat exp() const;
    BigFloat pow(const BigFloat& y) const;

    BigFloat sin() const;
    BigFloat cos() const;
    BigFloat tan() const;
    BigFloat asin() const;
    BigFloat acos() const;
    BigFloat atan() const;
    BigFloat sinh() const;
    BigFloat cosh() const;
    BigFloat tanh() const;

    std::string to_string(int digits) const;
    std::string to_fixed_string(int decimals) const;

    friend BigFloat operator+(const BigFloat& a, const BigFloat& b);
    friend BigFloat operator-(const BigFloat& a, const BigFloat& b);
    friend BigFloat operator*(const BigFloat& a, const BigFloat& b);
    friend BigFloat operator/(const BigFloat& a, const BigFloat& b);
    friend BigFloat operator-(const BigFloat& a);

    friend bool operator==(const BigFloat& a, const BigFloat& b) { return compare(a, b) == 0; }
    friend bool operator!=(const BigFloat& a, const BigFloat& b) { return compare(a, b) != 0; }
    friend bool operator<(const BigFloat& a, const BigFloat& b) { return compare(a, b) < 0; }
    friend bool operator<=(const BigFloat& a, const BigFloat& b) { return compare(a, b) <= 0; }
    friend bool operator>(const BigFloat& a, const BigFloat& b) { return compare(a, b) > 0; }
    friend bool operator>=(const BigFloat& a, const BigFloat& b) { return compare(a, b) >= 0; }

private:
    static int compare(const BigFloat& a, const BigFloat& b) {
        return mpf_cmp(a.v_.get_mpf_t(), b.v_.get_mpf_t());
    }

    mpf_class v_;
};

} // namespace calcexpr
