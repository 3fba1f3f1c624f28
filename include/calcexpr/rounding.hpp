#pragma once
#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

#include "calcexpr/number.hpp"

namespace calcexpr {

/// Significant digits of the component rendering that estimate() inspects.
inline constexpr int kEstimateDigits = 10;

/// "1.200" -> "1.2", "1.000" -> "1", "5" -> "5". Purely lexical.
std::string trim_zeroes(std::string_view input);

/// Positional rendering with kEstimateDigits significant digits and no
/// trailing zeroes: 3.14e-5 -> "0.00003141592654", 1.2e10 -> "12000000000".
template <class M>
std::string decimal_string(const M& value) {
    const M magnitude = value.abs();
    if (magnitude == M(0.0)) return "0";
    const int exponent = static_cast<int>(magnitude.log10().floor().to_double());
    const int decimals = std::max(0, kEstimateDigits - 1 - exponent);
    return trim_zeroes(value.to_fixed_string(decimals));
}

/// Symbolic name for an 8-character decimal prefix ("3.141592" -> "π"), or nullptr.
const char* lookup_constant(std::string_view prefix);

/// Snap a component that sits within floating-point noise of an integer.
/// Returns nothing when the fractional part looks intentional.
template <class M>
std::optional<BasicNumber<M>> round(const BasicNumber<M>& input, Component component) {
    const M& value = input.get(component);
    const M zero(0.0);
    const M sign = value < zero ? M(-1.0) : M(1.0);
    const M fract = value.abs().fract();
    const M integer = value.abs().trunc();

    // Below one, only tiny residues are dropped.
    const bool below_one = integer == zero;
    const M limit_floor = below_one ? M(-8.0) : M(-4.0);
    const M limit_ceil = below_one ? M(-5.0) : M(-6.0);

    if (fract.log10() < limit_floor) {
        return input.with(component, integer * sign);
    }
    if ((M(1.0) - fract).log10() < limit_ceil) {
        return input.with(component, value.abs().ceil() * sign);
    }
    return std::nullopt;
}

/// Best-effort exact-looking form of one component: "1/2", "2 + 2/3", "π",
/// "√5" or a trimmed integer. Returns nothing for values that are already
/// integers and for values no heuristic recognizes.
///
/// The checks inspect the rendered decimal digits, first match wins:
/// halves, repeating thirds, named constants, square roots of integers,
/// and finally round().
template <class M>
std::optional<std::string> estimate(const BasicNumber<M>& input, Component component) {
    const M& value = input.get(component);
    const M zero(0.0);
    const std::string value_string = decimal_string(value);
    const M fract = value.fract().abs();
    const M integer = value.trunc();

    if (fract == zero) return std::nullopt;

    const bool negative = value < zero;
    const std::string sign = negative ? "-" : "";
    const std::string unsigned_string =
        !value_string.empty() && value_string[0] == '-' ? value_string.substr(1) : value_string;

    // 0.5 -> 1/2
    // Renderings of 4 to 6 characters ("0.51") are never halves.
    if (unsigned_string.compare(0, 3, "0.5") == 0) {
        if (unsigned_string.size() == 3 ||
            (unsigned_string.size() > 6 && unsigned_string.compare(3, 2, "00") == 0)) {
            return sign + "1/2";
        }
    }

    // 1.3333333 -> 1 + 1/3
    const std::string fract_string = fract.to_fixed_string(kEstimateDigits);
    if (fract_string.size() >= 7) {
        const std::string first_five = fract_string.substr(2, 5);
        if (first_five == "33333" || first_five == "66666") {
            const std::string fraction = first_five == "33333" ? "1/3" : "2/3";
            if (integer == zero) return sign + fraction;
            return trim_zeroes(integer.to_fixed_string(0)) + (negative ? " - " : " + ") + fraction;
        }
    }

    // π, 2π/3, √2, ...
    if (unsigned_string.size() >= 8) {
        if (const char* constant = lookup_constant(std::string_view(unsigned_string).substr(0, 8))) {
            return sign + constant;
        }
    }

    // x² (nearly) an integer, but not a perfect square -> √x²
    BasicNumber<M> squared{value * value};
    if (auto rounded = round(squared, Component::Real)) squared = *rounded;
    if (squared.real.sqrt().fract() != zero && squared.real.fract() == zero) {
        return "√" + squared.real.to_fixed_string(0);
    }

    // 0.999999999 -> 1
    auto rounded = round(input, component);
    if (!rounded) return std::nullopt;
    return decimal_string(rounded->get(component));
}

} // namespace calcexpr
