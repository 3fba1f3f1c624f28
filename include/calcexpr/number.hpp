#pragma once
#include <string>
#include <utility>

#include "calcexpr/big_float.hpp"
#include "calcexpr/magnitude.hpp"

namespace calcexpr {

enum class Component { Real, Imaginary };

/// Complex value over magnitude type M, optionally tagged with the unit
/// suffix it was written with ("deg" / "rad"). The tag is informational.
template <class M>
struct BasicNumber {
    M real{};
    M imaginary{};
    std::string unit{};

    const M& get(Component c) const { return c == Component::Real ? real : imaginary; }

    // Copy with one component replaced; the other component and the unit are kept.
    BasicNumber with(Component c, M v) const {
        BasicNumber out = *this;
        (c == Component::Real ? out.real : out.imaginary) = std::move(v);
        return out;
    }

    bool has_imaginary() const { return imaginary != M(0.0); }
};

using Number = BasicNumber<Float>;
using BigNumber = BasicNumber<BigFloat>;

/// Display form: "3", "-1.5", "2 + 3i", "-i", "45 deg".
template <class M>
std::string format(const BasicNumber<M>& n, int digits = 10) {
    auto render = [digits](const M& v) {
        std::string s = v.to_string(digits);
        return s == "-0" ? std::string("0") : s;
    };

    const M zero(0.0);
    std::string out;
    if (!n.has_imaginary()) {
        out = render(n.real);
    } else {
        std::string im = render(n.imaginary.abs());
        if (im == "1") im.clear();
        const bool negative = n.imaginary < zero;
        if (n.real == zero) {
            out = (negative ? "-" : "") + im + "i";
        } else {
            out = render(n.real) + (negative ? " - " : " + ") + im + "i";
        }
    }
    if (!n.unit.empty()) out += " " + n.unit;
    return out;
}

} // namespace calcexpr
