#include "calcexpr/magnitude.hpp"
#include "calcexpr/errors.hpp"

#include <cstdio>
#include <cstdlib>
#include <vector>

namespace calcexpr {

static std::string format_double(const char* fmt, int precision, double v) {
    const int n = std::snprintf(nullptr, 0, fmt, precision, v);
    if (n < 0) return {};
    std::vector<char> buf(static_cast<std::size_t>(n) + 1);
    std::snprintf(buf.data(), buf.size(), fmt, precision, v);
    return std::string(buf.data(), static_cast<std::size_t>(n));
}

Float Float::parse(std::string_view text) {
    const std::string s(text);
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (s.empty() || end != s.c_str() + s.size()) throw EvalError("Invalid number: " + s);
    return v;
}

std::string Float::to_string(int digits) const {
    return format_double("%.*g", digits, v_);
}

std::string Float::to_fixed_string(int decimals) const {
    return format_double("%.*f", decimals, v_);
}

} // namespace calcexpr
