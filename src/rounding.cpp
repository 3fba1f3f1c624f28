#include "calcexpr/rounding.hpp"

namespace calcexpr {

namespace {

struct Constant {
    std::string_view prefix;
    const char* name;
};

const Constant kConstants[] = {
    {"3.141592", "π"},
    {"2.718281", "e"},
    {"6.283185", "τ"},
    {"1.618033", "ϕ"},
    {"1.414213", "√2"},
    {"1.732050", "√3"},
    {"0.707106", "√2/2"},
    {"0.866025", "√3/2"},
    // common angles in radians
    {"0.523598", "π/6"},
    {"0.785398", "π/4"},
    {"1.047197", "π/3"},
    {"1.570796", "π/2"},
    {"2.094395", "2π/3"},
    {"2.356194", "3π/4"},
    {"2.617993", "5π/6"},
    {"3.665191", "7π/6"},
    {"3.926990", "5π/4"},
    {"4.188790", "4π/3"},
    {"4.712388", "3π/2"},
    {"5.235987", "5π/3"},
    {"5.497787", "7π/4"},
    {"5.759586", "11π/6"},
};

} // namespace

std::string trim_zeroes(std::string_view input) {
    if (input.find('.') == std::string_view::npos) return std::string(input);

    std::size_t end = input.size();
    while (end > 0 && input[end - 1] == '0') --end;
    if (end > 0 && input[end - 1] == '.') --end;
    return std::string(input.substr(0, end));
}

const char* lookup_constant(std::string_view prefix) {
    for (const auto& c : kConstants) {
        if (c.prefix == prefix) return c.name;
    }
    return nullptr;
}

} // namespace calcexpr
