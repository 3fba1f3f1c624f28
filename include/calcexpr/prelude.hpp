#pragma once
#include <cstddef>
#include <optional>
#include <string_view>

namespace calcexpr {

// Built-in functions known to both the parser (for juxtaposed calls such as
// "sqrt64") and the interpreter.
enum class Builtin {
    Abs, Sqrt, Cbrt, Exp, Ln, Log,
    Sin, Cos, Tan, Asin, Acos, Atan, Sinh, Cosh, Tanh,
    Floor, Ceil, Round, Trunc, Fract,
    Re, Im,
    Max, Min,
};

std::optional<Builtin> find_builtin(std::string_view name);
std::size_t arity(Builtin fn);

inline bool is_builtin_function(std::string_view name) { return find_builtin(name).has_value(); }

} // namespace calcexpr
