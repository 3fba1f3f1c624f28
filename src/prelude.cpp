#include "calcexpr/prelude.hpp"

namespace calcexpr {

namespace {

struct Entry {
    std::string_view name;
    Builtin fn;
    std::size_t arity;
};

const Entry kBuiltins[] = {
    {"abs",   Builtin::Abs,   1},
    {"sqrt",  Builtin::Sqrt,  1},
    {"cbrt",  Builtin::Cbrt,  1},
    {"exp",   Builtin::Exp,   1},
    {"ln",    Builtin::Ln,    1},
    {"log",   Builtin::Log,   1},
    {"sin",   Builtin::Sin,   1},
    {"cos",   Builtin::Cos,   1},
    {"tan",   Builtin::Tan,   1},
    {"asin",  Builtin::Asin,  1},
    {"acos",  Builtin::Acos,  1},
    {"atan",  Builtin::Atan,  1},
    {"sinh",  Builtin::Sinh,  1},
    {"cosh",  Builtin::Cosh,  1},
    {"tanh",  Builtin::Tanh,  1},
    {"floor", Builtin::Floor, 1},
    {"ceil",  Builtin::Ceil,  1},
    {"round", Builtin::Round, 1},
    {"trunc", Builtin::Trunc, 1},
    {"fract", Builtin::Fract, 1},
    {"re",    Builtin::Re,    1},
    {"im",    Builtin::Im,    1},
    {"max",   Builtin::Max,   2},
    {"min",   Builtin::Min,   2},
};

} // namespace

std::optional<Builtin> find_builtin(std::string_view name) {
    for (const auto& e : kBuiltins) {
        if (e.name == name) return e.fn;
    }
    return std::nullopt;
}

std::size_t arity(Builtin fn) {
    for (const auto& e : kBuiltins) {
        if (e.fn == fn) return e.arity;
    }
    return 0;
}

} // namespace calcexpr
