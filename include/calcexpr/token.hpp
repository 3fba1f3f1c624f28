#pragma once
#include <string>

namespace calcexpr {

enum class TokKind {
    Literal,
    Ident,

    Plus, Minus, Star, Slash, Power,
    LParen, RParen,
    Pipe,
    Comma,
    Assign,

    // unit suffixes
    Deg, Rad,

    End,
};

struct Token {
    TokKind kind{TokKind::End};
    std::string text{}; // Literal digits / Ident name
};

inline bool is_unit(TokKind k) { return k == TokKind::Deg || k == TokKind::Rad; }

// Operator spelling ("+", "^", "deg") or a descriptive name ("identifier").
const char* to_string(TokKind k);

} // namespace calcexpr
