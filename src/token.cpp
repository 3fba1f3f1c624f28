#include "calcexpr/token.hpp"

namespace calcexpr {

const char* to_string(TokKind k) {
    switch (k) {
        case TokKind::Literal: return "number";
        case TokKind::Ident:   return "identifier";
        case TokKind::Plus:    return "+";
        case TokKind::Minus:   return "-";
        case TokKind::Star:    return "*";
        case TokKind::Slash:   return "/";
        case TokKind::Power:   return "^";
        case TokKind::LParen:  return "(";
        case TokKind::RParen:  return ")";
        case TokKind::Pipe:    return "|";
        case TokKind::Comma:   return ",";
        case TokKind::Assign:  return "=";
        case TokKind::Deg:     return "deg";
        case TokKind::Rad:     return "rad";
        case TokKind::End:     return "end of input";
    }
    return "?";
}

} // namespace calcexpr
