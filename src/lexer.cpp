#include "calcexpr/lexer.hpp"
#include "calcexpr/errors.hpp"
#include <cctype>

namespace calcexpr {

static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

// Digits end an identifier, so "sqrt64" lexes as "sqrt" "64".
static bool is_ident_char(char c) {
    return is_ident_start(c);
}

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

struct Symbol {
    std::string_view text;
    TokKind kind;
    const char* ident; // identifier text for TokKind::Ident symbols
};

// UTF-8 spellings accepted next to the ASCII ones.
static const Symbol kSymbols[] = {
    {"\xC3\x97",     TokKind::Star,  nullptr}, // ×
    {"\xC3\xB7",     TokKind::Slash, nullptr}, // ÷
    {"\xE2\x88\x92", TokKind::Minus, nullptr}, // −
    {"\xC2\xB0",     TokKind::Deg,   nullptr}, // °
    {"\xE2\x88\x9A", TokKind::Ident, "sqrt"},  // √
    {"\xCF\x80",     TokKind::Ident, "pi"},    // π
    {"\xCF\x84",     TokKind::Ident, "tau"},   // τ
    {"\xCF\x95",     TokKind::Ident, "phi"},   // ϕ
};

void Lexer::skip_ws() {
    while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

Token Lexer::next() {
    skip_ws();
    if (is_end()) return {TokKind::End};

    char c = s_[i_];

    switch (c) {
        case '+': ++i_; return {TokKind::Plus};
        case '-': ++i_; return {TokKind::Minus};
        case '*': ++i_; return {TokKind::Star};
        case '/': ++i_; return {TokKind::Slash};
        case '^': ++i_; return {TokKind::Power};
        case '(': ++i_; return {TokKind::LParen};
        case ')': ++i_; return {TokKind::RParen};
        case '|': ++i_; return {TokKind::Pipe};
        case ',': ++i_; return {TokKind::Comma};
        case '=': ++i_; return {TokKind::Assign};
        default: break;
    }

    for (const auto& sym : kSymbols) {
        if (s_.substr(i_, sym.text.size()) == sym.text) {
            i_ += sym.text.size();
            Token t{sym.kind};
            if (sym.ident) t.text = sym.ident;
            return t;
        }
    }

    if (is_ident_start(c)) {
        std::size_t start = i_++;
        while (!is_end() && is_ident_char(s_[i_])) ++i_;
        std::string name(s_.substr(start, i_ - start));
        if (name == "deg") return {TokKind::Deg, std::move(name)};
        if (name == "rad") return {TokKind::Rad, std::move(name)};
        return {TokKind::Ident, std::move(name)};
    }

    // Literal text is kept verbatim; the interpreter's number type parses it.
    if (is_digit(c) || c == '.') {
        std::size_t start = i_;
        bool seen_dot = false;
        while (!is_end()) {
            char d = s_[i_];
            if (d == '.') {
                if (seen_dot) break;
                seen_dot = true;
            } else if (!is_digit(d)) {
                break;
            }
            ++i_;
        }
        std::string text(s_.substr(start, i_ - start));
        if (text == ".") throw ParseError(ParseErrorKind::InvalidCharacter, "Invalid number: '.'", start);
        return {TokKind::Literal, std::move(text)};
    }

    throw ParseError(ParseErrorKind::InvalidCharacter,
                     std::string("Unexpected character: '") + c + "'", i_);
}

std::vector<Token> lex(std::string_view input) {
    Lexer lexer(input);
    std::vector<Token> tokens;
    for (;;) {
        tokens.push_back(lexer.next());
        if (tokens.back().kind == TokKind::End) break;
    }
    return tokens;
}

} // namespace calcexpr
