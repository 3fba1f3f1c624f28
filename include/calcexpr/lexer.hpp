#pragma once
#include <string_view>
#include <vector>
#include "calcexpr/token.hpp"

namespace calcexpr {

class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}
    Token next();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }

    std::string_view s_;
    std::size_t i_{0};
};

// Tokenize the whole input. The result always ends with a TokKind::End token.
// Throws ParseError (InvalidCharacter) on characters outside the language.
std::vector<Token> lex(std::string_view input);

} // namespace calcexpr
