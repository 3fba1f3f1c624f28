#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include "calcexpr/token.hpp"

namespace calcexpr {

enum class ParseErrorKind {
    InvalidCharacter,
    UnexpectedToken,
    InvalidFunctionParameterList,
    NestingTooDeep,
};

struct ParseError : std::runtime_error {
    ParseError(ParseErrorKind kind, const std::string& what, std::size_t position,
               std::optional<TokKind> expected = std::nullopt)
        : std::runtime_error(what), kind(kind), position(position), expected(expected) {}

    ParseErrorKind kind;
    std::size_t position;            // token index (byte offset for InvalidCharacter)
    std::optional<TokKind> expected; // set for UnexpectedToken
};

struct EvalError : std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace calcexpr
