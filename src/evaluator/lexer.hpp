#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/crucible_errors.hpp"

namespace crucible::evaluator {

enum class TokenKind {
    Integer,
    String,
    Identifier,
    Plus,
    Assign,
    Comma,
    LeftParen,
    RightParen,
    Separator,  // ';' or newline
    End
};

struct Token {
    TokenKind kind = TokenKind::End;
    std::string text;  // identifier name or decoded string literal
    std::int64_t integer = 0;
    int line = 1;
};

// Splits cell code into tokens. Errors carry the line they occurred on.
core::errors::Result<std::vector<Token>> tokenize(const std::string& code);

// Source form of a string literal, quotes and escapes included.
std::string quote(const std::string& text);

}  // namespace crucible::evaluator
