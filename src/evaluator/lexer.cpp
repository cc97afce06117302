#include "evaluator/lexer.hpp"

#include <cctype>
#include <charconv>

namespace crucible::evaluator {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;

namespace {

CrucibleError syntax_error(const int line, const std::string& message) {
    return CrucibleError{ErrorCategory::Input,
                         std::to_string(line) + ": syntax error: " + message,
                         "syntax_error"};
}

bool is_identifier_start(const char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace

core::errors::Result<std::vector<Token>> tokenize(const std::string& code) {
    std::vector<Token> tokens;
    int line = 1;
    std::size_t i = 0;

    while (i < code.size()) {
        const char c = code[i];

        if (c == '\n') {
            tokens.push_back(Token{TokenKind::Separator, "", 0, line});
            ++line;
            ++i;
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r') {
            ++i;
            continue;
        }
        if (c == '#') {
            while (i < code.size() && code[i] != '\n') {
                ++i;
            }
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c))) {
            const std::size_t start = i;
            while (i < code.size() && std::isdigit(static_cast<unsigned char>(code[i]))) {
                ++i;
            }
            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(code.data() + start, code.data() + i, value);
            if (ec != std::errc()) {
                return syntax_error(line, "integer literal out of range");
            }
            tokens.push_back(Token{TokenKind::Integer, code.substr(start, i - start), value, line});
            continue;
        }

        if (is_identifier_start(c)) {
            const std::size_t start = i;
            while (i < code.size() && is_identifier_char(code[i])) {
                ++i;
            }
            tokens.push_back(Token{TokenKind::Identifier, code.substr(start, i - start), 0, line});
            continue;
        }

        if (c == '"') {
            std::string text;
            ++i;
            bool closed = false;
            while (i < code.size()) {
                const char ch = code[i++];
                if (ch == '"') {
                    closed = true;
                    break;
                }
                if (ch == '\n') {
                    break;
                }
                if (ch == '\\' && i < code.size()) {
                    const char escaped = code[i++];
                    switch (escaped) {
                        case 'n': text += '\n'; break;
                        case 't': text += '\t'; break;
                        case '"': text += '"'; break;
                        case '\\': text += '\\'; break;
                        default:
                            return syntax_error(line, std::string("unknown escape \\") + escaped);
                    }
                    continue;
                }
                text += ch;
            }
            if (!closed) {
                return syntax_error(line, "unterminated string literal");
            }
            tokens.push_back(Token{TokenKind::String, text, 0, line});
            continue;
        }

        TokenKind kind;
        switch (c) {
            case '+': kind = TokenKind::Plus; break;
            case '=': kind = TokenKind::Assign; break;
            case ',': kind = TokenKind::Comma; break;
            case '(': kind = TokenKind::LeftParen; break;
            case ')': kind = TokenKind::RightParen; break;
            case ';': kind = TokenKind::Separator; break;
            default:
                return syntax_error(line, std::string("unexpected character '") + c + "'");
        }
        tokens.push_back(Token{kind, std::string(1, c), 0, line});
        ++i;
    }

    tokens.push_back(Token{TokenKind::End, "", 0, line});
    return tokens;
}

std::string quote(const std::string& text) {
    std::string out = "\"";
    for (const char c : text) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            default: out += c;
        }
    }
    out += '"';
    return out;
}

}  // namespace crucible::evaluator
