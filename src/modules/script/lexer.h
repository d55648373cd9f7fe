// modules/script/lexer.h
#ifndef LOOM_MODULES_SCRIPT_LEXER_H
#define LOOM_MODULES_SCRIPT_LEXER_H

#include <string>
#include <string_view>
#include <vector>

namespace loom::script {

enum class TokenType {
    NUMBER,
    STRING,
    IDENT,
    // keywords
    LET, FN, IF, ELSE, WHILE, FOR, IN, BREAK, CONTINUE, RETURN, TRUE, FALSE, NULL_LIT,
    // punctuation
    LPAREN, RPAREN, LBRACE, RBRACE, LBRACKET, RBRACKET,
    COMMA, COLON, SEMICOLON, DOT,
    ASSIGN, EQ, NE, LT, LE, GT, GE,
    PLUS, MINUS, STAR, SLASH, PERCENT,
    AND, OR, NOT,
    END
};

std::string to_string(TokenType type);

struct Token {
    TokenType type;
    std::string text; // identifier name, decoded string literal, or number text
    int line = 1;
};

// Throws LoomError(CODE/SYNTAX_ERROR) on an unknown character or an
// unterminated string
std::vector<Token> tokenize(std::string_view source);

} // namespace loom::script

#endif // LOOM_MODULES_SCRIPT_LEXER_H
