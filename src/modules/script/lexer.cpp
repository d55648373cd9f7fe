// modules/script/lexer.cpp
#include "modules/script/lexer.h"
#include "core/types/error.h"
#include <cctype>
#include <unordered_map>

namespace loom::script {

namespace {

const std::unordered_map<std::string, TokenType>& keywords() {
    static const std::unordered_map<std::string, TokenType> table = {
        {"let", TokenType::LET},
        {"fn", TokenType::FN},
        {"if", TokenType::IF},
        {"else", TokenType::ELSE},
        {"while", TokenType::WHILE},
        {"for", TokenType::FOR},
        {"in", TokenType::IN},
        {"break", TokenType::BREAK},
        {"continue", TokenType::CONTINUE},
        {"return", TokenType::RETURN},
        {"true", TokenType::TRUE},
        {"false", TokenType::FALSE},
        {"null", TokenType::NULL_LIT},
    };
    return table;
}

[[noreturn]] void syntax_error(int line, const std::string& message) {
    throw LoomError(make_error(ErrorKind::CODE, codes::SYNTAX_ERROR,
                               "line " + std::to_string(line) + ": " + message));
}

} // namespace

std::string to_string(TokenType type) {
    switch (type) {
        case TokenType::NUMBER: return "number";
        case TokenType::STRING: return "string";
        case TokenType::IDENT: return "identifier";
        case TokenType::END: return "end of input";
        case TokenType::LPAREN: return "'('";
        case TokenType::RPAREN: return "')'";
        case TokenType::LBRACE: return "'{'";
        case TokenType::RBRACE: return "'}'";
        case TokenType::LBRACKET: return "'['";
        case TokenType::RBRACKET: return "']'";
        case TokenType::ASSIGN: return "'='";
        default: return "token";
    }
}

std::vector<Token> tokenize(std::string_view src) {
    std::vector<Token> tokens;
    int line = 1;
    size_t i = 0;

    auto push = [&](TokenType type, std::string text = {}) {
        tokens.push_back(Token{type, std::move(text), line});
    };

    while (i < src.size()) {
        char c = src[i];

        if (c == '\n') { ++line; ++i; continue; }
        if (std::isspace(static_cast<unsigned char>(c))) { ++i; continue; }

        // 注释: // 或 #
        if (c == '#' || (c == '/' && i + 1 < src.size() && src[i + 1] == '/')) {
            while (i < src.size() && src[i] != '\n') ++i;
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t start = i;
            while (i < src.size() && std::isdigit(static_cast<unsigned char>(src[i]))) ++i;
            if (i + 1 < src.size() && src[i] == '.' && std::isdigit(static_cast<unsigned char>(src[i + 1]))) {
                ++i;
                while (i < src.size() && std::isdigit(static_cast<unsigned char>(src[i]))) ++i;
            }
            push(TokenType::NUMBER, std::string(src.substr(start, i - start)));
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t start = i;
            while (i < src.size() && (std::isalnum(static_cast<unsigned char>(src[i])) || src[i] == '_')) ++i;
            std::string word(src.substr(start, i - start));
            auto kw = keywords().find(word);
            push(kw != keywords().end() ? kw->second : TokenType::IDENT, std::move(word));
            continue;
        }

        if (c == '"' || c == '\'') {
            char quote = c;
            int start_line = line;
            std::string value;
            ++i;
            bool closed = false;
            while (i < src.size()) {
                char ch = src[i++];
                if (ch == quote) { closed = true; break; }
                if (ch == '\n') ++line;
                if (ch == '\\' && i < src.size()) {
                    char esc = src[i++];
                    switch (esc) {
                        case 'n': value += '\n'; break;
                        case 't': value += '\t'; break;
                        case 'r': value += '\r'; break;
                        case '\\': value += '\\'; break;
                        case '"': value += '"'; break;
                        case '\'': value += '\''; break;
                        default: syntax_error(line, std::string("unknown escape \\") + esc);
                    }
                    continue;
                }
                value += ch;
            }
            if (!closed) syntax_error(start_line, "unterminated string");
            tokens.push_back(Token{TokenType::STRING, std::move(value), start_line});
            continue;
        }

        auto two = [&](char next) { return i + 1 < src.size() && src[i + 1] == next; };
        switch (c) {
            case '(': push(TokenType::LPAREN); ++i; break;
            case ')': push(TokenType::RPAREN); ++i; break;
            case '{': push(TokenType::LBRACE); ++i; break;
            case '}': push(TokenType::RBRACE); ++i; break;
            case '[': push(TokenType::LBRACKET); ++i; break;
            case ']': push(TokenType::RBRACKET); ++i; break;
            case ',': push(TokenType::COMMA); ++i; break;
            case ':': push(TokenType::COLON); ++i; break;
            case ';': push(TokenType::SEMICOLON); ++i; break;
            case '.': push(TokenType::DOT); ++i; break;
            case '+': push(TokenType::PLUS); ++i; break;
            case '-': push(TokenType::MINUS); ++i; break;
            case '*': push(TokenType::STAR); ++i; break;
            case '/': push(TokenType::SLASH); ++i; break;
            case '%': push(TokenType::PERCENT); ++i; break;
            case '=':
                if (two('=')) { push(TokenType::EQ); i += 2; } else { push(TokenType::ASSIGN); ++i; }
                break;
            case '!':
                if (two('=')) { push(TokenType::NE); i += 2; } else { push(TokenType::NOT); ++i; }
                break;
            case '<':
                if (two('=')) { push(TokenType::LE); i += 2; } else { push(TokenType::LT); ++i; }
                break;
            case '>':
                if (two('=')) { push(TokenType::GE); i += 2; } else { push(TokenType::GT); ++i; }
                break;
            case '&':
                if (!two('&')) syntax_error(line, "expected '&&'");
                push(TokenType::AND); i += 2;
                break;
            case '|':
                if (!two('|')) syntax_error(line, "expected '||'");
                push(TokenType::OR); i += 2;
                break;
            default:
                syntax_error(line, std::string("unexpected character '") + c + "'");
        }
    }
    push(TokenType::END);
    return tokens;
}

} // namespace loom::script
