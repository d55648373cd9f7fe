// modules/script/parser.cpp
#include "modules/script/parser.h"
#include "core/types/error.h"
#include <stdexcept>

namespace loom::script {

namespace {

// 限制语法嵌套深度，防止解析器栈溢出
struct NestingGuard {
    int& depth;
    NestingGuard(int& d, int line) : depth(d) {
        if (++depth > Parser::kMaxNesting) {
            throw LoomError(make_error(ErrorKind::CODE, codes::SYNTAX_ERROR,
                                       "line " + std::to_string(line) + ": nesting too deep"));
        }
    }
    ~NestingGuard() { --depth; }
};

bool is_assignable(const Expr& e) {
    return e.type == ExprType::IDENT || e.type == ExprType::MEMBER || e.type == ExprType::INDEX;
}

} // namespace

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != TokenType::END) {
        tokens_.push_back(Token{TokenType::END, "", tokens_.empty() ? 1 : tokens_.back().line});
    }
}

const Token& Parser::advance() {
    const Token& t = tokens_[pos_];
    if (t.type != TokenType::END) ++pos_;
    return t;
}

bool Parser::match(TokenType type) {
    if (!check(type)) return false;
    advance();
    return true;
}

const Token& Parser::expect(TokenType type, const char* what) {
    if (!check(type)) {
        fail(std::string("expected ") + what);
    }
    return advance();
}

void Parser::skip_semicolon() {
    while (match(TokenType::SEMICOLON)) {}
}

void Parser::fail(const std::string& message) const {
    throw LoomError(make_error(ErrorKind::CODE, codes::SYNTAX_ERROR,
                               "line " + std::to_string(peek().line) + ": " + message));
}

Program Parser::parse_program() {
    Program program;
    skip_semicolon();
    while (!check(TokenType::END)) {
        program.body.push_back(statement());
        skip_semicolon();
    }
    return program;
}

std::unique_ptr<BlockStmt> Parser::block() {
    int line = expect(TokenType::LBRACE, "'{'").line;
    auto blk = std::make_unique<BlockStmt>(line);
    skip_semicolon();
    while (!check(TokenType::RBRACE)) {
        if (check(TokenType::END)) fail("unterminated block");
        blk->body.push_back(statement());
        skip_semicolon();
    }
    advance();
    return blk;
}

StmtPtr Parser::if_statement() {
    int line = advance().line; // 'if'
    auto stmt = std::make_unique<IfStmt>(line);
    stmt->condition = expression();
    stmt->then_branch = block();
    if (match(TokenType::ELSE)) {
        if (check(TokenType::IF)) {
            stmt->else_branch = if_statement();
        } else {
            stmt->else_branch = block();
        }
    }
    return stmt;
}

StmtPtr Parser::statement() {
    NestingGuard guard(depth_, peek().line);
    const Token& tok = peek();
    int line = tok.line;

    switch (tok.type) {
        case TokenType::LET: {
            advance();
            std::string name = expect(TokenType::IDENT, "variable name after 'let'").text;
            expect(TokenType::ASSIGN, "'=' in let");
            auto value = expression();
            skip_semicolon();
            return std::make_unique<LetStmt>(std::move(name), std::move(value), line);
        }
        case TokenType::FN: {
            advance();
            auto fn = std::make_unique<FnStmt>(line);
            fn->name = expect(TokenType::IDENT, "function name").text;
            expect(TokenType::LPAREN, "'(' after function name");
            if (!check(TokenType::RPAREN)) {
                do {
                    fn->params.push_back(expect(TokenType::IDENT, "parameter name").text);
                } while (match(TokenType::COMMA));
            }
            expect(TokenType::RPAREN, "')'");
            fn->body = std::shared_ptr<BlockStmt>(block().release());
            return fn;
        }
        case TokenType::IF:
            return if_statement();
        case TokenType::WHILE: {
            advance();
            auto stmt = std::make_unique<WhileStmt>(line);
            stmt->condition = expression();
            stmt->body = block();
            return stmt;
        }
        case TokenType::FOR: {
            advance();
            auto stmt = std::make_unique<ForInStmt>(line);
            stmt->var = expect(TokenType::IDENT, "loop variable").text;
            expect(TokenType::IN, "'in'");
            stmt->iterable = expression();
            stmt->body = block();
            return stmt;
        }
        case TokenType::BREAK:
            advance();
            skip_semicolon();
            return std::make_unique<Stmt>(StmtType::BREAK, line);
        case TokenType::CONTINUE:
            advance();
            skip_semicolon();
            return std::make_unique<Stmt>(StmtType::CONTINUE, line);
        case TokenType::RETURN: {
            advance();
            auto stmt = std::make_unique<ReturnStmt>(line);
            if (!check(TokenType::SEMICOLON) && !check(TokenType::RBRACE) && !check(TokenType::END)) {
                stmt->value = expression();
            }
            skip_semicolon();
            return stmt;
        }
        case TokenType::LBRACE:
            return block();
        default:
            break;
    }

    auto expr = expression();
    if (match(TokenType::ASSIGN)) {
        if (!is_assignable(*expr)) {
            fail("invalid assignment target");
        }
        auto value = expression();
        skip_semicolon();
        return std::make_unique<AssignStmt>(std::move(expr), std::move(value), line);
    }
    skip_semicolon();
    return std::make_unique<ExprStmt>(std::move(expr), line);
}

ExprPtr Parser::expression() {
    NestingGuard guard(depth_, peek().line);
    return logical_or();
}

ExprPtr Parser::logical_or() {
    auto left = logical_and();
    while (check(TokenType::OR)) {
        int line = advance().line;
        left = std::make_unique<BinaryExpr>(TokenType::OR, std::move(left), logical_and(), line);
    }
    return left;
}

ExprPtr Parser::logical_and() {
    auto left = equality();
    while (check(TokenType::AND)) {
        int line = advance().line;
        left = std::make_unique<BinaryExpr>(TokenType::AND, std::move(left), equality(), line);
    }
    return left;
}

ExprPtr Parser::equality() {
    auto left = comparison();
    while (check(TokenType::EQ) || check(TokenType::NE)) {
        const Token& op = advance();
        left = std::make_unique<BinaryExpr>(op.type, std::move(left), comparison(), op.line);
    }
    return left;
}

ExprPtr Parser::comparison() {
    auto left = additive();
    while (check(TokenType::LT) || check(TokenType::LE) || check(TokenType::GT) || check(TokenType::GE)) {
        const Token& op = advance();
        left = std::make_unique<BinaryExpr>(op.type, std::move(left), additive(), op.line);
    }
    return left;
}

ExprPtr Parser::additive() {
    auto left = multiplicative();
    while (check(TokenType::PLUS) || check(TokenType::MINUS)) {
        const Token& op = advance();
        left = std::make_unique<BinaryExpr>(op.type, std::move(left), multiplicative(), op.line);
    }
    return left;
}

ExprPtr Parser::multiplicative() {
    auto left = unary();
    while (check(TokenType::STAR) || check(TokenType::SLASH) || check(TokenType::PERCENT)) {
        const Token& op = advance();
        left = std::make_unique<BinaryExpr>(op.type, std::move(left), unary(), op.line);
    }
    return left;
}

ExprPtr Parser::unary() {
    if (check(TokenType::MINUS) || check(TokenType::NOT)) {
        NestingGuard guard(depth_, peek().line);
        const Token& op = advance();
        return std::make_unique<UnaryExpr>(op.type, unary(), op.line);
    }
    return postfix();
}

ExprPtr Parser::postfix() {
    auto expr = primary();
    while (true) {
        if (check(TokenType::DOT)) {
            int line = advance().line;
            std::string name = expect(TokenType::IDENT, "member name after '.'").text;
            expr = std::make_unique<MemberExpr>(std::move(expr), std::move(name), line);
        } else if (check(TokenType::LBRACKET)) {
            int line = advance().line;
            auto index = expression();
            expect(TokenType::RBRACKET, "']'");
            expr = std::make_unique<IndexExpr>(std::move(expr), std::move(index), line);
        } else {
            return expr;
        }
    }
}

ExprPtr Parser::primary() {
    const Token& tok = advance();
    switch (tok.type) {
        case TokenType::NUMBER: {
            if (tok.text.find('.') != std::string::npos) {
                return std::make_unique<LiteralExpr>(Value(std::stod(tok.text)), tok.line);
            }
            try {
                return std::make_unique<LiteralExpr>(Value(std::stoll(tok.text)), tok.line);
            } catch (const std::out_of_range&) {
                return std::make_unique<LiteralExpr>(Value(std::stod(tok.text)), tok.line);
            }
        }
        case TokenType::STRING:
            return std::make_unique<LiteralExpr>(Value(tok.text), tok.line);
        case TokenType::TRUE:
            return std::make_unique<LiteralExpr>(Value(true), tok.line);
        case TokenType::FALSE:
            return std::make_unique<LiteralExpr>(Value(false), tok.line);
        case TokenType::NULL_LIT:
            return std::make_unique<LiteralExpr>(Value(nullptr), tok.line);
        case TokenType::IDENT: {
            if (check(TokenType::LPAREN)) {
                advance();
                auto call = std::make_unique<CallExpr>(tok.text, tok.line);
                if (!check(TokenType::RPAREN)) {
                    do {
                        call->args.push_back(expression());
                    } while (match(TokenType::COMMA));
                }
                expect(TokenType::RPAREN, "')' after arguments");
                return call;
            }
            return std::make_unique<IdentExpr>(tok.text, tok.line);
        }
        case TokenType::LPAREN: {
            auto inner = expression();
            expect(TokenType::RPAREN, "')'");
            return inner;
        }
        case TokenType::LBRACKET: {
            auto arr = std::make_unique<ArrayExpr>(tok.line);
            if (!check(TokenType::RBRACKET)) {
                do {
                    if (check(TokenType::RBRACKET)) break; // trailing comma
                    arr->items.push_back(expression());
                } while (match(TokenType::COMMA));
            }
            expect(TokenType::RBRACKET, "']'");
            return arr;
        }
        case TokenType::LBRACE: {
            auto obj = std::make_unique<ObjectExpr>(tok.line);
            if (!check(TokenType::RBRACE)) {
                do {
                    if (check(TokenType::RBRACE)) break;
                    const Token& key = advance();
                    if (key.type != TokenType::IDENT && key.type != TokenType::STRING) {
                        fail("object key must be an identifier or string");
                    }
                    expect(TokenType::COLON, "':' after object key");
                    obj->entries.emplace_back(key.text, expression());
                } while (match(TokenType::COMMA));
            }
            expect(TokenType::RBRACE, "'}'");
            return obj;
        }
        default:
            if (tok.type != TokenType::END) --pos_;
            fail("unexpected " + (tok.text.empty() ? to_string(tok.type) : "'" + tok.text + "'"));
    }
}

Program parse_source(std::string_view source) {
    Parser parser(tokenize(source));
    return parser.parse_program();
}

} // namespace loom::script
