// modules/script/parser.h
#ifndef LOOM_MODULES_SCRIPT_PARSER_H
#define LOOM_MODULES_SCRIPT_PARSER_H

#include "modules/script/ast.h"
#include "modules/script/lexer.h"
#include <string_view>
#include <vector>

namespace loom::script {

class Parser {
public:
    static constexpr int kMaxNesting = 200;

    explicit Parser(std::vector<Token> tokens);

    // Throws LoomError(CODE/SYNTAX_ERROR)
    Program parse_program();

private:
    StmtPtr statement();
    std::unique_ptr<BlockStmt> block();
    StmtPtr if_statement();

    ExprPtr expression();
    ExprPtr logical_or();
    ExprPtr logical_and();
    ExprPtr equality();
    ExprPtr comparison();
    ExprPtr additive();
    ExprPtr multiplicative();
    ExprPtr unary();
    ExprPtr postfix();
    ExprPtr primary();

    const Token& peek() const { return tokens_[pos_]; }
    const Token& advance();
    bool check(TokenType type) const { return peek().type == type; }
    bool match(TokenType type);
    const Token& expect(TokenType type, const char* what);
    void skip_semicolon();
    [[noreturn]] void fail(const std::string& message) const;

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    int depth_ = 0;
};

// tokenize + parse
Program parse_source(std::string_view source);

} // namespace loom::script

#endif // LOOM_MODULES_SCRIPT_PARSER_H
