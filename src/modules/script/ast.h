// modules/script/ast.h
#ifndef LOOM_MODULES_SCRIPT_AST_H
#define LOOM_MODULES_SCRIPT_AST_H

#include "core/types/context.h"
#include "modules/script/lexer.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace loom::script {

enum class ExprType {
    LITERAL,
    ARRAY,
    OBJECT,
    IDENT,
    UNARY,
    BINARY,
    CALL,
    MEMBER,
    INDEX
};

struct Expr {
    ExprType type;
    int line;

    Expr(ExprType t, int l) : type(t), line(l) {}
    virtual ~Expr() = default;
};

using ExprPtr = std::unique_ptr<Expr>;

struct LiteralExpr : Expr {
    Value value;
    LiteralExpr(Value v, int l) : Expr(ExprType::LITERAL, l), value(std::move(v)) {}
};

struct ArrayExpr : Expr {
    std::vector<ExprPtr> items;
    explicit ArrayExpr(int l) : Expr(ExprType::ARRAY, l) {}
};

struct ObjectExpr : Expr {
    std::vector<std::pair<std::string, ExprPtr>> entries;
    explicit ObjectExpr(int l) : Expr(ExprType::OBJECT, l) {}
};

struct IdentExpr : Expr {
    std::string name;
    IdentExpr(std::string n, int l) : Expr(ExprType::IDENT, l), name(std::move(n)) {}
};

struct UnaryExpr : Expr {
    TokenType op; // MINUS or NOT
    ExprPtr operand;
    UnaryExpr(TokenType o, ExprPtr e, int l) : Expr(ExprType::UNARY, l), op(o), operand(std::move(e)) {}
};

struct BinaryExpr : Expr {
    TokenType op;
    ExprPtr left;
    ExprPtr right;
    BinaryExpr(TokenType o, ExprPtr a, ExprPtr b, int l)
        : Expr(ExprType::BINARY, l), op(o), left(std::move(a)), right(std::move(b)) {}
};

// Only named functions can be called: builtins, host functions, fn declarations
struct CallExpr : Expr {
    std::string callee;
    std::vector<ExprPtr> args;
    CallExpr(std::string c, int l) : Expr(ExprType::CALL, l), callee(std::move(c)) {}
};

struct MemberExpr : Expr {
    ExprPtr object;
    std::string name;
    MemberExpr(ExprPtr o, std::string n, int l)
        : Expr(ExprType::MEMBER, l), object(std::move(o)), name(std::move(n)) {}
};

struct IndexExpr : Expr {
    ExprPtr object;
    ExprPtr index;
    IndexExpr(ExprPtr o, ExprPtr i, int l)
        : Expr(ExprType::INDEX, l), object(std::move(o)), index(std::move(i)) {}
};

enum class StmtType {
    LET,
    ASSIGN,
    EXPR,
    IF,
    WHILE,
    FOR_IN,
    BREAK,
    CONTINUE,
    RETURN,
    FN,
    BLOCK
};

struct Stmt {
    StmtType type;
    int line;

    Stmt(StmtType t, int l) : type(t), line(l) {}
    virtual ~Stmt() = default;
};

using StmtPtr = std::unique_ptr<Stmt>;

struct BlockStmt : Stmt {
    std::vector<StmtPtr> body;
    explicit BlockStmt(int l) : Stmt(StmtType::BLOCK, l) {}
};

struct LetStmt : Stmt {
    std::string name;
    ExprPtr value;
    LetStmt(std::string n, ExprPtr v, int l) : Stmt(StmtType::LET, l), name(std::move(n)), value(std::move(v)) {}
};

// target is an IDENT, MEMBER or INDEX expression
struct AssignStmt : Stmt {
    ExprPtr target;
    ExprPtr value;
    AssignStmt(ExprPtr t, ExprPtr v, int l) : Stmt(StmtType::ASSIGN, l), target(std::move(t)), value(std::move(v)) {}
};

struct ExprStmt : Stmt {
    ExprPtr expr;
    ExprStmt(ExprPtr e, int l) : Stmt(StmtType::EXPR, l), expr(std::move(e)) {}
};

struct IfStmt : Stmt {
    ExprPtr condition;
    StmtPtr then_branch;
    StmtPtr else_branch; // nullable
    explicit IfStmt(int l) : Stmt(StmtType::IF, l) {}
};

struct WhileStmt : Stmt {
    ExprPtr condition;
    StmtPtr body;
    explicit WhileStmt(int l) : Stmt(StmtType::WHILE, l) {}
};

struct ForInStmt : Stmt {
    std::string var;
    ExprPtr iterable;
    StmtPtr body;
    explicit ForInStmt(int l) : Stmt(StmtType::FOR_IN, l) {}
};

struct ReturnStmt : Stmt {
    ExprPtr value; // nullable
    explicit ReturnStmt(int l) : Stmt(StmtType::RETURN, l) {}
};

struct FnStmt : Stmt {
    std::string name;
    std::vector<std::string> params;
    std::shared_ptr<BlockStmt> body;
    explicit FnStmt(int l) : Stmt(StmtType::FN, l) {}
};

struct Program {
    std::vector<StmtPtr> body;
};

} // namespace loom::script

#endif // LOOM_MODULES_SCRIPT_AST_H
