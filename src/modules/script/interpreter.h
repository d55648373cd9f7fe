// modules/script/interpreter.h
#ifndef LOOM_MODULES_SCRIPT_INTERPRETER_H
#define LOOM_MODULES_SCRIPT_INTERPRETER_H

#include "modules/script/ast.h"
#include "common/tools/tool_transport.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace loom::script {

struct InterpreterLimits {
    int64_t max_ops = 1'000'000;
    int max_call_depth = 64;
    int64_t max_collection_size = 100'000;
    int64_t max_string_bytes = 1 << 20;
};

// 脚本可访问的唯一宿主能力
struct HostBindings {
    std::function<ToolCallResult(const ToolName& tool, const Value& args)> call_tool;
};

struct ScriptOutcome {
    Value return_value;
    std::optional<std::string> summary; // set by summary()
    Value state_updates = Value::object();
    int64_t operations = 0;
    int64_t tool_calls = 0;
};

// Tree-walking interpreter over JSON values. Every evaluated expression and
// executed statement counts as one operation.
//
// Throws LoomError with CODE/RUNTIME_ERROR, BUDGET/OP_LIMIT, BUDGET/DEPTH_LIMIT,
// BUDGET/SIZE_LIMIT, or the error of a failed call().
class Interpreter {
public:
    Interpreter(InterpreterLimits limits, HostBindings host);

    ScriptOutcome run(const Program& program, const Value& params, const Value& state);

    int64_t operations() const { return ops_; }

private:
    enum class Flow { NORMAL, BREAK, CONTINUE, RETURN };

    struct Scope {
        std::unordered_map<std::string, Value> vars;
        Scope* parent = nullptr;
    };

    Flow exec(const Stmt& stmt, Scope& scope);
    Flow exec_block(const std::vector<StmtPtr>& body, Scope& scope);
    Value eval(const Expr& expr, Scope& scope);
    Value eval_binary(const BinaryExpr& expr, Scope& scope);
    Value eval_call(const CallExpr& expr, Scope& scope);
    Value call_user(const FnStmt& fn, std::vector<Value> args, int line);
    std::optional<Value> call_builtin(const std::string& name, const CallExpr& expr, Scope& scope);

    Value* lookup(const std::string& name, Scope& scope);
    Value& resolve_ref(const Expr& target, Scope& scope, bool create);
    void declare_function(const FnStmt& fn);

    void tick(int64_t n = 1);
    void check_size(const Value& v, int line) const;
    [[noreturn]] void runtime_error(int line, const std::string& message) const;

    InterpreterLimits limits_;
    HostBindings host_;
    std::unordered_map<std::string, const FnStmt*> functions_;
    Scope* globals_ = nullptr;
    Value return_value_;
    ScriptOutcome outcome_;
    int64_t ops_ = 0;
    int depth_ = 0;
};

// Non-string values render as compact JSON
std::string to_display_string(const Value& v);
bool truthy(const Value& v);

} // namespace loom::script

#endif // LOOM_MODULES_SCRIPT_INTERPRETER_H
