// modules/script/interpreter.cpp
#include "modules/script/interpreter.h"
#include "core/types/error.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace loom::script {

namespace {

const std::unordered_set<std::string>& reserved_functions() {
    static const std::unordered_set<std::string> names = {
        "len", "push", "pop", "keys", "values", "contains", "str", "num", "type",
        "range", "sort", "join", "split", "lower", "upper", "slice", "min", "max",
        "abs", "floor", "call", "try_call", "set_state", "summary"
    };
    return names;
}

bool is_int(const Value& v) { return v.is_number_integer(); }

int64_t as_int(const Value& v) {
    if (v.is_number_unsigned()) {
        auto u = v.get<uint64_t>();
        return u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
                   ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(u);
    }
    if (v.is_number_integer()) return v.get<int64_t>();
    return static_cast<int64_t>(v.get<double>());
}

double as_double(const Value& v) { return v.get<double>(); }

std::string type_name(const Value& v) {
    if (v.is_null()) return "null";
    if (v.is_boolean()) return "bool";
    if (v.is_number()) return "number";
    if (v.is_string()) return "string";
    if (v.is_array()) return "array";
    return "object";
}

} // namespace

std::string to_display_string(const Value& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

bool truthy(const Value& v) {
    if (v.is_null()) return false;
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number_integer()) return as_int(v) != 0;
    if (v.is_number()) return as_double(v) != 0.0;
    if (v.is_string()) return !v.get_ref<const std::string&>().empty();
    return !v.empty();
}

Interpreter::Interpreter(InterpreterLimits limits, HostBindings host)
    : limits_(limits), host_(std::move(host)) {}

void Interpreter::tick(int64_t n) {
    if (n < 0) {
        throw LoomError(make_error(ErrorKind::CODE, codes::RUNTIME_ERROR, "negative operation charge"));
    }
    // 计数饱和，不回绕
    if (__builtin_add_overflow(ops_, n, &ops_)) ops_ = std::numeric_limits<int64_t>::max();
    if (limits_.max_ops >= 0 && ops_ > limits_.max_ops) {
        throw LoomError(make_error(ErrorKind::BUDGET, codes::OP_LIMIT,
                                   "operation limit of " + std::to_string(limits_.max_ops) + " exceeded"));
    }
}

void Interpreter::check_size(const Value& v, int line) const {
    if (v.is_string()) {
        if (static_cast<int64_t>(v.get_ref<const std::string&>().size()) > limits_.max_string_bytes) {
            throw LoomError(make_error(ErrorKind::BUDGET, codes::SIZE_LIMIT,
                                       "line " + std::to_string(line) + ": string exceeds " +
                                       std::to_string(limits_.max_string_bytes) + " bytes"));
        }
    } else if (v.is_array() || v.is_object()) {
        if (static_cast<int64_t>(v.size()) > limits_.max_collection_size) {
            throw LoomError(make_error(ErrorKind::BUDGET, codes::SIZE_LIMIT,
                                       "line " + std::to_string(line) + ": collection exceeds " +
                                       std::to_string(limits_.max_collection_size) + " elements"));
        }
    }
}

void Interpreter::runtime_error(int line, const std::string& message) const {
    throw LoomError(make_error(ErrorKind::CODE, codes::RUNTIME_ERROR,
                               "line " + std::to_string(line) + ": " + message));
}

ScriptOutcome Interpreter::run(const Program& program, const Value& params, const Value& state) {
    outcome_ = ScriptOutcome{};
    functions_.clear();
    ops_ = 0;
    depth_ = 0;
    return_value_ = nullptr;

    Scope globals;
    globals.vars["params"] = params.is_null() ? Value::object() : params;
    globals.vars["state"] = state.is_null() ? Value::object() : state;
    globals_ = &globals;

    // 顶层函数声明提前注册
    for (const auto& stmt : program.body) {
        if (stmt->type == StmtType::FN) {
            declare_function(static_cast<const FnStmt&>(*stmt));
        }
    }

    Flow flow = exec_block(program.body, globals);
    if (flow == Flow::BREAK || flow == Flow::CONTINUE) {
        runtime_error(0, "break/continue outside of a loop");
    }
    globals_ = nullptr;

    outcome_.return_value = (flow == Flow::RETURN) ? std::move(return_value_) : Value();
    outcome_.operations = ops_;
    return std::move(outcome_);
}

void Interpreter::declare_function(const FnStmt& fn) {
    if (reserved_functions().count(fn.name)) {
        runtime_error(fn.line, "cannot redefine builtin '" + fn.name + "'");
    }
    functions_[fn.name] = &fn;
}

Value* Interpreter::lookup(const std::string& name, Scope& scope) {
    for (Scope* s = &scope; s != nullptr; s = s->parent) {
        auto it = s->vars.find(name);
        if (it != s->vars.end()) return &it->second;
    }
    return nullptr;
}

Interpreter::Flow Interpreter::exec_block(const std::vector<StmtPtr>& body, Scope& scope) {
    for (const auto& stmt : body) {
        Flow flow = exec(*stmt, scope);
        if (flow != Flow::NORMAL) return flow;
    }
    return Flow::NORMAL;
}

Interpreter::Flow Interpreter::exec(const Stmt& stmt, Scope& scope) {
    tick();
    switch (stmt.type) {
        case StmtType::LET: {
            const auto& s = static_cast<const LetStmt&>(stmt);
            scope.vars[s.name] = eval(*s.value, scope);
            return Flow::NORMAL;
        }
        case StmtType::ASSIGN: {
            const auto& s = static_cast<const AssignStmt&>(stmt);
            Value value = eval(*s.value, scope);
            Value& target = resolve_ref(*s.target, scope, true);
            target = std::move(value);
            return Flow::NORMAL;
        }
        case StmtType::EXPR:
            eval(*static_cast<const ExprStmt&>(stmt).expr, scope);
            return Flow::NORMAL;
        case StmtType::IF: {
            const auto& s = static_cast<const IfStmt&>(stmt);
            if (truthy(eval(*s.condition, scope))) {
                return exec(*s.then_branch, scope);
            }
            if (s.else_branch) {
                return exec(*s.else_branch, scope);
            }
            return Flow::NORMAL;
        }
        case StmtType::WHILE: {
            const auto& s = static_cast<const WhileStmt&>(stmt);
            while (truthy(eval(*s.condition, scope))) {
                Flow flow = exec(*s.body, scope);
                if (flow == Flow::BREAK) break;
                if (flow == Flow::RETURN) return flow;
            }
            return Flow::NORMAL;
        }
        case StmtType::FOR_IN: {
            const auto& s = static_cast<const ForInStmt&>(stmt);
            Value iterable = eval(*s.iterable, scope);
            std::vector<Value> items;
            if (iterable.is_array()) {
                items.assign(iterable.begin(), iterable.end());
            } else if (iterable.is_object()) {
                for (auto it = iterable.begin(); it != iterable.end(); ++it) items.emplace_back(it.key());
            } else if (iterable.is_string()) {
                for (char c : iterable.get_ref<const std::string&>()) items.emplace_back(std::string(1, c));
            } else {
                runtime_error(stmt.line, "cannot iterate over " + type_name(iterable));
            }
            for (auto& item : items) {
                Scope loop_scope;
                loop_scope.parent = &scope;
                loop_scope.vars[s.var] = std::move(item);
                Flow flow = exec(*s.body, loop_scope);
                if (flow == Flow::BREAK) break;
                if (flow == Flow::RETURN) return flow;
            }
            return Flow::NORMAL;
        }
        case StmtType::BREAK:
            return Flow::BREAK;
        case StmtType::CONTINUE:
            return Flow::CONTINUE;
        case StmtType::RETURN: {
            const auto& s = static_cast<const ReturnStmt&>(stmt);
            return_value_ = s.value ? eval(*s.value, scope) : Value();
            return Flow::RETURN;
        }
        case StmtType::FN:
            declare_function(static_cast<const FnStmt&>(stmt));
            return Flow::NORMAL;
        case StmtType::BLOCK: {
            Scope inner;
            inner.parent = &scope;
            return exec_block(static_cast<const BlockStmt&>(stmt).body, inner);
        }
    }
    return Flow::NORMAL;
}

Value& Interpreter::resolve_ref(const Expr& target, Scope& scope, bool create) {
    switch (target.type) {
        case ExprType::IDENT: {
            const auto& e = static_cast<const IdentExpr&>(target);
            Value* v = lookup(e.name, scope);
            if (!v) runtime_error(e.line, "undefined variable '" + e.name + "'");
            return *v;
        }
        case ExprType::MEMBER: {
            const auto& e = static_cast<const MemberExpr&>(target);
            Value& obj = resolve_ref(*e.object, scope, create);
            if (obj.is_null() && create) obj = Value::object();
            if (!obj.is_object()) runtime_error(e.line, "cannot set member on " + type_name(obj));
            if (!obj.contains(e.name) && !create) {
                runtime_error(e.line, "no member '" + e.name + "'");
            }
            Value& slot = obj[e.name];
            check_size(obj, e.line);
            return slot;
        }
        case ExprType::INDEX: {
            const auto& e = static_cast<const IndexExpr&>(target);
            Value index = eval(*e.index, scope);
            Value& obj = resolve_ref(*e.object, scope, create);
            if (obj.is_array()) {
                if (!index.is_number_integer()) runtime_error(e.line, "array index must be an integer");
                int64_t i = as_int(index);
                int64_t size = static_cast<int64_t>(obj.size());
                if (i == size && create) {
                    obj.push_back(nullptr);
                    check_size(obj, e.line);
                } else if (i < 0 || i >= size) {
                    runtime_error(e.line, "index " + std::to_string(i) + " out of range");
                }
                return obj[static_cast<size_t>(i)];
            }
            if (obj.is_null() && create) obj = Value::object();
            if (obj.is_object()) {
                if (!index.is_string()) runtime_error(e.line, "object key must be a string");
                const auto& key = index.get_ref<const std::string&>();
                if (!obj.contains(key) && !create) runtime_error(e.line, "no key '" + key + "'");
                Value& slot = obj[key];
                check_size(obj, e.line);
                return slot;
            }
            runtime_error(e.line, "cannot index into " + type_name(obj));
        }
        default:
            runtime_error(target.line, "expression is not assignable");
    }
}

Value Interpreter::eval(const Expr& expr, Scope& scope) {
    tick();
    switch (expr.type) {
        case ExprType::LITERAL:
            return static_cast<const LiteralExpr&>(expr).value;
        case ExprType::ARRAY: {
            const auto& e = static_cast<const ArrayExpr&>(expr);
            Value arr = Value::array();
            for (const auto& item : e.items) {
                arr.push_back(eval(*item, scope));
                check_size(arr, e.line);
            }
            return arr;
        }
        case ExprType::OBJECT: {
            const auto& e = static_cast<const ObjectExpr&>(expr);
            Value obj = Value::object();
            for (const auto& [key, value] : e.entries) {
                obj[key] = eval(*value, scope);
                check_size(obj, e.line);
            }
            return obj;
        }
        case ExprType::IDENT: {
            const auto& e = static_cast<const IdentExpr&>(expr);
            Value* v = lookup(e.name, scope);
            if (!v) runtime_error(e.line, "undefined variable '" + e.name + "'");
            return *v;
        }
        case ExprType::UNARY: {
            const auto& e = static_cast<const UnaryExpr&>(expr);
            Value v = eval(*e.operand, scope);
            if (e.op == TokenType::NOT) return !truthy(v);
            if (!v.is_number()) runtime_error(e.line, "unary '-' needs a number, got " + type_name(v));
            if (is_int(v)) {
                int64_t out;
                if (!__builtin_sub_overflow(int64_t{0}, as_int(v), &out)) return out;
            }
            return -as_double(v);
        }
        case ExprType::BINARY:
            return eval_binary(static_cast<const BinaryExpr&>(expr), scope);
        case ExprType::CALL:
            return eval_call(static_cast<const CallExpr&>(expr), scope);
        case ExprType::MEMBER: {
            const auto& e = static_cast<const MemberExpr&>(expr);
            Value obj = eval(*e.object, scope);
            if (!obj.is_object()) runtime_error(e.line, "cannot read member '" + e.name + "' of " + type_name(obj));
            auto it = obj.find(e.name);
            return it == obj.end() ? Value() : *it;
        }
        case ExprType::INDEX: {
            const auto& e = static_cast<const IndexExpr&>(expr);
            Value obj = eval(*e.object, scope);
            Value index = eval(*e.index, scope);
            if (obj.is_array() || obj.is_string()) {
                if (!index.is_number_integer()) runtime_error(e.line, "index must be an integer");
                int64_t i = as_int(index);
                int64_t size = obj.is_array() ? static_cast<int64_t>(obj.size())
                                              : static_cast<int64_t>(obj.get_ref<const std::string&>().size());
                if (i < 0 || i >= size) runtime_error(e.line, "index " + std::to_string(i) + " out of range");
                if (obj.is_array()) return obj[static_cast<size_t>(i)];
                return std::string(1, obj.get_ref<const std::string&>()[static_cast<size_t>(i)]);
            }
            if (obj.is_object()) {
                if (!index.is_string()) runtime_error(e.line, "object key must be a string");
                auto it = obj.find(index.get<std::string>());
                return it == obj.end() ? Value() : *it;
            }
            runtime_error(e.line, "cannot index into " + type_name(obj));
        }
    }
    return Value();
}

Value Interpreter::eval_binary(const BinaryExpr& e, Scope& scope) {
    if (e.op == TokenType::AND) {
        return truthy(eval(*e.left, scope)) && truthy(eval(*e.right, scope));
    }
    if (e.op == TokenType::OR) {
        return truthy(eval(*e.left, scope)) || truthy(eval(*e.right, scope));
    }

    Value a = eval(*e.left, scope);
    Value b = eval(*e.right, scope);

    switch (e.op) {
        case TokenType::EQ: return a == b;
        case TokenType::NE: return a != b;
        case TokenType::LT:
        case TokenType::LE:
        case TokenType::GT:
        case TokenType::GE: {
            bool both_numbers = a.is_number() && b.is_number();
            bool both_strings = a.is_string() && b.is_string();
            if (!both_numbers && !both_strings) {
                runtime_error(e.line, "cannot compare " + type_name(a) + " with " + type_name(b));
            }
            if (e.op == TokenType::LT) return a < b;
            if (e.op == TokenType::LE) return a <= b;
            if (e.op == TokenType::GT) return a > b;
            return a >= b;
        }
        case TokenType::PLUS: {
            if (a.is_number() && b.is_number()) {
                if (is_int(a) && is_int(b)) {
                    int64_t out;
                    if (!__builtin_add_overflow(as_int(a), as_int(b), &out)) return out;
                }
                return as_double(a) + as_double(b);
            }
            if (a.is_string() || b.is_string()) {
                tick(1 + static_cast<int64_t>((to_display_string(a).size() + to_display_string(b).size()) / 64));
                Value s = to_display_string(a) + to_display_string(b);
                check_size(s, e.line);
                return s;
            }
            if (a.is_array() && b.is_array()) {
                Value out = a;
                for (const auto& item : b) out.push_back(item);
                tick(static_cast<int64_t>(out.size()));
                check_size(out, e.line);
                return out;
            }
            runtime_error(e.line, "cannot add " + type_name(a) + " and " + type_name(b));
        }
        case TokenType::MINUS:
        case TokenType::STAR:
        case TokenType::SLASH:
        case TokenType::PERCENT: {
            if (!a.is_number() || !b.is_number()) {
                runtime_error(e.line, "arithmetic on " + type_name(a) + " and " + type_name(b));
            }
            bool ints = is_int(a) && is_int(b);
            if (e.op == TokenType::MINUS) {
                int64_t out;
                if (ints && !__builtin_sub_overflow(as_int(a), as_int(b), &out)) return out;
                return as_double(a) - as_double(b);
            }
            if (e.op == TokenType::STAR) {
                int64_t out;
                if (ints && !__builtin_mul_overflow(as_int(a), as_int(b), &out)) return out;
                return as_double(a) * as_double(b);
            }
            if ((ints && as_int(b) == 0) || (!ints && as_double(b) == 0.0)) {
                runtime_error(e.line, "division by zero");
            }
            if (e.op == TokenType::SLASH) {
                if (ints && as_int(b) != -1 && as_int(a) % as_int(b) == 0) return as_int(a) / as_int(b);
                return as_double(a) / as_double(b);
            }
            if (ints) {
                if (as_int(b) == -1) return int64_t{0};
                return as_int(a) % as_int(b);
            }
            return std::fmod(as_double(a), as_double(b));
        }
        default:
            runtime_error(e.line, "unknown operator");
    }
}

Value Interpreter::eval_call(const CallExpr& e, Scope& scope) {
    if (auto builtin = call_builtin(e.callee, e, scope)) {
        check_size(*builtin, e.line);
        return std::move(*builtin);
    }

    auto it = functions_.find(e.callee);
    if (it == functions_.end()) {
        runtime_error(e.line, "unknown function '" + e.callee + "'");
    }
    std::vector<Value> args;
    args.reserve(e.args.size());
    for (const auto& arg : e.args) {
        args.push_back(eval(*arg, scope));
    }
    return call_user(*it->second, std::move(args), e.line);
}

Value Interpreter::call_user(const FnStmt& fn, std::vector<Value> args, int line) {
    if (args.size() != fn.params.size()) {
        runtime_error(line, "function '" + fn.name + "' expects " + std::to_string(fn.params.size()) +
                            " arguments, got " + std::to_string(args.size()));
    }
    if (depth_ + 1 > limits_.max_call_depth) {
        throw LoomError(make_error(ErrorKind::BUDGET, codes::DEPTH_LIMIT,
                                   "call depth limit of " + std::to_string(limits_.max_call_depth) + " exceeded"));
    }

    ++depth_;
    Scope frame;
    frame.parent = globals_;
    for (size_t i = 0; i < args.size(); ++i) {
        frame.vars[fn.params[i]] = std::move(args[i]);
    }
    Flow flow = exec_block(fn.body->body, frame);
    --depth_;

    if (flow == Flow::BREAK || flow == Flow::CONTINUE) {
        runtime_error(line, "break/continue outside of a loop in '" + fn.name + "'");
    }
    if (flow == Flow::RETURN) {
        Value out = std::move(return_value_);
        return_value_ = nullptr;
        return out;
    }
    return Value();
}

std::optional<Value> Interpreter::call_builtin(const std::string& name, const CallExpr& e, Scope& scope) {
    if (!reserved_functions().count(name)) {
        return std::nullopt;
    }

    auto argc = [&](size_t lo, size_t hi) {
        if (e.args.size() < lo || e.args.size() > hi) {
            runtime_error(e.line, name + "() takes " + std::to_string(lo) +
                                  (lo == hi ? "" : ".." + std::to_string(hi)) + " arguments");
        }
    };
    auto arg = [&](size_t i) { return eval(*e.args[i], scope); };
    auto need = [&](const Value& v, bool ok, const char* what) {
        if (!ok) runtime_error(e.line, name + "() expects " + what + ", got " + type_name(v));
    };

    // 原地修改的内建函数
    if (name == "push") {
        argc(2, 2);
        Value item = arg(1);
        Value& target = resolve_ref(*e.args[0], scope, false);
        need(target, target.is_array(), "an array variable");
        target.push_back(std::move(item));
        check_size(target, e.line);
        return Value(target.size());
    }
    if (name == "pop") {
        argc(1, 1);
        Value& target = resolve_ref(*e.args[0], scope, false);
        need(target, target.is_array(), "an array variable");
        if (target.empty()) runtime_error(e.line, "pop() on empty array");
        Value last = target.back();
        target.erase(target.size() - 1);
        return last;
    }

    // 宿主函数
    if (name == "call" || name == "try_call") {
        argc(1, 2);
        Value tool = arg(0);
        need(tool, tool.is_string(), "a tool URI string");
        Value args = e.args.size() > 1 ? arg(1) : Value::object();
        if (!host_.call_tool) {
            runtime_error(e.line, "tool calls are unavailable in this context");
        }
        ++outcome_.tool_calls;
        ToolCallResult result = host_.call_tool(tool.get<std::string>(), args);
        if (name == "call") {
            if (!result.ok) {
                throw LoomError(result.error.value_or(
                    tool_error(codes::UPSTREAM, "tool call failed: " + tool.get<std::string>())));
            }
            return result.result;
        }
        if (result.ok) {
            return Value{{"ok", true}, {"result", result.result}};
        }
        Value err = result.error ? Value(*result.error) : Value::object();
        return Value{{"ok", false}, {"error", err}};
    }
    if (name == "set_state") {
        argc(2, 2);
        Value key = arg(0);
        need(key, key.is_string(), "a string key");
        const std::string& k = key.get_ref<const std::string&>();
        outcome_.state_updates[k] = arg(1);
        check_size(outcome_.state_updates, e.line);
        // 同一脚本后续读取 state 时可见
        if (globals_) {
            Value& visible = globals_->vars["state"];
            if (visible.is_object()) visible[k] = outcome_.state_updates[k];
        }
        return Value();
    }
    if (name == "summary") {
        argc(1, 1);
        outcome_.summary = to_display_string(arg(0));
        return Value();
    }

    // 纯内建函数
    if (name == "len") {
        argc(1, 1);
        Value v = arg(0);
        if (v.is_string()) return Value(v.get_ref<const std::string&>().size());
        need(v, v.is_array() || v.is_object(), "a string, array or object");
        return Value(v.size());
    }
    if (name == "keys" || name == "values") {
        argc(1, 1);
        Value v = arg(0);
        need(v, v.is_object(), "an object");
        Value out = Value::array();
        for (auto it = v.begin(); it != v.end(); ++it) {
            out.push_back(name == "keys" ? Value(it.key()) : it.value());
        }
        tick(static_cast<int64_t>(out.size()));
        return out;
    }
    if (name == "contains") {
        argc(2, 2);
        Value coll = arg(0);
        Value needle = arg(1);
        if (coll.is_array()) {
            tick(static_cast<int64_t>(coll.size()));
            return std::find(coll.begin(), coll.end(), needle) != coll.end();
        }
        if (coll.is_object()) {
            need(needle, needle.is_string(), "a string key");
            return coll.contains(needle.get<std::string>());
        }
        need(coll, coll.is_string(), "a string, array or object");
        need(needle, needle.is_string(), "a string");
        return coll.get<std::string>().find(needle.get<std::string>()) != std::string::npos;
    }
    if (name == "str") {
        argc(1, 1);
        return to_display_string(arg(0));
    }
    if (name == "num") {
        argc(1, 1);
        Value v = arg(0);
        if (v.is_number()) return v;
        if (v.is_boolean()) return Value(v.get<bool>() ? 1 : 0);
        need(v, v.is_string(), "a number or numeric string");
        const auto& s = v.get_ref<const std::string&>();
        try {
            size_t used = 0;
            long long i = std::stoll(s, &used);
            if (used == s.size()) return Value(static_cast<int64_t>(i));
            double d = std::stod(s, &used);
            if (used == s.size()) return Value(d);
        } catch (const std::exception&) {
            // 落到下面的错误
        }
        runtime_error(e.line, "num(): '" + s + "' is not a number");
    }
    if (name == "type") {
        argc(1, 1);
        return type_name(arg(0));
    }
    if (name == "range") {
        argc(1, 3);
        Value a = arg(0);
        need(a, a.is_number_integer(), "integers");
        int64_t start = 0, stop = as_int(a), step = 1;
        if (e.args.size() >= 2) {
            Value b = arg(1);
            need(b, b.is_number_integer(), "integers");
            start = as_int(a);
            stop = as_int(b);
        }
        if (e.args.size() == 3) {
            Value c = arg(2);
            need(c, c.is_number_integer(), "integers");
            step = as_int(c);
        }
        if (step == 0) runtime_error(e.line, "range() step must not be zero");
        // 在 uint64 中计算跨度，任意 int64 边界都不会溢出
        uint64_t count = 0;
        if ((step > 0 && start < stop) || (step < 0 && start > stop)) {
            uint64_t span = step > 0 ? static_cast<uint64_t>(stop) - static_cast<uint64_t>(start)
                                     : static_cast<uint64_t>(start) - static_cast<uint64_t>(stop);
            uint64_t s = step > 0 ? static_cast<uint64_t>(step) : uint64_t{0} - static_cast<uint64_t>(step);
            count = span / s + (span % s != 0 ? 1 : 0);
        }
        if (count > static_cast<uint64_t>(std::max<int64_t>(limits_.max_collection_size, 0))) {
            throw LoomError(make_error(ErrorKind::BUDGET, codes::SIZE_LIMIT,
                                       "line " + std::to_string(e.line) + ": range of " + std::to_string(count) +
                                       " elements exceeds collection limit"));
        }
        tick(static_cast<int64_t>(count));
        Value out = Value::array();
        uint64_t v = static_cast<uint64_t>(start);
        for (uint64_t i = 0; i < count; ++i, v += static_cast<uint64_t>(step)) out.push_back(static_cast<int64_t>(v));
        return out;
    }
    if (name == "sort") {
        argc(1, 1);
        Value v = arg(0);
        need(v, v.is_array(), "an array");
        tick(static_cast<int64_t>(v.size()) + 1);
        std::vector<Value> items(v.begin(), v.end());
        std::stable_sort(items.begin(), items.end());
        return Value(items);
    }
    if (name == "join") {
        argc(1, 2);
        Value v = arg(0);
        need(v, v.is_array(), "an array");
        std::string sep = e.args.size() > 1 ? to_display_string(arg(1)) : "";
        std::string out;
        bool first = true;
        for (const auto& item : v) {
            if (!first) out += sep;
            first = false;
            out += to_display_string(item);
            if (static_cast<int64_t>(out.size()) > limits_.max_string_bytes) check_size(Value(out), e.line);
        }
        tick(static_cast<int64_t>(v.size()));
        return out;
    }
    if (name == "split") {
        argc(2, 2);
        Value s = arg(0);
        Value sep = arg(1);
        need(s, s.is_string(), "a string");
        need(sep, sep.is_string() && !sep.get_ref<const std::string&>().empty(), "a non-empty separator");
        const auto& text = s.get_ref<const std::string&>();
        const auto& delim = sep.get_ref<const std::string&>();
        Value out = Value::array();
        size_t pos = 0;
        while (true) {
            size_t next = text.find(delim, pos);
            out.push_back(text.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
            check_size(out, e.line);
            if (next == std::string::npos) break;
            pos = next + delim.size();
        }
        tick(static_cast<int64_t>(out.size()));
        return out;
    }
    if (name == "lower" || name == "upper") {
        argc(1, 1);
        Value v = arg(0);
        need(v, v.is_string(), "a string");
        std::string s = v.get<std::string>();
        for (auto& c : s) {
            c = static_cast<char>(name == "lower" ? std::tolower(static_cast<unsigned char>(c))
                                                  : std::toupper(static_cast<unsigned char>(c)));
        }
        return s;
    }
    if (name == "slice") {
        argc(2, 3);
        Value v = arg(0);
        Value from = arg(1);
        need(from, from.is_number_integer(), "integer bounds");
        int64_t size = v.is_string() ? static_cast<int64_t>(v.get_ref<const std::string&>().size())
                                     : static_cast<int64_t>(v.size());
        need(v, v.is_string() || v.is_array(), "a string or array");
        int64_t start = std::clamp<int64_t>(as_int(from), 0, size);
        int64_t stop = size;
        if (e.args.size() == 3) {
            Value to = arg(2);
            need(to, to.is_number_integer(), "integer bounds");
            stop = std::clamp<int64_t>(as_int(to), start, size);
        }
        if (v.is_string()) {
            return v.get_ref<const std::string&>().substr(static_cast<size_t>(start), static_cast<size_t>(stop - start));
        }
        Value out = Value::array();
        for (int64_t i = start; i < stop; ++i) out.push_back(v[static_cast<size_t>(i)]);
        tick(stop - start);
        return out;
    }
    if (name == "min" || name == "max") {
        if (e.args.empty()) argc(1, 1);
        std::vector<Value> items;
        if (e.args.size() == 1) {
            Value v = arg(0);
            need(v, v.is_array(), "an array or several numbers");
            items.assign(v.begin(), v.end());
        } else {
            for (size_t i = 0; i < e.args.size(); ++i) items.push_back(arg(i));
        }
        if (items.empty()) runtime_error(e.line, name + "() of empty array");
        Value best = items.front();
        for (const auto& item : items) {
            need(item, item.is_number(), "numbers");
            if (name == "min" ? item < best : item > best) best = item;
        }
        tick(static_cast<int64_t>(items.size()));
        return best;
    }
    if (name == "abs") {
        argc(1, 1);
        Value v = arg(0);
        need(v, v.is_number(), "a number");
        if (is_int(v)) {
            int64_t i = as_int(v);
            if (i != std::numeric_limits<int64_t>::min()) return i < 0 ? -i : i;
        }
        return std::fabs(as_double(v));
    }
    if (name == "floor") {
        argc(1, 1);
        Value v = arg(0);
        need(v, v.is_number(), "a number");
        if (is_int(v)) return v;
        double d = std::floor(as_double(v));
        if (d >= -9.0e18 && d <= 9.0e18) return static_cast<int64_t>(d);
        return d;
    }

    runtime_error(e.line, "unknown builtin '" + name + "'");
}

} // namespace loom::script
