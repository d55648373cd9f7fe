// tests/test_script.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/script/interpreter.h"
#include "modules/script/lexer.h"
#include "modules/script/parser.h"
#include "core/types/error.h"
#include <cstdint>

using namespace loom;
using namespace loom::script;

namespace {

ScriptOutcome run_script(const std::string& source, const Value& params = Value::object(),
                         const Value& state = Value::object(), InterpreterLimits limits = {},
                         HostBindings host = {}) {
    Program program = parse_source(source);
    Interpreter interpreter(limits, std::move(host));
    return interpreter.run(program, params, state);
}

std::string error_of(const std::string& source, InterpreterLimits limits = {}) {
    try {
        run_script(source, Value::object(), Value::object(), limits);
    } catch (const LoomError& e) {
        return e.error().qualified();
    }
    return "ok";
}

} // namespace

TEST_CASE("Lexer tokens", "[script]") {
    auto tokens = tokenize("let x = 1.5; # comment\n// another\nx >= \"a\\n\"");
    REQUIRE(tokens.front().type == TokenType::LET);
    REQUIRE(tokens[3].type == TokenType::NUMBER);
    REQUIRE(tokens[3].text == "1.5");
    REQUIRE(tokens[5].type == TokenType::IDENT);
    REQUIRE(tokens[5].line == 3);
    REQUIRE(tokens[6].type == TokenType::GE);
    REQUIRE(tokens[7].type == TokenType::STRING);
    REQUIRE(tokens[7].text == "a\n");
    REQUIRE(tokens.back().type == TokenType::END);

    REQUIRE_THROWS_AS(tokenize("\"open"), LoomError);
    REQUIRE_THROWS_AS(tokenize("let a = `x`"), LoomError);
}

TEST_CASE("Parser reports syntax errors", "[script]") {
    auto code = [](const std::string& src) {
        try {
            parse_source(src);
        } catch (const LoomError& e) {
            return e.error().code;
        }
        return std::string("ok");
    };
    REQUIRE(code("let x = ") == codes::SYNTAX_ERROR);
    REQUIRE(code("if x { y = 1") == codes::SYNTAX_ERROR);
    REQUIRE(code("1 = 2") == codes::SYNTAX_ERROR);
    REQUIRE(code("fn f(a, b) { return a + b }") == "ok");

    std::string deep(Parser::kMaxNesting + 10, '(');
    REQUIRE(code(deep + "1" + std::string(Parser::kMaxNesting + 10, ')')) == codes::SYNTAX_ERROR);
}

TEST_CASE("Arithmetic and control flow", "[script]") {
    auto out = run_script(R"(
        let total = 0
        for n in range(1, 6) {
            if n % 2 == 0 { continue }
            total = total + n
        }
        let i = 0
        while true {
            i = i + 1
            if i >= 3 { break }
        }
        return {total: total, i: i, half: 7 / 2, whole: 8 / 2, text: "n=" + 3}
    )");
    REQUIRE(out.return_value["total"] == 9);
    REQUIRE(out.return_value["i"] == 3);
    REQUIRE(out.return_value["half"] == 3.5);
    REQUIRE(out.return_value["whole"] == 4);
    REQUIRE(out.return_value["text"] == "n=3");
    REQUIRE(out.operations > 0);
}

TEST_CASE("Functions and recursion", "[script]") {
    auto out = run_script(R"(
        fn fib(n) {
            if n < 2 { return n }
            return fib(n - 1) + fib(n - 2)
        }
        return fib(10)
    )");
    REQUIRE(out.return_value == 55);

    InterpreterLimits limits;
    limits.max_call_depth = 16;
    REQUIRE(error_of("fn down(n) { return down(n + 1) } down(0)", limits) == "BUDGET/DEPTH_LIMIT");
    REQUIRE(error_of("fn len(x) { return 1 }") == "CODE/RUNTIME_ERROR");
}

TEST_CASE("Builtins", "[script]") {
    auto out = run_script(R"(
        let xs = [3, 1, 2]
        push(xs, 0)
        let words = split("a,b,c", ",")
        return {
            sorted: sort(xs),
            n: len(xs),
            joined: join(words, "-"),
            has: contains(words, "b"),
            k: keys({b: 1, a: 2}),
            t: type(null),
            num: num("42") + 1,
            up: upper("abc")
        }
    )");
    const auto& v = out.return_value;
    REQUIRE(v["sorted"] == Value::parse("[0,1,2,3]"));
    REQUIRE(v["n"] == 4);
    REQUIRE(v["joined"] == "a-b-c");
    REQUIRE(v["has"] == true);
    REQUIRE(v["k"] == Value::parse(R"(["a","b"])"));
    REQUIRE(v["t"] == "null");
    REQUIRE(v["num"] == 43);
    REQUIRE(v["up"] == "ABC");
}

TEST_CASE("Params, state and summary", "[script]") {
    auto out = run_script(R"(
        set_state("count", params.n * 2)
        let seen = state.count
        summary("doubled " + str(seen))
        return state.prior
    )", {{"n", 21}}, {{"prior", "kept"}});
    REQUIRE(out.state_updates == Value{{"count", 42}});
    REQUIRE(out.summary == std::optional<std::string>("doubled 42"));
    REQUIRE(out.return_value == "kept");
}

TEST_CASE("Runtime errors", "[script]") {
    REQUIRE(error_of("return 1 / 0") == "CODE/RUNTIME_ERROR");
    REQUIRE(error_of("return missing + 1") == "CODE/RUNTIME_ERROR");
    REQUIRE(error_of("return [1][5]") == "CODE/RUNTIME_ERROR");
    REQUIRE(error_of("return nope()") == "CODE/RUNTIME_ERROR");
    REQUIRE(error_of("break") == "CODE/RUNTIME_ERROR");
}

TEST_CASE("Resource limits", "[script]") {
    InterpreterLimits ops;
    ops.max_ops = 500;
    REQUIRE(error_of("while true { }", ops) == "BUDGET/OP_LIMIT");

    InterpreterLimits sizes;
    sizes.max_collection_size = 10;
    REQUIRE(error_of("return range(100)", sizes) == "BUDGET/SIZE_LIMIT");
    REQUIRE(error_of("let xs = [] for i in range(10) { push(xs, i) } push(xs, 1)", sizes) == "BUDGET/SIZE_LIMIT");

    InterpreterLimits strings;
    strings.max_string_bytes = 16;
    REQUIRE(error_of("let s = \"x\" while true { s = s + s }", strings) == "BUDGET/SIZE_LIMIT");
}

TEST_CASE("Extreme range bounds cannot wind back the operation count", "[script]") {
    InterpreterLimits limits;
    limits.max_ops = 1000;
    REQUIRE(error_of("let r = range(0 - 4611686018427387904, 4611686018427387904)\n"
                     "let i = 0 while i < 100000 { i = i + 1 }", limits) == "BUDGET/SIZE_LIMIT");
    REQUIRE(error_of("return range(0 - 9223372036854775807 - 1, 9223372036854775807)", limits) ==
            "BUDGET/SIZE_LIMIT");

    // span of 2^64 - 1 with the most negative step: two elements
    auto out = run_script("let lo = 0 - 9223372036854775807 - 1\n"
                          "return range(9223372036854775807, lo, lo)");
    REQUIRE(out.return_value == Value::array({INT64_MAX, -1}));
    REQUIRE(out.operations > 0);

    REQUIRE(run_script("return range(0, 10, 0 - 9223372036854775807 - 1)").return_value == Value::array());
    REQUIRE(error_of("let i = 0 while i < 100000 { i = i + 1 }", limits) == "BUDGET/OP_LIMIT");
}

TEST_CASE("Negating the smallest integer", "[script]") {
    auto neg = run_script("let m = 0 - 9223372036854775807 - 1\nreturn -m");
    REQUIRE(neg.return_value.is_number_float());
    REQUIRE(neg.return_value.get<double>() == 9223372036854775808.0);

    auto magnitude = run_script("let m = 0 - 9223372036854775807 - 1\nreturn abs(m)");
    REQUIRE(magnitude.return_value.get<double>() == 9223372036854775808.0);

    REQUIRE(run_script("return -5").return_value == -5);
    REQUIRE(run_script("let x = 7\nreturn -x").return_value == -7);
}

TEST_CASE("Tool calls go through the host", "[script]") {
    std::vector<std::string> seen;
    HostBindings host;
    host.call_tool = [&](const ToolName& tool, const Value& args) {
        seen.push_back(tool);
        if (tool == "mcp://fs.read") return ToolCallResult::success({{"text", args["path"]}});
        return ToolCallResult::failure(tool_error(codes::NOT_FOUND, "no such tool"));
    };

    auto out = run_script(R"(
        let a = call("mcp://fs.read", {path: "/x"})
        let b = try_call("mcp://fs.nope")
        return {text: a.text, ok: b.ok, code: b.error.code}
    )", Value::object(), Value::object(), {}, host);
    REQUIRE(out.return_value["text"] == "/x");
    REQUIRE(out.return_value["ok"] == false);
    REQUIRE(out.return_value["code"] == "NOT_FOUND");
    REQUIRE(out.tool_calls == 2);
    REQUIRE(seen.size() == 2);

    Program failing = parse_source("call(\"mcp://fs.nope\")");
    Interpreter interpreter({}, host);
    try {
        interpreter.run(failing, Value::object(), Value::object());
        FAIL("call() of a failing tool must raise");
    } catch (const LoomError& e) {
        REQUIRE(e.error().qualified() == "TOOL/NOT_FOUND");
    }

    REQUIRE(error_of("call(\"mcp://fs.read\")") == "CODE/RUNTIME_ERROR");
}
