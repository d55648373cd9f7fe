// tests/test_executor.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/executor/dag_executor.h"
#include "modules/sandbox/cancel_token.h"
#include "common/tools/registry.h"
#include "support/fake_engine.h"
#include <algorithm>
#include <thread>

using namespace loom;
using namespace loom::testing;

namespace {

const RunId kRun = "run-test";

struct Harness {
    std::shared_ptr<FakeEngine> engine = std::make_shared<FakeEngine>(std::set<ToolName>{"mcp://kv.get", "mcp://kv.put"});
    EngineRegistry engines;
    ToolRegistry registry;
    SchemaCache schemas;
    std::shared_ptr<const CapabilityManifest> manifest;
    std::unique_ptr<PolicyGate> gate;
    RunBudget budget;
    std::unique_ptr<ToolClient> tools;
    ResultCache cache;
    ApprovalBroker approvals;
    TraceExporter trace{kRun};
    Reducer reducer;
    ExecutorConfig config;

    explicit Harness(RunLimits limits = {}) : budget(limits) {
        engines.register_engine(engine);
        registry.register_tool("mcp://kv.get", [](const Value& args) { return Value{{"echo", args}}; });
        registry.register_tool("mcp://kv.put", [](const Value&) { return Value{{"ok", true}}; }, {{"mutating", true}});
        manifest = std::make_shared<const CapabilityManifest>(CapabilityManifest::from_json(nlohmann::json::parse(
            R"({"allow": ["mcp://kv.get", {"tool": "mcp://kv.put", "write_fields": ["value"]}]})")));
        gate = std::make_unique<PolicyGate>(manifest);
        tools = std::make_unique<ToolClient>(registry, schemas, *gate, &budget);
        tools->add_listener([this](const ToolEvent& e) { trace.on_tool_event(e); });
    }

    std::unique_ptr<DagExecutor> executor(int workers = 4) {
        return std::make_unique<DagExecutor>(kRun, engines, *tools, *gate, cache, approvals, trace, config, workers);
    }

    RunSummary run(const Plan& plan, const Value& inputs = Value::object(),
                   std::shared_ptr<CancelToken> cancel = nullptr) {
        return executor()->run(plan, budget, inputs, reducer, std::move(cancel));
    }
};

Plan diamond() {
    return Plan({unit_node("a"), unit_node("b", {"a"}), unit_node("c", {"a"}), unit_node("d", {"b", "c"})});
}

NodeSpec approval_node(const NodeId& id, std::vector<NodeId> deps = {}) {
    NodeSpec node;
    node.id = id;
    node.kind = NodeKind::APPROVAL;
    node.deps = std::move(deps);
    node.unit.engine.clear();
    return node;
}

NodeSpec write_node(const NodeId& id, std::vector<NodeId> deps) {
    NodeSpec node = unit_node(id, std::move(deps), {"mcp://kv.put"});
    node.mutating = true;
    node.write_fields = {"value"};
    return node;
}

// Resolves the approval as soon as the executor has opened it
std::thread decide_when_pending(ApprovalBroker& broker, const NodeId& id, bool approved) {
    return std::thread([&broker, id, approved] {
        for (int i = 0; i < 1000; ++i) {
            if (broker.resolve(kRun, id, approved)) return;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });
}

Error runtime_error() {
    return make_error(ErrorKind::CODE, codes::RUNTIME_ERROR, "boom");
}

} // namespace

TEST_CASE("Nodes see only their ancestors' state", "[executor]") {
    Harness h;
    h.engine->on("a", FakeEngine::write_state({{"x", 1}}, "a done"));
    h.engine->on("b", FakeEngine::write_state({{"y", 2}}));
    h.engine->on("c", FakeEngine::write_state({{"z", 3}}));

    RunSummary summary = h.run(diamond(), {{"state", {{"seed", true}}}});

    REQUIRE(summary.outcome == RunOutcome::SUCCEEDED);
    REQUIRE(summary.state == Value{{"seed", true}, {"x", 1}, {"y", 2}, {"z", 3}});
    REQUIRE(h.engine->last_inputs("b")["state"] == Value{{"seed", true}, {"x", 1}});
    REQUIRE(h.engine->last_inputs("d")["state"] == Value{{"seed", true}, {"x", 1}, {"y", 2}, {"z", 3}});
    REQUIRE(summary.summary.find("[a] a done") != std::string::npos);
    REQUIRE(summary.summary.find("[d] ran d") != std::string::npos);
    REQUIRE(summary.summary_hash.size() == 64);
    REQUIRE(h.engine->total_calls() == 4);
}

TEST_CASE("Failure skips dependents and keeps other branches", "[executor]") {
    Harness h;
    h.engine->on("b", FakeEngine::fail_with(runtime_error()));
    RunSummary summary = h.run(diamond());

    REQUIRE(summary.outcome == RunOutcome::PARTIAL);
    REQUIRE(summary.nodes.at("b") == NodeState::FAILED);
    REQUIRE(summary.nodes.at("c") == NodeState::SUCCEEDED);
    REQUIRE(summary.nodes.at("d") == NodeState::SKIPPED);
    REQUIRE(h.engine->calls("d") == 0);
    REQUIRE(summary.errors.size() == 1);
    REQUIRE(summary.errors[0].node == "b");
    REQUIRE(summary.summary.find("[b] failed: CODE/RUNTIME_ERROR") != std::string::npos);
}

TEST_CASE("Idempotent nodes retry once", "[executor][retry]") {
    Harness h;
    Error flaky = tool_error(codes::UNAVAILABLE, "try later");
    NodeSpec a = unit_node("a");
    a.idempotent = true;
    NodeSpec b = unit_node("b");
    h.engine->on("a", FakeEngine::fail_then_succeed(flaky, 1));
    h.engine->on("b", FakeEngine::fail_then_succeed(flaky, 1));

    RunSummary summary = h.run(Plan({a, b}));
    REQUIRE(summary.nodes.at("a") == NodeState::SUCCEEDED);
    REQUIRE(h.engine->calls("a") == 2);
    REQUIRE(summary.nodes.at("b") == NodeState::FAILED);
    REQUIRE(h.engine->calls("b") == 1);

    auto spans = h.trace.get_traces();
    auto attempts = std::count_if(spans.begin(), spans.end(), [](const TraceRecord& r) { return r.node_id == "a"; });
    REQUIRE(attempts == 2);
}

TEST_CASE("Policy is checked before dispatch", "[executor][policy]") {
    Harness h;
    NodeSpec rogue = unit_node("rogue", {}, {"mcp://shell.exec"});
    RunSummary summary = h.run(Plan({rogue, unit_node("after", {"rogue"})}));

    REQUIRE(summary.outcome == RunOutcome::FAILED);
    REQUIRE(summary.errors[0].error.qualified() == "POLICY/CAPABILITY_DENIED");
    REQUIRE(summary.nodes.at("after") == NodeState::SKIPPED);
    REQUIRE(h.engine->total_calls() == 0);
}

TEST_CASE("Tool calls go through the client", "[executor][tools]") {
    Harness h;
    NodeSpec fetch = unit_node("fetch", {}, {"mcp://kv.get"});
    fetch.unit.params = {{"key", "k1"}};
    h.engine->on("fetch", FakeEngine::call_tools());

    RunSummary summary = h.run(Plan({fetch}));
    REQUIRE(summary.outcome == RunOutcome::SUCCEEDED);
    REQUIRE(summary.state["fetch"][0]["echo"]["key"] == "k1");
    REQUIRE(h.registry.call_count("mcp://kv.get") == 1);
    REQUIRE(h.budget.tool_calls_used.load() == 1);

    auto events = h.trace.get_tool_events();
    REQUIRE(std::any_of(events.begin(), events.end(),
                        [](const ToolEventRecord& r) { return r.event.kind == ToolEvent::Kind::INVOKED; }));
}

TEST_CASE("Params are rendered from state and inputs", "[executor]") {
    Harness h;
    h.engine->on("a", FakeEngine::write_state({{"name", "loom"}}));
    NodeSpec b = unit_node("b", {"a"});
    b.unit.params = {{"greeting", "hi {{ state.name }} from {{ inputs.city }}"}, {"n", 3}};

    h.run(Plan({unit_node("a"), b}), {{"city", "Oslo"}});
    Value params = h.engine->last_inputs("b")["params"];
    REQUIRE(params["greeting"] == "hi loom from Oslo");
    REQUIRE(params["n"] == 3);
}

TEST_CASE("Deterministic results come from the cache", "[executor][cache]") {
    Harness h;
    Plan plan = diamond();
    RunSummary first = h.run(plan);
    REQUIRE(h.engine->total_calls() == 4);

    ExecutionReport again = h.executor()->execute(plan, h.budget, Value::object());
    REQUIRE(h.engine->total_calls() == 4);
    REQUIRE(again.state.find("d")->from_cache);
    REQUIRE(again.state.find("d")->result->summary == "ran d");
    REQUIRE(h.cache.hits() == 4);

    // other inputs, other key
    h.executor()->execute(plan, h.budget, {{"state", {{"v", 2}}}});
    REQUIRE(h.engine->total_calls() == 8);
}

TEST_CASE("Writes wait for approval", "[executor][approval]") {
    Harness h;
    Plan plan({unit_node("prep"), approval_node("approve.put", {"prep"}), write_node("put", {"prep", "approve.put"})});

    SECTION("approved") {
        std::thread approver = decide_when_pending(h.approvals, "approve.put", true);
        RunSummary summary = h.run(plan);
        approver.join();
        REQUIRE(summary.outcome == RunOutcome::SUCCEEDED);
        REQUIRE(h.engine->calls("put") == 1);
    }
    SECTION("denied") {
        std::thread approver = decide_when_pending(h.approvals, "approve.put", false);
        RunSummary summary = h.run(plan);
        approver.join();
        REQUIRE(summary.outcome == RunOutcome::PARTIAL);
        REQUIRE(summary.nodes.at("approve.put") == NodeState::FAILED);
        REQUIRE(summary.nodes.at("put") == NodeState::SKIPPED);
        REQUIRE(summary.errors[0].error.qualified() == "POLICY/APPROVAL_DENIED");
        REQUIRE(h.engine->calls("put") == 0);
    }
    SECTION("timed out") {
        h.config.approval_timeout_ms = 30;
        RunSummary summary = h.run(plan);
        REQUIRE(summary.nodes.at("approve.put") == NodeState::FAILED);
        REQUIRE(summary.errors[0].error.code == codes::APPROVAL_TIMEOUT);
        REQUIRE(h.engine->calls("put") == 0);
    }
}

TEST_CASE("Mutating node without approval is refused", "[executor][approval]") {
    Harness h;
    RunSummary summary = h.run(Plan({write_node("put", {})}));
    REQUIRE(summary.outcome == RunOutcome::FAILED);
    REQUIRE(summary.errors[0].error.qualified() == "POLICY/WRITE_WITHOUT_APPROVAL");
    REQUIRE(h.engine->calls("put") == 0);
}

TEST_CASE("Run node budget stops the run", "[executor][budget]") {
    RunLimits limits;
    limits.max_nodes = 2;
    Harness h(limits);
    RunSummary summary = h.run(Plan({unit_node("a"), unit_node("b", {"a"}), unit_node("c", {"b"})}));

    REQUIRE(summary.outcome == RunOutcome::FAILED);
    REQUIRE(summary.terminating_error);
    REQUIRE(summary.terminating_error->qualified() == "BUDGET/RUN_LIMIT");
    REQUIRE(summary.nodes.at("b") == NodeState::SUCCEEDED);
    REQUIRE(summary.nodes.at("c") == NodeState::SKIPPED);
    REQUIRE(h.engine->total_calls() == 2);
}

TEST_CASE("Exhausted tool budget aborts the run", "[executor][budget]") {
    RunLimits limits;
    limits.max_tool_calls = 1;

    // Calls kv.get twice; `strict` fails the node on a refused call
    auto greedy = [](bool strict) {
        return [strict](const ExecutionUnit& unit, const ExecutionContext& ctx) {
            for (int i = 0; i < 2; ++i) {
                ToolCallResult r = ctx.invoke_tool("mcp://kv.get", unit.params);
                if (!r.ok && strict) return ExecuteResult::fail(*r.error);
            }
            ResultEnvelope envelope;
            envelope.summary = "swallowed";
            return ExecuteResult::ok(envelope);
        };
    };

    SECTION("node reports the breach") {
        Harness h(limits);
        h.engine->on("fetch", greedy(true));
        h.engine->on("slow", FakeEngine::block_until_cancelled());
        RunSummary summary = h.run(Plan({unit_node("fetch", {}, {"mcp://kv.get"}), unit_node("slow"),
                                         unit_node("later", {"slow"})}));

        REQUIRE(summary.outcome == RunOutcome::FAILED);
        REQUIRE(summary.terminating_error);
        REQUIRE(summary.terminating_error->qualified() == "BUDGET/RUN_LIMIT");
        REQUIRE(summary.nodes.at("fetch") == NodeState::FAILED);
        REQUIRE(summary.nodes.at("later") == NodeState::SKIPPED);
        REQUIRE(h.engine->calls("later") == 0);
        REQUIRE(h.registry.call_count("mcp://kv.get") == 1);
    }

    SECTION("script swallows the refused call") {
        Harness h(limits);
        h.engine->on("fetch", greedy(false));
        h.engine->on("slow", FakeEngine::block_until_cancelled());
        RunSummary summary = h.run(Plan({unit_node("fetch", {}, {"mcp://kv.get"}), unit_node("slow"),
                                         unit_node("later", {"slow"})}));

        REQUIRE(summary.terminating_error);
        REQUIRE(summary.terminating_error->qualified() == "BUDGET/RUN_LIMIT");
        REQUIRE(summary.outcome == RunOutcome::FAILED);
        REQUIRE(h.engine->calls("later") == 0);
    }
}

TEST_CASE("Refused nodes do not use the node budget", "[executor][budget][policy]") {
    RunLimits limits;
    limits.max_nodes = 1;
    Harness h(limits);
    RunSummary summary = h.run(Plan({unit_node("a_denied", {}, {"mcp://fs.read"}), unit_node("b"),
                                     write_node("c_write", {})}));

    REQUIRE_FALSE(summary.terminating_error);
    REQUIRE(summary.outcome == RunOutcome::PARTIAL);
    REQUIRE(summary.nodes.at("a_denied") == NodeState::FAILED);
    REQUIRE(summary.nodes.at("b") == NodeState::SUCCEEDED);
    REQUIRE(summary.nodes.at("c_write") == NodeState::FAILED);
    REQUIRE(h.budget.nodes_used.load() == 1);
}

TEST_CASE("Cancellation stops running nodes", "[executor][cancel]") {
    Harness h;
    h.engine->on("slow", FakeEngine::block_until_cancelled());
    auto cancel = std::make_shared<CancelToken>();
    std::thread canceller([cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel->cancel();
    });

    RunSummary summary = h.run(Plan({unit_node("slow"), unit_node("next", {"slow"})}), Value::object(), cancel);
    canceller.join();

    REQUIRE(summary.outcome == RunOutcome::CANCELLED);
    REQUIRE(summary.nodes.at("slow") == NodeState::SKIPPED);
    REQUIRE(summary.nodes.at("next") == NodeState::SKIPPED);
    REQUIRE(h.engine->calls("next") == 0);
}

TEST_CASE("Failed node is re-planned", "[executor][replan]") {
    Harness h;
    h.engine->on("b", FakeEngine::fail_with(runtime_error()));
    std::vector<ReplanRequest> requests;
    auto executor = h.executor();
    executor->set_replan_hook([&](const ReplanRequest& request) {
        requests.push_back(request);
        NodeSpec fix = unit_node("r1.b", {"a"});
        fix.generation = request.generation;
        NodeSpec tail = unit_node("r1.d", {"r1.b", "c"});
        tail.generation = request.generation;
        return std::vector<NodeSpec>{fix, tail};
    });

    RunSummary summary = executor->run(diamond(), h.budget, Value::object(), h.reducer);

    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].failed_node == "b");
    REQUIRE(requests[0].superseded == std::vector<NodeId>{"b", "d"});
    REQUIRE(std::count(requests[0].completed.begin(), requests[0].completed.end(), "a") == 1);
    REQUIRE(summary.replans == 1);
    REQUIRE(summary.outcome == RunOutcome::SUCCEEDED);
    REQUIRE(summary.nodes.at("b") == NodeState::FAILED);
    REQUIRE(summary.nodes.at("r1.d") == NodeState::SUCCEEDED);
    REQUIRE(h.engine->calls("d") == 0);

    auto record = h.trace.get_run_record();
    REQUIRE(record);
    REQUIRE((*record)["executed_plan"]["generation"] == 1);
}

TEST_CASE("Re-plan is bounded", "[executor][replan]") {
    SECTION("limit of zero") {
        RunLimits limits;
        limits.max_replans = 0;
        Harness h(limits);
        h.engine->on("b", FakeEngine::fail_with(runtime_error()));
        int asked = 0;
        auto executor = h.executor();
        executor->set_replan_hook([&](const ReplanRequest&) {
            ++asked;
            return std::vector<NodeSpec>{unit_node("r1.b", {"a"})};
        });
        RunSummary summary = executor->run(diamond(), h.budget, Value::object(), h.reducer);
        REQUIRE(asked == 0);
        REQUIRE(summary.outcome == RunOutcome::PARTIAL);
    }
    SECTION("policy errors are final") {
        Harness h;
        h.engine->on("b", FakeEngine::fail_with(make_error(ErrorKind::POLICY, codes::CAPABILITY_DENIED, "no")));
        int asked = 0;
        auto executor = h.executor();
        executor->set_replan_hook([&](const ReplanRequest&) {
            ++asked;
            return std::vector<NodeSpec>{};
        });
        executor->run(diamond(), h.budget, Value::object(), h.reducer);
        REQUIRE(asked == 0);
    }
    SECTION("rejected subgraph falls back to skipping") {
        Harness h;
        h.engine->on("b", FakeEngine::fail_with(runtime_error()));
        auto executor = h.executor();
        executor->set_replan_hook([](const ReplanRequest&) {
            return std::vector<NodeSpec>{unit_node("r1.b", {"missing"})};
        });
        RunSummary summary = executor->run(diamond(), h.budget, Value::object(), h.reducer);
        REQUIRE(summary.replans == 0);
        REQUIRE(summary.nodes.at("d") == NodeState::SKIPPED);
        REQUIRE(summary.outcome == RunOutcome::PARTIAL);
    }
}

TEST_CASE("Worker pool bounds concurrency", "[executor]") {
    Harness h;
    std::vector<NodeSpec> nodes;
    for (int i = 0; i < 8; ++i) {
        NodeId id = "n" + std::to_string(i);
        nodes.push_back(unit_node(id));
        h.engine->on(id, [](const ExecutionUnit&, const ExecutionContext&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(40));
            return ExecuteResult::ok(ResultEnvelope{});
        });
    }
    auto executor = h.executor(3);
    RunSummary summary = executor->run(Plan(nodes), h.budget, Value::object(), h.reducer);
    REQUIRE(summary.outcome == RunOutcome::SUCCEEDED);
    REQUIRE(h.engine->max_concurrency() <= 3);
    REQUIRE(h.engine->max_concurrency() >= 2);
}
