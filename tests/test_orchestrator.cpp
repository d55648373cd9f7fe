// tests/test_orchestrator.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/orchestrator.h"
#include "common/tools/registry.h"
#include "support/fake_engine.h"
#include <chrono>
#include <algorithm>
#include <cstdio>
#include <thread>

using namespace loom;
using namespace loom::testing;

namespace {

const char* kReadPlan = R"(
nodes:
  - id: fetch
    idempotent: true
    allowed_tools: ["mcp://kv.get"]
    code: |
      set_state("v", call("mcp://kv.get", {}))
  - id: report
    deps: [fetch]
    allowed_tools: ["mcp://kv.get"]
    code: |
      summary("done")
)";

const char* kWritePlan = R"(
nodes:
  - id: fetch
    allowed_tools: ["mcp://kv.get"]
    code: |
      call("mcp://kv.get", {})
  - id: publish
    deps: [fetch]
    mutating: true
    write_fields: [value]
    allowed_tools: ["mcp://kv.put"]
    code: |
      call("mcp://kv.put", {value: 1})
)";

struct OrchestratorFixture {
    std::shared_ptr<FakeEngine> engine =
        std::make_shared<FakeEngine>(std::set<ToolName>{"mcp://kv.get", "mcp://kv.put"});
    std::shared_ptr<EngineRegistry> engines = std::make_shared<EngineRegistry>();
    ToolRegistry registry;

    OrchestratorFixture() {
        engines->register_engine(engine);
        registry.register_tool("mcp://kv.get", [](const Value&) { return Value(42); });
        registry.register_tool("mcp://kv.put", [](const Value&) { return Value("stored"); },
                               Value{{"mutating", true}});
        engine->on("fetch", FakeEngine::call_tools());
        engine->on("publish", FakeEngine::call_tools());
    }

    static Constraints constraints(const char* plan) {
        Constraints c;
        c.plan_document = plan;
        c.manifest = nlohmann::json::parse(
            R"({"allow": ["mcp://kv.get", {"tool": "mcp://kv.put", "write_fields": ["value"]}]})");
        return c;
    }
};

std::string start_error(Orchestrator& orchestrator, const Constraints& constraints) {
    try {
        orchestrator.start("goal", constraints);
    } catch (const LoomError& e) {
        return e.error().qualified();
    }
    return "ok";
}

bool wait_for_pending(Orchestrator& orchestrator, const RunId& run, const NodeId& node) {
    for (int i = 0; i < 200; ++i) {
        auto pending = orchestrator.pending_approvals(run);
        if (std::find(pending.begin(), pending.end(), node) != pending.end()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

} // namespace

TEST_CASE("A run goes from plan to summary", "[orchestrator]") {
    OrchestratorFixture f;
    Orchestrator orchestrator(LoomConfig{}, f.engines, f.registry);

    RunHandle handle = orchestrator.start("read the value", f.constraints(kReadPlan));
    REQUIRE(handle.nodes == 2);
    REQUIRE(handle.plan_hash == orchestrator.plan_of(handle.run_id).hash());

    RunSummary summary = orchestrator.wait(handle.run_id);
    REQUIRE(summary.outcome == RunOutcome::SUCCEEDED);
    REQUIRE(summary.run_id == handle.run_id);
    REQUIRE(summary.state["fetch"] == Value::array({42}));
    REQUIRE(f.registry.call_count("mcp://kv.get") == 1);

    RunStatus status = orchestrator.status(handle.run_id);
    REQUIRE_FALSE(status.in_progress);
    REQUIRE(status.summary->summary_hash == summary.summary_hash);

    nlohmann::json trace = orchestrator.trace_json(handle.run_id);
    REQUIRE(trace["trace_id"] == handle.run_id);
    REQUIRE(trace["spans"].size() == 2);
    REQUIRE(trace["run"]["outcome"] == "succeeded");
    REQUIRE(orchestrator.traces(handle.run_id).size() == 2);
}

TEST_CASE("Idempotent results are reused by the next run", "[orchestrator][cache]") {
    OrchestratorFixture f;
    Orchestrator orchestrator(LoomConfig{}, f.engines, f.registry);

    auto first = orchestrator.start("read", f.constraints(kReadPlan));
    orchestrator.wait(first.run_id);
    auto second = orchestrator.start("read", f.constraints(kReadPlan));
    RunSummary summary = orchestrator.wait(second.run_id);

    REQUIRE(summary.outcome == RunOutcome::SUCCEEDED);
    REQUIRE(f.engine->calls("fetch") == 1);
    REQUIRE(orchestrator.result_cache().hits() >= 1);
}

TEST_CASE("Start refuses to run without its prerequisites", "[orchestrator]") {
    OrchestratorFixture f;
    Orchestrator orchestrator(LoomConfig{}, f.engines, f.registry);

    Constraints no_manifest = f.constraints(kReadPlan);
    no_manifest.manifest.reset();
    REQUIRE(start_error(orchestrator, no_manifest) == "POLICY/MANIFEST_MISSING");

    Constraints bad_plan = f.constraints("nodes: [{id: a}]");
    REQUIRE(start_error(orchestrator, bad_plan) == "CODE/PLAN_INVALID");

    Constraints denied = f.constraints(kReadPlan);
    denied.disallowed_tools = {"mcp://kv.get"};
    REQUIRE(start_error(orchestrator, denied) == "CODE/PLAN_INVALID");

    f.engine->set_available(false);
    REQUIRE(start_error(orchestrator, f.constraints(kReadPlan)) == "SANDBOX/ENGINE_UNAVAILABLE");

    Orchestrator empty(LoomConfig{}, std::make_shared<EngineRegistry>(), f.registry);
    REQUIRE(start_error(empty, f.constraints(kReadPlan)) == "SANDBOX/ENGINE_UNAVAILABLE");

    REQUIRE(f.engine->total_calls() == 0);
}

TEST_CASE("Mutating nodes wait for approval", "[orchestrator][approval]") {
    OrchestratorFixture f;
    Orchestrator orchestrator(LoomConfig{}, f.engines, f.registry);

    SECTION("approved") {
        auto handle = orchestrator.start("publish", f.constraints(kWritePlan));
        REQUIRE(handle.nodes == 3);
        REQUIRE(wait_for_pending(orchestrator, handle.run_id, "approve.publish"));
        REQUIRE(f.registry.call_count("mcp://kv.put") == 0);
        REQUIRE(orchestrator.approve(handle.run_id, "approve.publish", true));

        RunSummary summary = orchestrator.wait(handle.run_id);
        REQUIRE(summary.outcome == RunOutcome::SUCCEEDED);
        REQUIRE(f.registry.call_count("mcp://kv.put") == 1);
    }

    SECTION("denied") {
        auto handle = orchestrator.start("publish", f.constraints(kWritePlan));
        REQUIRE(wait_for_pending(orchestrator, handle.run_id, "approve.publish"));
        REQUIRE(orchestrator.approve(handle.run_id, "approve.publish", false));
        REQUIRE_FALSE(orchestrator.approve(handle.run_id, "approve.publish", true));

        RunSummary summary = orchestrator.wait(handle.run_id);
        REQUIRE(summary.outcome == RunOutcome::PARTIAL);
        REQUIRE(summary.nodes.at("publish") == NodeState::SKIPPED);
        REQUIRE(f.registry.call_count("mcp://kv.put") == 0);
    }
}

TEST_CASE("Cancelling a run", "[orchestrator][cancel]") {
    OrchestratorFixture f;
    f.engine->on("fetch", FakeEngine::block_until_cancelled());
    Orchestrator orchestrator(LoomConfig{}, f.engines, f.registry);

    auto handle = orchestrator.start("read", f.constraints(kReadPlan));
    REQUIRE(orchestrator.status(handle.run_id).in_progress);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(orchestrator.cancel(handle.run_id));

    RunSummary summary = orchestrator.wait(handle.run_id);
    REQUIRE(summary.outcome == RunOutcome::CANCELLED);
    REQUIRE(summary.nodes.at("report") == NodeState::SKIPPED);
    REQUIRE(f.engine->calls("report") == 0);
    REQUIRE_FALSE(orchestrator.cancel(handle.run_id));
}

TEST_CASE("Finished runs reach the summary sink", "[orchestrator][persistence]") {
    const std::string path = "loom_orchestrator_runs.jsonl";
    std::remove(path.c_str());

    OrchestratorFixture f;
    auto sink = std::make_shared<JsonlRunSummarySink>(path);
    {
        Orchestrator orchestrator(LoomConfig{}, f.engines, f.registry, nullptr, sink);
        auto handle = orchestrator.start("read", f.constraints(kReadPlan));
        RunSummary summary = orchestrator.wait(handle.run_id);

        auto stored = sink->load_all();
        REQUIRE(stored.size() == 1);
        REQUIRE(stored[0]["run_id"] == handle.run_id);
        REQUIRE(stored[0]["summary_hash"] == summary.summary_hash);
        REQUIRE(stored[0]["outcome"] == "succeeded");
    }
    std::remove(path.c_str());
}

TEST_CASE("Unknown run ids", "[orchestrator]") {
    OrchestratorFixture f;
    Orchestrator orchestrator(LoomConfig{}, f.engines, f.registry);

    REQUIRE_FALSE(orchestrator.cancel("run-missing"));
    REQUIRE_THROWS_AS(orchestrator.status("run-missing"), LoomError);
    REQUIRE_THROWS_AS(orchestrator.wait("run-missing"), LoomError);
    REQUIRE(orchestrator.pending_approvals("run-missing").empty());
}

TEST_CASE("Finished runs can be released", "[orchestrator]") {
    OrchestratorFixture f;
    f.engine->on("fetch", FakeEngine::block_until_cancelled());
    Orchestrator orchestrator(LoomConfig{}, f.engines, f.registry);

    auto handle = orchestrator.start("read", f.constraints(kReadPlan));
    REQUIRE_FALSE(orchestrator.forget(handle.run_id));
    REQUIRE(orchestrator.cancel(handle.run_id));
    orchestrator.wait(handle.run_id);

    REQUIRE(orchestrator.forget(handle.run_id));
    REQUIRE_THROWS_AS(orchestrator.status(handle.run_id), LoomError);
    REQUIRE_FALSE(orchestrator.forget(handle.run_id));
    REQUIRE_FALSE(orchestrator.forget("run-missing"));
}

TEST_CASE("Only the newest finished runs are retained", "[orchestrator]") {
    OrchestratorFixture f;
    LoomConfig config;
    config.retained_runs = 1;
    Orchestrator orchestrator(config, f.engines, f.registry);

    auto first = orchestrator.start("read", f.constraints(kReadPlan));
    orchestrator.wait(first.run_id);
    auto second = orchestrator.start("read", f.constraints(kReadPlan));
    orchestrator.wait(second.run_id);
    auto third = orchestrator.start("read", f.constraints(kReadPlan));
    RunSummary summary = orchestrator.wait(third.run_id);

    REQUIRE(summary.outcome == RunOutcome::SUCCEEDED);
    REQUIRE_THROWS_AS(orchestrator.status(first.run_id), LoomError);
    REQUIRE_FALSE(orchestrator.status(second.run_id).in_progress);
    REQUIRE_FALSE(orchestrator.status(third.run_id).in_progress);
}
