// tests/test_planner.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/planner/planner.h"
#include "modules/planner/plan_parser.h"
#include "common/llm/scripted_completion.h"
#include "support/fake_engine.h"
#include <algorithm>

using namespace loom;
using namespace loom::testing;

namespace {

const char* kPlanYaml = R"(
nodes:
  - id: fetch
    idempotent: true
    allowed_tools: ["mcp://fs.read"]
    code: |
      set_state("files", call("mcp://fs.read", {path: "/"}))
  - id: publish
    deps: [fetch]
    mutating: true
    write_fields: [title]
    allowed_tools: ["mcp://fs.write"]
    code: |
      call("mcp://fs.write", {title: "x"})
)";

struct PlannerFixture {
    EngineRegistry engines;
    CapabilityManifest manifest = manifest_allowing({"mcp://fs.read", "mcp://fs.write"});

    PlannerFixture() {
        engines.register_engine(std::make_shared<FakeEngine>(std::set<ToolName>{"mcp://fs.read", "mcp://fs.write"}));
    }
};

std::string plan_error(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const LoomError& e) {
        return e.error().qualified();
    }
    return "ok";
}

} // namespace

TEST_CASE("Plan parser reads YAML and fenced answers", "[planner][parser]") {
    PlanParser parser;
    auto nodes = parser.parse_from_string(kPlanYaml);
    REQUIRE(nodes.size() == 2);
    REQUIRE(nodes[0].id == "fetch");
    REQUIRE(nodes[0].idempotent);
    REQUIRE(nodes[1].deps == std::vector<NodeId>{"fetch"});
    REQUIRE(nodes[1].write_fields == std::vector<std::string>{"title"});

    auto fenced = parser.parse_from_string(std::string("Here you go:\n```yaml\n") + kPlanYaml + "```\nthanks");
    REQUIRE(fenced.size() == 2);

    REQUIRE_THROWS_AS(parser.parse_from_string("nodes: [{id: a}]"), LoomError);
    REQUIRE_THROWS_AS(parser.parse_from_string("just prose"), LoomError);
    REQUIRE(extract_fenced_block("no fence") == "no fence");
}

TEST_CASE("Plan document bypasses the model", "[planner]") {
    PlannerFixture f;
    Planner planner(f.engines);
    Constraints constraints;
    constraints.plan_document = kPlanYaml;

    Plan plan = planner.plan("publish files", constraints, f.manifest);
    REQUIRE(plan.size() == 3);
    REQUIRE(plan.hash().size() == 64);

    const NodeSpec* approval = plan.find("approve.publish");
    REQUIRE(approval);
    REQUIRE(approval->is_approval());
    REQUIRE(approval->deps == std::vector<NodeId>{"fetch"});
    const NodeSpec* publish = plan.find("publish");
    REQUIRE(std::find(publish->deps.begin(), publish->deps.end(), "approve.publish") != publish->deps.end());

    REQUIRE(plan_error([&] { Planner(f.engines).plan("g", Constraints{}, f.manifest); }) == "CODE/PLAN_INVALID");
}

TEST_CASE("Same input gives the same plan hash", "[planner]") {
    PlannerFixture f;
    Planner planner(f.engines);
    Constraints constraints;
    constraints.plan_document = kPlanYaml;
    REQUIRE(planner.plan("g", constraints, f.manifest).hash() == planner.plan("g", constraints, f.manifest).hash());
}

TEST_CASE("Plans are checked against engines and policy", "[planner]") {
    PlannerFixture f;
    Planner planner(f.engines);
    Constraints constraints;
    constraints.plan_document = kPlanYaml;

    Constraints denied = constraints;
    denied.disallowed_tools = {"mcp://fs.write"};
    REQUIRE(plan_error([&] { planner.plan("g", denied, f.manifest); }) == "CODE/PLAN_INVALID");

    CapabilityManifest narrow = manifest_allowing({"mcp://fs.read"});
    REQUIRE(plan_error([&] { planner.plan("g", constraints, narrow); }) == "CODE/PLAN_INVALID");

    Constraints small = constraints;
    small.max_plan_nodes = 1;
    REQUIRE(plan_error([&] { planner.plan("g", small, f.manifest); }) == "CODE/PLAN_INVALID");

    Constraints unknown_tool;
    unknown_tool.plan_document = R"(nodes: [{id: a, allowed_tools: ["mcp://net.get"], code: "return 1"}])";
    REQUIRE(plan_error([&] { planner.plan("g", unknown_tool, manifest_allowing({"mcp://net.get"})); }) ==
            "CODE/PLAN_INVALID");

    Constraints cyclic;
    cyclic.plan_document = R"(nodes: [{id: a, deps: [b], code: "return 1"}, {id: b, deps: [a], code: "return 2"}])";
    REQUIRE(plan_error([&] { planner.plan("g", cyclic, f.manifest); }) == "CODE/PLAN_INVALID");
}

TEST_CASE("Node budgets are clamped to the ceiling", "[planner][budget]") {
    PlannerFixture f;
    Planner planner(f.engines);
    Constraints constraints;
    constraints.plan_document = R"(nodes: [{id: a, budget: {cpu_ms: 9000, max_ops: 50}, code: "return 1"}])";
    Budget ceiling;
    ceiling.cpu_ms = 1000;
    constraints.max_node_budget = ceiling;

    Plan plan = planner.plan("g", constraints, f.manifest);
    REQUIRE(plan.find("a")->budget().cpu_ms == 1000);
    REQUIRE(plan.find("a")->budget().max_ops == 50);
}

TEST_CASE("Local transform chains are fused", "[planner][fusion]") {
    PlannerFixture f;
    Planner planner(f.engines);

    NodeSpec a = unit_node("a");
    a.unit.code = "set_state(\"x\", 1)";
    NodeSpec b = unit_node("b", {"a"});
    NodeSpec c = unit_node("c", {"b"}, {"mcp://fs.read"});

    auto fused = planner.fuse_local_chains({a, b, c});
    REQUIRE(fused.size() == 2);
    REQUIRE(fused[0].id == "b");
    REQUIRE(fused[0].deps.empty());
    REQUIRE(fused[0].unit.code.find("set_state") < fused[0].unit.code.find("summary"));
    REQUIRE(fused[0].budget().cpu_ms == 2 * Budget{}.cpu_ms);

    // upstream that returns keeps its own node
    NodeSpec returning = unit_node("a");
    returning.unit.code = "return 1";
    REQUIRE(planner.fuse_local_chains({returning, b}).size() == 2);

    // fan-out blocks fusion
    NodeSpec sibling = unit_node("d", {"a"});
    REQUIRE(planner.fuse_local_chains({a, b, sibling}).size() == 3);
}

TEST_CASE("Planner asks the completion provider", "[planner][llm]") {
    PlannerFixture f;
    ScriptedCompletionProvider llm({std::string("```yaml\n") + kPlanYaml + "```"});
    Planner planner(f.engines, &llm);

    Constraints constraints;
    constraints.disallowed_tools = {"mcp://fs.write"};
    constraints.plan_document.reset();
    REQUIRE(plan_error([&] { planner.plan("copy files", constraints, f.manifest); }) == "CODE/PLAN_INVALID");

    auto prompts = llm.prompts();
    REQUIRE(prompts.size() == 1);
    REQUIRE(prompts[0].find("copy files") != std::string::npos);
    REQUIRE(prompts[0].find("mcp://fs.read") != std::string::npos);
    REQUIRE(prompts[0].find("mcp://fs.write") == std::string::npos);

    llm.push_answer(std::string("```yaml\n") + kPlanYaml + "```");
    REQUIRE(planner.plan("copy files", Constraints{}, f.manifest).size() == 3);

    REQUIRE(plan_error([&] { planner.plan("again", Constraints{}, f.manifest); }) == "CODE/PLAN_INVALID");
}

TEST_CASE("Re-plan produces a prefixed subgraph", "[planner][replan]") {
    PlannerFixture f;
    ScriptedCompletionProvider llm;
    Planner planner(f.engines, &llm);

    ReplanRequest request;
    request.goal = "g";
    request.failed_node = "count";
    request.error = make_error(ErrorKind::CODE, codes::RUNTIME_ERROR, "boom");
    request.superseded = {"count"};
    request.completed = {"fetch"};
    request.failed_unit.code = "return 1 / 0";
    request.generation = 1;

    llm.push_answer(R"(nodes: [{id: count, deps: [fetch], code: "return 1"}, {id: after, deps: [count], code: "return 2"}])");
    auto nodes = planner.replan(request, Constraints{}, f.manifest);
    REQUIRE(nodes.size() == 2);
    auto count = std::find_if(nodes.begin(), nodes.end(), [](const NodeSpec& n) { return n.id == "r1.count"; });
    REQUIRE(count != nodes.end());
    REQUIRE(count->deps == std::vector<NodeId>{"fetch"});
    REQUIRE(count->generation == 1);
    auto after = std::find_if(nodes.begin(), nodes.end(), [](const NodeSpec& n) { return n.id == "r1.after"; });
    REQUIRE(after->deps == std::vector<NodeId>{"r1.count"});

    llm.push_answer(R"(nodes: [{id: x, deps: [count], code: "return 1"}])");
    REQUIRE(plan_error([&] { planner.replan(request, Constraints{}, f.manifest); }) == "CODE/PLAN_INVALID");

    llm.push_answer(R"(nodes: [{id: x, code: "return 1 / 0"}])");
    REQUIRE(plan_error([&] { planner.replan(request, Constraints{}, f.manifest); }) == "CODE/PLAN_INVALID");

    request.remaining_nodes = 1;
    llm.push_answer(R"(nodes: [{id: x, code: "return 1"}, {id: y, code: "return 2"}])");
    REQUIRE(plan_error([&] { planner.replan(request, Constraints{}, f.manifest); }) == "CODE/PLAN_INVALID");

    Planner offline(f.engines);
    REQUIRE_FALSE(offline.can_replan());
    REQUIRE(offline.replan(request, Constraints{}, f.manifest).empty());
}
