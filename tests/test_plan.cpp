// tests/test_plan.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/types/plan.h"
#include "core/types/error.h"
#include "support/fake_engine.h"

using namespace loom;
using loom::testing::unit_node;

TEST_CASE("Topological order breaks ties by id", "[plan]") {
    Plan plan({unit_node("c", {"a"}), unit_node("b", {"a"}), unit_node("a"), unit_node("d", {"b", "c"})});
    REQUIRE(plan.topological_order() == std::vector<NodeId>{"a", "b", "c", "d"});
    REQUIRE(plan.dependents("a") == std::vector<NodeId>{"b", "c"});
    REQUIRE(plan.find("d") != nullptr);
    REQUIRE(plan.find("zz") == nullptr);
}

TEST_CASE("Invalid graphs are rejected", "[plan]") {
    auto code_of = [](std::vector<NodeSpec> nodes) {
        try {
            Plan p(std::move(nodes));
        } catch (const LoomError& e) {
            return e.error().qualified();
        }
        return std::string("ok");
    };
    REQUIRE(code_of({unit_node("a"), unit_node("a")}) == "CODE/PLAN_INVALID");
    REQUIRE(code_of({unit_node("a", {"missing"})}) == "CODE/PLAN_INVALID");
    REQUIRE(code_of({unit_node("a", {"b"}), unit_node("b", {"a"})}) == "CODE/PLAN_INVALID");
    REQUIRE(code_of({unit_node("a", {"a"})}) == "CODE/PLAN_INVALID");
    REQUIRE(code_of({unit_node("a"), unit_node("b", {"a"})}) == "ok");
}

TEST_CASE("Plan hash ignores declaration order", "[plan]") {
    Plan p1({unit_node("a"), unit_node("b", {"a"})});
    Plan p2({unit_node("b", {"a"}), unit_node("a")});
    REQUIRE(p1.hash() == p2.hash());
    REQUIRE(p1.hash().size() == 64);

    NodeSpec changed = unit_node("b", {"a"});
    changed.unit.code = "summary(\"other\")";
    Plan p3({unit_node("a"), changed});
    REQUIRE(p3.hash() != p1.hash());
}

TEST_CASE("NodeSpec JSON", "[plan]") {
    NodeSpec n = unit_node("fetch", {}, {"mcp://fs.read"});
    n.idempotent = true;
    nlohmann::json j = n;
    REQUIRE(j["kind"] == "unit");
    REQUIRE(j["unit"]["allowed_tools"][0] == "mcp://fs.read");

    NodeSpec back = j.get<NodeSpec>();
    REQUIRE(back.id == "fetch");
    REQUIRE(back.idempotent);
    REQUIRE(back.unit.engine == "script");
}
