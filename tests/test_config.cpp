// tests/test_config.cpp
#include <catch2/catch_test_macros.hpp>
#include "common/config/loom_config.h"
#include "core/types/constraints.h"
#include "core/types/error.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace loom;

TEST_CASE("Missing sections keep defaults", "[config]") {
    LoomConfig config = config_from_json({{"reducer", {{"summary_char_budget", 80}}}});
    REQUIRE(config.reducer.summary_char_budget == 80);
    REQUIRE(config.sandbox.max_concurrent_workers == 4);
    REQUIRE(config.executor.max_replans == 1);
    REQUIRE(config.retained_runs == 64);
    REQUIRE(config_from_json({{"retained_runs", 3}}).retained_runs == 3);
}

TEST_CASE("YAML configuration file", "[config]") {
    auto path = std::filesystem::temp_directory_path() / "loom_test_config.yaml";
    {
        std::ofstream out(path);
        out << "sandbox:\n"
               "  max_concurrent_workers: 2\n"
               "  script:\n"
               "    max_call_depth: 8\n"
               "executor:\n"
               "  approval_timeout_ms: 1000\n"
               "default_budget:\n"
               "  cpu_ms: 300\n"
               "llm:\n"
               "  model_path: models/tiny.gguf\n";
    }
    unsetenv("LOOM_MAX_WORKERS");
    LoomConfig config = load_config(path.string());
    REQUIRE(config.sandbox.max_concurrent_workers == 2);
    REQUIRE(config.sandbox.script.max_call_depth == 8);
    REQUIRE(config.executor.approval_timeout_ms == 1000);
    REQUIRE(config.default_budget.cpu_ms == 300);
    REQUIRE(std::filesystem::path(config.llm.model_path).is_absolute());
    std::filesystem::remove(path);
}

TEST_CASE("Environment overrides", "[config]") {
    setenv("LOOM_MAX_WORKERS", "7", 1);
    setenv("LOOM_WORKER_PATH", "/opt/loom/worker", 1);
    LoomConfig config = load_config("");
    REQUIRE(config.sandbox.max_concurrent_workers == 7);
    REQUIRE(config.sandbox.worker_path == "/opt/loom/worker");

    setenv("LOOM_MAX_WORKERS", "many", 1);
    REQUIRE_THROWS_AS(load_config(""), LoomError);
    unsetenv("LOOM_MAX_WORKERS");
    unsetenv("LOOM_WORKER_PATH");
}

TEST_CASE("Invalid configuration is rejected", "[config]") {
    REQUIRE_THROWS(config_from_json({{"sandbox", {{"max_concurrent_workers", 0}}}}));
    REQUIRE_THROWS(config_from_json(nlohmann::json::array()));
    REQUIRE_THROWS_AS(config_from_json({{"retained_runs", -1}}), LoomError);
}

TEST_CASE("Constraints JSON", "[config][constraints]") {
    nlohmann::json j = {
        {"run_limits", {{"max_nodes", 5}, {"max_tool_calls", 3}}},
        {"disallowed_tools", {"mcp://shell.exec"}},
        {"max_plan_nodes", 4},
        {"inputs", {{"state", {{"k", 1}}}}},
        {"plan_document", {{"nodes", nlohmann::json::array()}}}
    };
    Constraints c = j.get<Constraints>();
    REQUIRE(c.run_limits.max_nodes == 5);
    REQUIRE(c.run_limits.max_tool_calls == 3);
    REQUIRE(c.disallowed_tools == std::vector<ToolName>{"mcp://shell.exec"});
    REQUIRE(c.max_plan_nodes == 4);
    REQUIRE(c.inputs["state"]["k"] == 1);
    REQUIRE(c.plan_document);
    REQUIRE_FALSE(c.manifest);
}
