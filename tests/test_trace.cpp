// tests/test_trace.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/trace/trace_exporter.h"
#include <cstdio>
#include <fstream>

using namespace loom;

TEST_CASE("One span per attempt", "[trace]") {
    TraceExporter trace("run-9");
    trace.on_node_start("a", "unit", 1, {{"node", {{"cpu_ms", 100}}}});
    trace.on_node_end("a", "failed", make_error(ErrorKind::CODE, codes::RUNTIME_ERROR, "x"), Metrics{}, false);
    trace.on_node_start("a", "unit", 2, nlohmann::json::object());
    Metrics m;
    m.operation_count = 7;
    trace.on_node_end("a", "succeeded", std::nullopt, m, false);

    auto spans = trace.get_traces();
    REQUIRE(spans.size() == 2);
    REQUIRE(spans[0].trace_id == "run-9");
    REQUIRE(spans[0].status == "failed");
    REQUIRE(spans[0].error->code == codes::RUNTIME_ERROR);
    REQUIRE(spans[0].budget_snapshot["node"]["cpu_ms"] == 100);
    REQUIRE(spans[1].attempt == 2);
    REQUIRE(spans[1].metrics.operation_count == 7);
    REQUIRE(spans[1].end_time >= spans[1].start_time);
}

TEST_CASE("End without start still records a span", "[trace]") {
    TraceExporter trace;
    trace.on_node_end("ghost", "skipped", std::nullopt, Metrics{}, false);
    auto spans = trace.get_traces();
    REQUIRE(spans.size() == 1);
    REQUIRE(spans[0].status == "skipped");
    REQUIRE(spans[0].attempt == 0);
}

TEST_CASE("Trace document", "[trace]") {
    TraceExporter trace("run-doc");
    trace.on_node_start("a", "unit", 1, nlohmann::json::object());
    trace.on_node_end("a", "succeeded", std::nullopt, Metrics{}, true);
    trace.on_tool_event(ToolEvent{ToolEvent::Kind::INVOKED, "mcp://fs.read", "fs", "fs@1"});
    trace.on_run_end({{"outcome", "succeeded"}, {"summary_hash", "abc"}});

    nlohmann::json doc = trace.to_json();
    REQUIRE(doc["trace_id"] == "run-doc");
    REQUIRE(doc["spans"][0]["from_cache"] == true);
    REQUIRE(doc["spans"][0]["duration_ms"].get<int64_t>() >= 0);
    REQUIRE(doc["tool_events"][0]["kind"] == "invoked");
    REQUIRE(doc["run"]["outcome"] == "succeeded");

    std::string path = "loom_trace_test.json";
    trace.export_to_file(path);
    std::ifstream in(path);
    REQUIRE(nlohmann::json::parse(in) == doc);
    std::remove(path.c_str());

    REQUIRE_THROWS_AS(trace.export_to_file("/nonexistent/dir/trace.json"), std::runtime_error);

    trace.clear_traces();
    REQUIRE(trace.get_traces().empty());
    REQUIRE_FALSE(trace.get_run_record());
}
