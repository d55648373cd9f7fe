// tests/test_tool_client.cpp
#include <catch2/catch_test_macros.hpp>
#include "common/tools/registry.h"
#include "modules/tools/tool_client.h"
#include "core/types/error.h"

using namespace loom;

namespace {

struct Fixture {
    ToolRegistry registry;
    SchemaCache schemas;
    std::shared_ptr<const CapabilityManifest> manifest;
    std::unique_ptr<PolicyGate> gate;
    std::unique_ptr<ToolClient> client;
    std::vector<ToolEvent> events;

    explicit Fixture(const nlohmann::json& manifest_doc, RunBudget* budget = nullptr) {
        registry.register_tool("mcp://fs.read", [](const Value& args) {
            return Value{{"content", "data of " + args.value("path", std::string("?"))}};
        }, {{"required", {"path"}}});
        registry.register_tool("mcp://fs.write", [](const Value&) { return Value{{"ok", true}}; },
                               {{"mutating", true}});
        registry.register_tool("mcp://net.get", [](const Value&) -> Value {
            throw ToolFailure(codes::UNAVAILABLE, "upstream down");
        });
        manifest = std::make_shared<const CapabilityManifest>(CapabilityManifest::from_json(manifest_doc));
        gate = std::make_unique<PolicyGate>(manifest);
        client = std::make_unique<ToolClient>(registry, schemas, *gate, budget);
        client->add_listener([this](const ToolEvent& e) { events.push_back(e); });
    }
};

} // namespace

TEST_CASE("Tool outside allowed_tools never reaches the server", "[tools]") {
    Fixture f({{"allow", {"mcp://fs.*"}}});
    InvocationScope scope{"a", {"mcp://fs.write"}, {}};
    ToolCallResult r = f.client->invoke(scope, "mcp://fs.read", {{"path", "/etc"}});
    REQUIRE_FALSE(r.ok);
    REQUIRE(r.error->qualified() == "POLICY/CAPABILITY_DENIED");
    REQUIRE(f.registry.call_count("mcp://fs.read") == 0);
    REQUIRE(f.registry.discover_count() == 0);
    REQUIRE(f.events.back().kind == ToolEvent::Kind::DENIED);
}

TEST_CASE("Manifest deny blocks before schema lookup", "[tools]") {
    Fixture f({{"allow", {"mcp://fs.write"}}});
    InvocationScope scope{"a", {"mcp://fs.read"}, {}};
    ToolCallResult r = f.client->invoke(scope, "mcp://fs.read", {{"path", "/x"}});
    REQUIRE(r.error->code == codes::CAPABILITY_DENIED);
    REQUIRE(f.registry.discover_count() == 0);
}

TEST_CASE("Schemas resolve lazily and once per run", "[tools]") {
    Fixture f({{"allow", {"mcp://fs.read"}}});
    InvocationScope scope{"a", {"mcp://fs.read"}, {}};
    REQUIRE(f.registry.discover_count() == 0);

    REQUIRE(f.client->invoke(scope, "mcp://fs.read", {{"path", "/a"}}).ok);
    ToolCallResult second = f.client->invoke(scope, "mcp://fs.read", {{"path", "/b"}});
    REQUIRE(second.ok);
    REQUIRE(second.result["content"] == "data of /b");
    REQUIRE(f.registry.discover_count() == 1);

    // the pinned version survives a server upgrade mid-run
    f.registry.set_server_version("fs", "2");
    REQUIRE(f.client->resolve_versions({"mcp://fs.read"}).at("fs") == "1");
    REQUIRE(f.events.front().kind == ToolEvent::Kind::SCHEMA_RESOLVED);
}

TEST_CASE("Missing required argument", "[tools]") {
    Fixture f({{"allow", {"mcp://fs.read"}}});
    ToolCallResult r = f.client->invoke({"a", {"mcp://fs.read"}, {}}, "mcp://fs.read", Value::object());
    REQUIRE(r.error->qualified() == "TOOL/INVALID_ARGS");
    REQUIRE_FALSE(r.error->retriable);
    REQUIRE(f.registry.call_count("mcp://fs.read") == 0);
}

TEST_CASE("Mutating tools need write scope", "[tools]") {
    Fixture f(nlohmann::json::parse(R"({"allow": [{"tool": "mcp://fs.write", "write_fields": ["notes"]}]})"));
    ToolCallResult ok = f.client->invoke({"w", {"mcp://fs.write"}, {"notes"}}, "mcp://fs.write", Value::object());
    REQUIRE(ok.ok);
    ToolCallResult denied = f.client->invoke({"w", {"mcp://fs.write"}, {"secrets"}}, "mcp://fs.write", Value::object());
    REQUIRE(denied.error->code == codes::WRITE_SCOPE_DENIED);
}

TEST_CASE("Upstream failures keep their retry class", "[tools]") {
    Fixture f({{"allow", {"mcp://net.get", "mcp://fs.missing"}}});
    ToolCallResult down = f.client->invoke({"n", {"mcp://net.get"}, {}}, "mcp://net.get", Value::object());
    REQUIRE(down.error->qualified() == "TOOL/UNAVAILABLE");
    REQUIRE(down.error->retriable);

    ToolCallResult missing = f.client->invoke({"n", {"mcp://fs.missing"}, {}}, "mcp://fs.missing", Value::object());
    REQUIRE(missing.error->qualified() == "TOOL/NOT_FOUND");
    REQUIRE_FALSE(missing.error->retriable);
}

TEST_CASE("Run tool budget", "[tools][budget]") {
    RunLimits limits;
    limits.max_tool_calls = 1;
    RunBudget budget(limits);
    Fixture f({{"allow", {"mcp://fs.read"}}}, &budget);
    InvocationScope scope{"a", {"mcp://fs.read"}, {}};
    REQUIRE(f.client->invoke(scope, "mcp://fs.read", {{"path", "/a"}}).ok);
    ToolCallResult over = f.client->invoke(scope, "mcp://fs.read", {{"path", "/b"}});
    REQUIRE(over.error->qualified() == "BUDGET/RUN_LIMIT");
    REQUIRE(f.client->calls_made() == 1);
}
