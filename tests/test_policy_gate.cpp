// tests/test_policy_gate.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/policy/policy_gate.h"
#include "core/types/error.h"

using namespace loom;

namespace {

CapabilityManifest manifest_from(const nlohmann::json& doc) {
    return CapabilityManifest::from_json(doc);
}

} // namespace

TEST_CASE("Absent allow entry is a deny", "[policy]") {
    auto manifest = manifest_from({{"allow", {"mcp://fs.read"}}, {"deny", nlohmann::json::array()}});
    REQUIRE(PolicyGate::decide({"mcp://fs.read"}, manifest));

    Decision d = PolicyGate::decide({"mcp://fs.write"}, manifest);
    REQUIRE_FALSE(d);
    REQUIRE(d.reason->qualified() == "POLICY/CAPABILITY_DENIED");

    CapabilityManifest empty = manifest_from({{"deny", nlohmann::json::array()}});
    REQUIRE_FALSE(PolicyGate::decide({"mcp://fs.read"}, empty));
}

TEST_CASE("Deny wins over allow", "[policy]") {
    auto manifest = manifest_from({{"allow", {"mcp://fs.*"}}, {"deny", {"mcp://fs.delete"}}});
    REQUIRE(PolicyGate::decide({"mcp://fs.read"}, manifest));
    REQUIRE_FALSE(PolicyGate::decide({"mcp://fs.delete"}, manifest));
    REQUIRE_FALSE(PolicyGate::decide({"mcp://fsx.read"}, manifest));

    auto denied = manifest.with_denied({"mcp://fs.read"});
    REQUIRE_FALSE(PolicyGate::decide({"mcp://fs.read"}, denied));
    REQUIRE(PolicyGate::decide({"mcp://fs.read"}, manifest));
}

TEST_CASE("Write scope qualifiers", "[policy]") {
    auto manifest = manifest_from(nlohmann::json::parse(R"({
        "allow": ["mcp://db.read", {"tool": "mcp://db.update", "write_fields": ["profile.*", "email"]}]
    })"));

    REQUIRE(PolicyGate::decide({"mcp://db.update", true, {"email", "profile.name"}}, manifest));

    Decision outside = PolicyGate::decide({"mcp://db.update", true, {"password"}}, manifest);
    REQUIRE_FALSE(outside);
    REQUIRE(outside.reason->code == codes::WRITE_SCOPE_DENIED);

    Decision read_only = PolicyGate::decide({"mcp://db.read", true, {}}, manifest);
    REQUIRE_FALSE(read_only);
    REQUIRE(read_only.reason->code == codes::WRITE_SCOPE_DENIED);
}

TEST_CASE("Sliding window rate limit", "[policy]") {
    auto manifest = std::make_shared<const CapabilityManifest>(manifest_from(nlohmann::json::parse(R"({
        "allow": [{"tool": "mcp://api.search", "rate_limit": {"max_calls": 2, "window_ms": 1000}}]
    })")));
    auto now = std::chrono::steady_clock::time_point{};
    PolicyGate gate(manifest, [&] { return now; });

    REQUIRE(gate.check({"mcp://api.search"}));
    now += std::chrono::milliseconds(100);
    REQUIRE(gate.check({"mcp://api.search"}));
    Decision third = gate.check({"mcp://api.search"});
    REQUIRE_FALSE(third);
    REQUIRE(third.reason->code == codes::RATE_LIMITED);

    now += std::chrono::milliseconds(950);
    REQUIRE(gate.check({"mcp://api.search"}));

    gate.reset();
    REQUIRE(gate.check({"mcp://api.search"}));
}

TEST_CASE("Every tool of a node must be allowed", "[policy]") {
    auto manifest = std::make_shared<const CapabilityManifest>(manifest_from({{"allow", {"mcp://a.x"}}}));
    PolicyGate gate(manifest);
    REQUIRE(gate.check_allowed_tools({}));
    REQUIRE(gate.check_allowed_tools({"mcp://a.x"}));
    REQUIRE_FALSE(gate.check_allowed_tools({"mcp://a.x", "mcp://b.y"}));
}

TEST_CASE("Malformed manifests", "[policy]") {
    auto code_of = [](const nlohmann::json& doc) {
        try {
            CapabilityManifest::from_json(doc);
        } catch (const LoomError& e) {
            return e.error().qualified();
        }
        return std::string("ok");
    };
    REQUIRE(code_of(nlohmann::json::array()) == "POLICY/MANIFEST_MISSING");
    REQUIRE(code_of(nlohmann::json::object()) == "POLICY/MANIFEST_MISSING");
    REQUIRE(code_of({{"allow", "mcp://a.x"}}) == "POLICY/MANIFEST_MISSING");
    REQUIRE(code_of(nlohmann::json::parse(
                R"({"allow": [{"tool": "mcp://a.x", "rate_limit": {"max_calls": 0}}]})")) ==
            "POLICY/MANIFEST_MISSING");
    REQUIRE_THROWS_AS(CapabilityManifest::load_file("/nonexistent/manifest.yaml"), LoomError);
    REQUIRE_THROWS_AS(PolicyGate(nullptr), LoomError);
}
