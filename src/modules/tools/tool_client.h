// modules/tools/tool_client.h
#ifndef LOOM_MODULES_TOOLS_TOOL_CLIENT_H
#define LOOM_MODULES_TOOLS_TOOL_CLIENT_H

#include "common/tools/tool_transport.h"
#include "modules/cache/schema_cache.h"
#include "modules/policy/policy_gate.h"
#include "core/types/budget.h"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace loom {

struct ToolEvent {
    enum class Kind { SCHEMA_RESOLVED, INVOKED, DENIED, FAILED };
    Kind kind;
    ToolName tool;
    std::string server;
    std::string detail; // version, or the qualified error code
};

std::string to_string(ToolEvent::Kind kind);

// 调用方（一个节点）的授权范围
struct InvocationScope {
    NodeId node_id;
    std::vector<ToolName> allowed_tools;
    std::vector<std::string> write_fields;
};

// One client per run: schema versions are pinned the first time a server is
// resolved and stay fixed until the run ends.
class ToolClient {
public:
    using Listener = std::function<void(const ToolEvent&)>;

    ToolClient(ToolTransport& transport, SchemaCache& schema_cache, PolicyGate& gate,
               RunBudget* run_budget = nullptr);

    // Policy first; a denied call never reaches the transport
    ToolCallResult invoke(const InvocationScope& scope, const ToolName& tool, const Value& args);

    // Throws LoomError(TOOL/...) when the tool or its server is unknown
    ToolSchema schema(const ToolName& tool);

    // server -> pinned version for every server behind the given tools
    std::map<std::string, std::string> resolve_versions(const std::vector<ToolName>& tools);

    void add_listener(Listener listener);
    int calls_made() const { return calls_made_.load(); }

private:
    ToolSchema resolve_server(const std::string& server);
    void emit(ToolEvent::Kind kind, const ToolName& tool, const std::string& server, const std::string& detail);

    ToolTransport& transport_;
    SchemaCache& schema_cache_;
    PolicyGate& gate_;
    RunBudget* run_budget_;

    std::mutex mutex_;
    std::map<std::string, std::string> pinned_versions_;
    std::mutex listeners_mutex_;
    std::vector<Listener> listeners_;
    std::atomic<int> calls_made_{0};
};

} // namespace loom

#endif // LOOM_MODULES_TOOLS_TOOL_CLIENT_H
