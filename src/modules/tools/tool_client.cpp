// modules/tools/tool_client.cpp
#include "modules/tools/tool_client.h"
#include "common/logging/logging.h"
#include <algorithm>

namespace loom {

std::string to_string(ToolEvent::Kind kind) {
    switch (kind) {
        case ToolEvent::Kind::SCHEMA_RESOLVED: return "schema_resolved";
        case ToolEvent::Kind::INVOKED: return "invoked";
        case ToolEvent::Kind::DENIED: return "denied";
        case ToolEvent::Kind::FAILED: return "failed";
    }
    return "failed";
}

ToolClient::ToolClient(ToolTransport& transport, SchemaCache& schema_cache, PolicyGate& gate,
                       RunBudget* run_budget)
    : transport_(transport), schema_cache_(schema_cache), gate_(gate), run_budget_(run_budget) {}

void ToolClient::add_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

void ToolClient::emit(ToolEvent::Kind kind, const ToolName& tool, const std::string& server,
                      const std::string& detail) {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    ToolEvent event{kind, tool, server, detail};
    for (const auto& listener : listeners) {
        listener(event);
    }
}

ToolSchema ToolClient::resolve_server(const std::string& server) {
    std::string version;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pinned_versions_.find(server);
        if (it != pinned_versions_.end()) {
            version = it->second;
        }
    }

    try {
        if (version.empty()) {
            version = transport_.version(server);
            std::lock_guard<std::mutex> lock(mutex_);
            // 并发解析时保留第一个写入的版本
            version = pinned_versions_.emplace(server, version).first->second;
        }
        if (auto cached = schema_cache_.get(server, version)) {
            return *cached;
        }
        ToolSchema schema = transport_.discover(server, version);
        schema.server = server;
        schema.version = version;
        schema_cache_.put(schema);
        emit(ToolEvent::Kind::SCHEMA_RESOLVED, "", server, schema.key());
        LOOM_LOG_DEBUG("tool schema resolved", {StringField("schema", schema.key())});
        return schema;
    } catch (const ToolFailure& e) {
        throw LoomError(tool_error(e.code(), e.what()));
    }
}

ToolSchema ToolClient::schema(const ToolName& tool) {
    auto address = parse_tool_uri(tool);
    if (!address) {
        throw LoomError(tool_error(codes::INVALID_ARGS, "malformed tool URI: " + tool));
    }
    ToolSchema schema = resolve_server(address->server);
    if (!schema.find_tool(address->name)) {
        throw LoomError(tool_error(codes::NOT_FOUND, "tool not in schema " + schema.key() + ": " + tool));
    }
    return schema;
}

std::map<std::string, std::string> ToolClient::resolve_versions(const std::vector<ToolName>& tools) {
    std::map<std::string, std::string> versions;
    for (const auto& tool : tools) {
        auto address = parse_tool_uri(tool);
        if (!address) continue;
        if (versions.count(address->server)) continue;
        ToolSchema schema = resolve_server(address->server);
        versions[address->server] = schema.version;
    }
    return versions;
}

ToolCallResult ToolClient::invoke(const InvocationScope& scope, const ToolName& tool, const Value& args) {
    auto denied = [&](Error error) {
        emit(ToolEvent::Kind::DENIED, tool, "", error.qualified());
        return ToolCallResult::failure(std::move(error));
    };

    // 1. 单元级 allowed_tools
    if (std::find(scope.allowed_tools.begin(), scope.allowed_tools.end(), tool) == scope.allowed_tools.end()) {
        return denied(make_error(ErrorKind::POLICY, codes::CAPABILITY_DENIED,
                                 "tool not in allowed_tools of node " + scope.node_id + ": " + tool));
    }

    // 2. manifest (pure, before any transport traffic)
    Decision pre = PolicyGate::decide(CapabilityRequest{tool, false, {}}, gate_.manifest());
    if (!pre) {
        return denied(*pre.reason);
    }

    auto address = parse_tool_uri(tool);
    if (!address) {
        return ToolCallResult::failure(tool_error(codes::INVALID_ARGS, "malformed tool URI: " + tool));
    }

    // 3. lazy schema
    ToolSchema schema;
    try {
        schema = this->schema(tool);
    } catch (const LoomError& e) {
        emit(ToolEvent::Kind::FAILED, tool, address->server, e.error().qualified());
        return ToolCallResult::failure(e.error());
    }
    const Value& descriptor = *schema.find_tool(address->name);

    // 4. write scope + rate limit
    CapabilityRequest request{tool, descriptor.value("mutating", false), scope.write_fields};
    Decision decision = gate_.check(request);
    if (!decision) {
        return denied(*decision.reason);
    }

    if (descriptor.contains("required") && descriptor["required"].is_array()) {
        for (const auto& key : descriptor["required"]) {
            if (!key.is_string()) continue;
            if (!args.is_object() || !args.contains(key.get<std::string>())) {
                Error e = tool_error(codes::INVALID_ARGS, "missing argument '" + key.get<std::string>() + "' for " + tool);
                emit(ToolEvent::Kind::FAILED, tool, address->server, e.qualified());
                return ToolCallResult::failure(std::move(e));
            }
        }
    }

    // 5. run-level tool budget
    if (run_budget_ && !run_budget_->try_consume_tool_call()) {
        Error e = make_error(ErrorKind::BUDGET, codes::RUN_LIMIT, "run tool call budget exhausted");
        emit(ToolEvent::Kind::DENIED, tool, address->server, e.qualified());
        return ToolCallResult::failure(std::move(e));
    }

    ++calls_made_;
    ToolCallResult result;
    try {
        result = transport_.call(*address, args);
    } catch (const ToolFailure& e) {
        result = ToolCallResult::failure(tool_error(e.code(), e.what()));
    } catch (const std::exception& e) {
        result = ToolCallResult::failure(tool_error(codes::UNAVAILABLE, e.what()));
    }

    if (result.ok) {
        emit(ToolEvent::Kind::INVOKED, tool, address->server, schema.key());
    } else {
        if (!result.error) {
            result.error = tool_error(codes::UPSTREAM, "tool failed without error detail");
        }
        emit(ToolEvent::Kind::FAILED, tool, address->server, result.error->qualified());
    }
    return result;
}

} // namespace loom
