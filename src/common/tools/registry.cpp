#include "common/tools/registry.h"
#include <stdexcept>

namespace loom {

void ToolRegistry::add_tool(const ToolName& uri, Handler handler, Value descriptor) {
    auto address = parse_tool_uri(uri);
    if (!address) {
        throw std::invalid_argument("Tool URI must look like scheme://server.name: " + uri);
    }
    if (!descriptor.is_object()) {
        descriptor = Value::object();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    servers_[address->server][address->name] = Entry{std::move(handler), std::move(descriptor)};
    versions_.emplace(address->server, "1");
}

void ToolRegistry::set_server_version(const std::string& server, std::string version) {
    std::lock_guard<std::mutex> lock(mutex_);
    versions_[server] = std::move(version);
}

bool ToolRegistry::has_tool(const ToolName& uri) const {
    auto address = parse_tool_uri(uri);
    if (!address) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(address->server);
    return it != servers_.end() && it->second.count(address->name) > 0;
}

std::vector<std::string> ToolRegistry::list_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [server, tools] : servers_) {
        for (const auto& [name, _] : tools) {
            names.push_back("mcp://" + server + "." + name);
        }
    }
    return names;
}

std::string ToolRegistry::version(const std::string& server) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (servers_.count(server) == 0) {
        throw ToolFailure(codes::NOT_FOUND, "Unknown tool server: " + server);
    }
    return versions_[server];
}

ToolSchema ToolRegistry::discover(const std::string& server, const std::string& version) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(server);
    if (it == servers_.end()) {
        throw ToolFailure(codes::NOT_FOUND, "Unknown tool server: " + server);
    }
    ++discover_count_;

    ToolSchema schema;
    schema.server = server;
    schema.version = version;
    for (const auto& [name, entry] : it->second) {
        schema.tools[name] = entry.descriptor;
    }
    return schema;
}

ToolCallResult ToolRegistry::call(const ToolAddress& address, const Value& args) {
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto server = servers_.find(address.server);
        if (server == servers_.end() || server->second.count(address.name) == 0) {
            return ToolCallResult::failure(tool_error(codes::NOT_FOUND,
                                                      "Tool not found: " + address.server + "." + address.name));
        }
        handler = server->second.at(address.name).handler;
        ++call_counts_["mcp://" + address.server + "." + address.name];
    }

    try {
        return ToolCallResult::success(handler(args));
    } catch (const ToolFailure& e) {
        return ToolCallResult::failure(tool_error(e.code(), e.what()));
    } catch (const std::exception& e) {
        return ToolCallResult::failure(tool_error(codes::UPSTREAM, std::string("Tool execution failed: ") + e.what()));
    }
}

int ToolRegistry::call_count(const ToolName& uri) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = call_counts_.find(uri);
    return it == call_counts_.end() ? 0 : it->second;
}

int ToolRegistry::discover_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discover_count_;
}

} // namespace loom
