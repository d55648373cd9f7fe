// common/tools/registry.h
#ifndef LOOM_COMMON_TOOLS_REGISTRY_H
#define LOOM_COMMON_TOOLS_REGISTRY_H

#include "common/tools/tool_transport.h"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace loom {

// In-process tool server. Tools are registered by URI ("mcp://fs.read");
// each server publishes a versioned schema built from the descriptors.
class ToolRegistry : public ToolTransport {
public:
    using Handler = std::function<Value(const Value& args)>;

    ToolRegistry() = default;

    // descriptor: {description, required: [arg...], mutating: bool}
    template<typename Func>
    void register_tool(const ToolName& uri, Func&& func, Value descriptor = Value::object()) {
        add_tool(uri, Handler(std::forward<Func>(func)), std::move(descriptor));
    }

    void set_server_version(const std::string& server, std::string version);

    bool has_tool(const ToolName& uri) const;
    std::vector<std::string> list_tools() const;

    // ToolTransport
    std::string version(const std::string& server) override;
    ToolSchema discover(const std::string& server, const std::string& version) override;
    ToolCallResult call(const ToolAddress& address, const Value& args) override;

    int call_count(const ToolName& uri) const;
    int discover_count() const;

private:
    struct Entry {
        Handler handler;
        Value descriptor;
    };

    void add_tool(const ToolName& uri, Handler handler, Value descriptor);

    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, Entry>> servers_; // server -> name -> entry
    std::unordered_map<std::string, std::string> versions_;
    std::unordered_map<std::string, int> call_counts_;
    int discover_count_ = 0;
};

} // namespace loom

#endif // LOOM_COMMON_TOOLS_REGISTRY_H
