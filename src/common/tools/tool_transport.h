#ifndef LOOM_COMMON_TOOLS_TOOL_TRANSPORT_H
#define LOOM_COMMON_TOOLS_TOOL_TRANSPORT_H

#include "core/types/context.h"
#include "core/types/error.h"
#include <optional>
#include <stdexcept>
#include <string>

namespace loom {

// Versioned schema document of one tool server
struct ToolSchema {
    std::string server;
    std::string version;
    Value tools = Value::object(); // tool name -> {description, required, mutating}

    std::string key() const { return server + "@" + version; }
    const Value* find_tool(const std::string& name) const;
};

struct ToolCallResult {
    bool ok = false;
    Value result;
    std::optional<Error> error;

    static ToolCallResult success(Value v) { return ToolCallResult{true, std::move(v), std::nullopt}; }
    static ToolCallResult failure(Error e) { return ToolCallResult{false, Value(), std::move(e)}; }
};

// TOOL errors: NOT_FOUND and INVALID_ARGS are never retriable
Error tool_error(const std::string& code, const std::string& message);

// Thrown by tool handlers to report a typed upstream failure
class ToolFailure : public std::runtime_error {
public:
    ToolFailure(std::string code, const std::string& message)
        : std::runtime_error(message), code_(std::move(code)) {}
    const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

// "mcp://fs.read" -> server "fs", name "read"
struct ToolAddress {
    std::string server;
    std::string name;
};
std::optional<ToolAddress> parse_tool_uri(const ToolName& uri);

// Request/response channel to tool servers
class ToolTransport {
public:
    virtual ~ToolTransport() = default;

    // Current schema version of a server; throws ToolFailure when unreachable
    virtual std::string version(const std::string& server) = 0;
    virtual ToolSchema discover(const std::string& server, const std::string& version) = 0;
    virtual ToolCallResult call(const ToolAddress& address, const Value& args) = 0;
};

} // namespace loom

#endif // LOOM_COMMON_TOOLS_TOOL_TRANSPORT_H
