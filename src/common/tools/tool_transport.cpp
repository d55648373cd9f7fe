#include "common/tools/tool_transport.h"

namespace loom {

const Value* ToolSchema::find_tool(const std::string& name) const {
    if (!tools.is_object()) return nullptr;
    auto it = tools.find(name);
    return it == tools.end() ? nullptr : &(*it);
}

Error tool_error(const std::string& code, const std::string& message) {
    bool retriable = code != codes::NOT_FOUND && code != codes::INVALID_ARGS;
    return make_error(ErrorKind::TOOL, code, message, retriable);
}

std::optional<ToolAddress> parse_tool_uri(const ToolName& uri) {
    std::string rest = uri;
    auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        rest = rest.substr(scheme + 3);
    }
    auto dot = rest.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= rest.size()) {
        return std::nullopt;
    }
    return ToolAddress{rest.substr(0, dot), rest.substr(dot + 1)};
}

} // namespace loom
