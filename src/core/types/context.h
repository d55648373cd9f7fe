#ifndef LOOM_TYPES_CONTEXT_H
#define LOOM_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>
#include <string>

namespace loom {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;

using NodeId = std::string;   // e.g., "fetch", "r1.summarize"
using ToolName = std::string; // e.g., "mcp://fs.read"
using RunId = std::string;

} // namespace loom

#endif // LOOM_TYPES_CONTEXT_H
