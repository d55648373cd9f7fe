#ifndef LOOM_TYPES_CONSTRAINTS_H
#define LOOM_TYPES_CONSTRAINTS_H

#include "context.h"
#include "budget.h"
#include <optional>
#include <string>
#include <vector>

namespace loom {

// 一次运行的显式约束
struct Constraints {
    std::optional<Budget> default_budget;   // per-node budget when a node names none
    std::optional<Budget> max_node_budget;  // ceiling applied to every planned node
    RunLimits run_limits;
    std::vector<ToolName> disallowed_tools;
    int max_plan_nodes = -1;                // -1 表示无限制
    int64_t approval_timeout_ms = -1;       // -1 uses the executor default
    Value inputs = Value::object();
    std::optional<std::string> plan_document; // ready plan, bypasses the completion provider
    std::optional<Value> manifest;            // inline capability manifest
};

void to_json(nlohmann::json& j, const Constraints& c);
// plan_document may be given as text or as an inline mapping
void from_json(const nlohmann::json& j, Constraints& c);

} // namespace loom

#endif // LOOM_TYPES_CONSTRAINTS_H
