#include "constraints.h"

namespace loom {

void to_json(nlohmann::json& j, const Constraints& c) {
    j = nlohmann::json{
        {"run_limits", c.run_limits},
        {"disallowed_tools", c.disallowed_tools},
        {"max_plan_nodes", c.max_plan_nodes},
        {"approval_timeout_ms", c.approval_timeout_ms},
        {"inputs", c.inputs}
    };
    if (c.default_budget) j["default_budget"] = *c.default_budget;
    if (c.max_node_budget) j["max_node_budget"] = *c.max_node_budget;
    if (c.plan_document) j["plan_document"] = *c.plan_document;
    if (c.manifest) j["manifest"] = *c.manifest;
}

void from_json(const nlohmann::json& j, Constraints& c) {
    if (j.contains("default_budget")) c.default_budget = j["default_budget"].get<Budget>();
    if (j.contains("max_node_budget")) c.max_node_budget = j["max_node_budget"].get<Budget>();
    if (j.contains("run_limits")) c.run_limits = j["run_limits"].get<RunLimits>();
    c.disallowed_tools = j.value("disallowed_tools", std::vector<ToolName>{});
    c.max_plan_nodes = j.value("max_plan_nodes", -1);
    c.approval_timeout_ms = j.value("approval_timeout_ms", int64_t{-1});
    c.inputs = j.value("inputs", Value::object());
    if (j.contains("plan_document") && !j["plan_document"].is_null()) {
        const auto& doc = j["plan_document"];
        c.plan_document = doc.is_string() ? doc.get<std::string>() : doc.dump();
    }
    if (j.contains("manifest") && !j["manifest"].is_null()) {
        c.manifest = j["manifest"];
    }
}

} // namespace loom
