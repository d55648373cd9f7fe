// modules/planner/plan_parser.h
#ifndef LOOM_MODULES_PLANNER_PLAN_PARSER_H
#define LOOM_MODULES_PLANNER_PLAN_PARSER_H

#include "core/types/plan.h"
#include "core/types/budget.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace loom {

// Plan documents (YAML or JSON):
//
//   nodes:
//     - id: fetch
//       engine: script
//       deps: []
//       allowed_tools: [mcp://fs.list]
//       params: {dir: "{{ inputs.dir }}"}
//       budget: {cpu_ms: 500}
//       code: |
//         return call("mcp://fs.list", {path: params.dir})
//
// An LLM answer may wrap the document in a ```yaml or ```json fence.
class PlanParser {
public:
    explicit PlanParser(Budget default_budget = {}) : default_budget_(default_budget) {}

    // Throws LoomError(CODE/PLAN_INVALID)
    std::vector<NodeSpec> parse_from_string(const std::string& text) const;
    std::vector<NodeSpec> parse_from_file(const std::string& file_path) const;
    std::vector<NodeSpec> parse_document(const nlohmann::json& doc) const;

    NodeSpec create_node_from_json(const nlohmann::json& node_json) const;

private:
    Budget default_budget_;
};

// Contents of the first fenced block, or the whole text when there is none
std::string extract_fenced_block(const std::string& text);

} // namespace loom

#endif // LOOM_MODULES_PLANNER_PLAN_PARSER_H
