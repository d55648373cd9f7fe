// modules/planner/planner.h
#ifndef LOOM_MODULES_PLANNER_PLANNER_H
#define LOOM_MODULES_PLANNER_PLANNER_H

#include "core/types/constraints.h"
#include "core/types/error.h"
#include "core/types/plan.h"
#include "common/llm/completion.h"
#include "modules/planner/plan_parser.h"
#include "modules/policy/capability_manifest.h"
#include "modules/sandbox/sandbox_engine.h"
#include <string>
#include <vector>

namespace loom {

// What the executor knows when it asks for a substitute subgraph
struct ReplanRequest {
    std::string goal;
    NodeId failed_node;
    Error error;
    std::vector<NodeId> superseded;  // failed node and its unfinished dependents
    std::vector<NodeId> completed;   // succeeded nodes the subgraph may depend on
    ExecutionUnit failed_unit;
    Value state = Value::object();
    int generation = 1;
    int remaining_nodes = -1;        // -1 表示无限制
};

// goal + constraints -> Plan. Tool schemas are not consulted here: tools are
// only checked by name against engine capabilities and the manifest, and the
// schema is fetched by the tool client when a node first calls it.
class Planner {
public:
    static constexpr const char* kApprovalPrefix = "approve.";

    Planner(const EngineRegistry& engines, CompletionProvider* completion = nullptr,
            Budget fallback_budget = {});

    // Throws LoomError(CODE/PLAN_INVALID)
    Plan plan(const std::string& goal, const Constraints& constraints,
              const CapabilityManifest& manifest) const;

    // Subgraph whose ids carry the "r<generation>." prefix. Returns an empty
    // list when no completion provider is available. Throws
    // LoomError(CODE/PLAN_INVALID) when the answer is unusable.
    std::vector<NodeSpec> replan(const ReplanRequest& request, const Constraints& constraints,
                                 const CapabilityManifest& manifest) const;

    bool can_replan() const { return completion_ != nullptr; }

    // Shaping steps, exposed for tests
    std::vector<NodeSpec> fuse_local_chains(std::vector<NodeSpec> nodes) const;
    std::vector<NodeSpec> insert_approvals(std::vector<NodeSpec> nodes) const;
    void validate(const std::vector<NodeSpec>& nodes, const Constraints& constraints,
                  const CapabilityManifest& manifest) const;

private:
    std::vector<NodeSpec> draft(const std::string& goal, const Constraints& constraints,
                                const nlohmann::json& catalog) const;
    std::vector<NodeSpec> shape(std::vector<NodeSpec> nodes, const Constraints& constraints) const;
    std::string build_prompt(const std::string& goal, const Constraints& constraints,
                             const nlohmann::json& catalog) const;
    std::string build_replan_prompt(const ReplanRequest& request, const nlohmann::json& catalog) const;
    std::string ask(const std::string& prompt) const;
    Budget default_budget(const Constraints& constraints) const;

    // Tools some engine exposes and the manifest allows
    nlohmann::json tool_catalog(const Constraints& constraints, const CapabilityManifest& manifest) const;

    const EngineRegistry& engines_;
    CompletionProvider* completion_;
    Budget fallback_budget_;
};

} // namespace loom

#endif // LOOM_MODULES_PLANNER_PLANNER_H
