// modules/executor/plan_arena.h
#ifndef LOOM_MODULES_EXECUTOR_PLAN_ARENA_H
#define LOOM_MODULES_EXECUTOR_PLAN_ARENA_H

#include "core/types/plan.h"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace loom {

struct ArenaNode {
    NodeSpec spec;
    std::optional<NodeId> superseded_by;

    bool active() const { return !superseded_by.has_value(); }
};

// Every NodeSpec a run has seen, indexed by id. A re-plan never edits the
// original Plan: replaced nodes get a superseded_by pointer and the new
// subgraph is appended, so both the planned and the executed graph stay
// visible.
class PlanArena {
public:
    explicit PlanArena(const Plan& plan);

    const std::string& original_hash() const { return original_hash_; }

    const ArenaNode* node(const NodeId& id) const;
    // Active node or nullptr
    const NodeSpec* find(const NodeId& id) const;

    const std::map<NodeId, ArenaNode>& nodes() const { return nodes_; }

    // Active nodes in dependency-then-id order
    const std::vector<NodeId>& order() const { return order_; }

    std::vector<NodeId> dependents(const NodeId& id) const;
    std::set<NodeId> transitive_dependents(const NodeId& id) const;
    std::set<NodeId> ancestors(const NodeId& id) const;

    // Replaces ids with subgraph. The active graph must stay a valid DAG;
    // throws LoomError(CODE/PLAN_INVALID) otherwise and leaves the arena
    // unchanged.
    void supersede(const std::vector<NodeId>& ids, std::vector<NodeSpec> subgraph);

    int generation() const { return generation_; }

    nlohmann::json to_json() const;

private:
    void rebuild(const Plan& active);

    std::string original_hash_;
    std::map<NodeId, ArenaNode> nodes_;
    std::vector<NodeId> order_;
    std::map<NodeId, std::vector<NodeId>> dependents_;
    int generation_ = 0;
};

} // namespace loom

#endif // LOOM_MODULES_EXECUTOR_PLAN_ARENA_H
