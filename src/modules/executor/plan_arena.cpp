// modules/executor/plan_arena.cpp
#include "modules/executor/plan_arena.h"
#include "core/types/error.h"
#include <algorithm>

namespace loom {

PlanArena::PlanArena(const Plan& plan) : original_hash_(plan.hash()) {
    for (const auto& spec : plan.nodes()) {
        nodes_[spec.id] = ArenaNode{spec, std::nullopt};
    }
    rebuild(plan);
}

void PlanArena::rebuild(const Plan& active) {
    order_ = active.topological_order();
    dependents_.clear();
    for (const auto& spec : active.nodes()) {
        for (const auto& dep : spec.deps) dependents_[dep].push_back(spec.id);
    }
    for (auto& [_, list] : dependents_) std::sort(list.begin(), list.end());
}

const ArenaNode* PlanArena::node(const NodeId& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const NodeSpec* PlanArena::find(const NodeId& id) const {
    const ArenaNode* n = node(id);
    return (n && n->active()) ? &n->spec : nullptr;
}

std::vector<NodeId> PlanArena::dependents(const NodeId& id) const {
    auto it = dependents_.find(id);
    return it == dependents_.end() ? std::vector<NodeId>{} : it->second;
}

std::set<NodeId> PlanArena::transitive_dependents(const NodeId& id) const {
    std::set<NodeId> seen;
    std::vector<NodeId> stack = dependents(id);
    while (!stack.empty()) {
        NodeId cur = stack.back();
        stack.pop_back();
        if (!seen.insert(cur).second) continue;
        for (const auto& next : dependents(cur)) stack.push_back(next);
    }
    return seen;
}

std::set<NodeId> PlanArena::ancestors(const NodeId& id) const {
    std::set<NodeId> seen;
    const NodeSpec* start = find(id);
    if (!start) return seen;
    std::vector<NodeId> stack = start->deps;
    while (!stack.empty()) {
        NodeId cur = stack.back();
        stack.pop_back();
        if (!seen.insert(cur).second) continue;
        if (const NodeSpec* spec = find(cur)) {
            for (const auto& d : spec->deps) stack.push_back(d);
        }
    }
    return seen;
}

void PlanArena::supersede(const std::vector<NodeId>& ids, std::vector<NodeSpec> subgraph) {
    if (subgraph.empty()) {
        throw LoomError(make_error(ErrorKind::CODE, codes::PLAN_INVALID, "empty replacement subgraph"));
    }
    const std::set<NodeId> replaced(ids.begin(), ids.end());

    std::vector<NodeSpec> active;
    for (const auto& [id, n] : nodes_) {
        if (n.active() && !replaced.count(id)) active.push_back(n.spec);
    }
    for (const auto& spec : subgraph) {
        if (nodes_.count(spec.id)) {
            throw LoomError(make_error(ErrorKind::CODE, codes::PLAN_INVALID,
                                       "replacement reuses node id '" + spec.id + "'"));
        }
        active.push_back(spec);
    }
    Plan next(std::move(active)); // 校验依赖与环

    // 子图中最后一个拓扑位置的节点作为替代目标
    NodeId target;
    std::set<NodeId> fresh;
    for (const auto& spec : subgraph) fresh.insert(spec.id);
    for (const auto& id : next.topological_order()) {
        if (fresh.count(id)) target = id;
    }

    for (const auto& id : replaced) {
        auto it = nodes_.find(id);
        if (it != nodes_.end()) it->second.superseded_by = target;
    }
    for (auto& spec : subgraph) {
        NodeId id = spec.id;
        nodes_[id] = ArenaNode{std::move(spec), std::nullopt};
    }
    ++generation_;
    rebuild(next);
}

nlohmann::json PlanArena::to_json() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& [id, n] : nodes_) {
        nlohmann::json j = n.spec;
        j["superseded_by"] = n.superseded_by ? nlohmann::json(*n.superseded_by) : nlohmann::json();
        out.push_back(std::move(j));
    }
    return {{"plan_hash", original_hash_}, {"generation", generation_}, {"nodes", out}};
}

} // namespace loom
