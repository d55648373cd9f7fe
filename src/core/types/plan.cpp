#include "core/types/plan.h"
#include "core/types/error.h"
#include "common/utils/hash.h"
#include <algorithm>
#include <set>

namespace loom {

std::string to_string(NodeKind kind) {
    return kind == NodeKind::APPROVAL ? "approval" : "unit";
}

NodeKind node_kind_from_string(const std::string& text) {
    if (text == "unit") return NodeKind::UNIT;
    if (text == "approval") return NodeKind::APPROVAL;
    throw std::runtime_error("Unknown node kind '" + text + "'");
}

void to_json(nlohmann::json& j, const ExecutionUnit& u) {
    j = nlohmann::json{
        {"engine", u.engine},
        {"code", u.code},
        {"params", u.params},
        {"allowed_tools", u.allowed_tools},
        {"budget", u.budget}
    };
}

void from_json(const nlohmann::json& j, ExecutionUnit& u) {
    u.engine = j.value("engine", std::string("script"));
    u.code = j.value("code", std::string());
    u.params = j.value("params", nlohmann::json::object());
    u.allowed_tools = j.value("allowed_tools", std::vector<ToolName>{});
    u.budget = budget_from_json(j.value("budget", nlohmann::json()), Budget{});
}

void to_json(nlohmann::json& j, const NodeSpec& n) {
    j = nlohmann::json{
        {"id", n.id},
        {"kind", to_string(n.kind)},
        {"deps", n.deps},
        {"unit", n.unit},
        {"idempotent", n.idempotent},
        {"mutating", n.mutating},
        {"write_fields", n.write_fields},
        {"description", n.description},
        {"generation", n.generation}
    };
}

void from_json(const nlohmann::json& j, NodeSpec& n) {
    n.id = j.at("id").get<std::string>();
    n.kind = node_kind_from_string(j.value("kind", std::string("unit")));
    n.deps = j.value("deps", std::vector<NodeId>{});
    if (j.contains("unit")) {
        n.unit = j["unit"].get<ExecutionUnit>();
    }
    n.idempotent = j.value("idempotent", false);
    n.mutating = j.value("mutating", false);
    n.write_fields = j.value("write_fields", std::vector<std::string>{});
    n.description = j.value("description", std::string());
    n.generation = j.value("generation", 0);
}

static Error plan_invalid(const std::string& message) {
    return make_error(ErrorKind::CODE, codes::PLAN_INVALID, message);
}

Plan::Plan(std::vector<NodeSpec> nodes) : nodes_(std::move(nodes)) {
    std::sort(nodes_.begin(), nodes_.end(),
              [](const NodeSpec& a, const NodeSpec& b) { return a.id < b.id; });

    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].id.empty()) {
            throw LoomError(plan_invalid("node with empty id"));
        }
        if (!index_.emplace(nodes_[i].id, i).second) {
            throw LoomError(plan_invalid("duplicate node id: " + nodes_[i].id));
        }
    }

    // 1. 计算入度
    std::unordered_map<NodeId, int> in_degree;
    for (const auto& node : nodes_) {
        std::set<NodeId> unique_deps(node.deps.begin(), node.deps.end());
        for (const auto& dep : unique_deps) {
            if (index_.count(dep) == 0) {
                throw LoomError(plan_invalid("node '" + node.id + "' depends on unknown node '" + dep + "'"));
            }
            if (dep == node.id) {
                throw LoomError(plan_invalid("node '" + node.id + "' depends on itself"));
            }
        }
        in_degree[node.id] = static_cast<int>(unique_deps.size());
    }

    // 2. Kahn, ready set ordered by id
    std::set<NodeId> ready;
    for (const auto& [id, degree] : in_degree) {
        if (degree == 0) ready.insert(id);
    }
    while (!ready.empty()) {
        NodeId current = *ready.begin();
        ready.erase(ready.begin());
        topo_order_.push_back(current);
        for (const auto& dependent : dependents(current)) {
            if (--in_degree[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }
    if (topo_order_.size() != nodes_.size()) {
        throw LoomError(plan_invalid("dependency cycle detected"));
    }

    hash_ = hash_json(HashDomain::PLAN, canonical_json());
}

const NodeSpec* Plan::find(const NodeId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

std::vector<NodeId> Plan::dependents(const NodeId& id) const {
    std::vector<NodeId> out;
    for (const auto& node : nodes_) {
        if (std::find(node.deps.begin(), node.deps.end(), id) != node.deps.end()) {
            out.push_back(node.id);
        }
    }
    return out;
}

nlohmann::json Plan::canonical_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& node : nodes_) {
        arr.push_back(node);
    }
    return nlohmann::json{{"nodes", arr}};
}

} // namespace loom
