#ifndef LOOM_TYPES_PLAN_H
#define LOOM_TYPES_PLAN_H

#include "context.h"
#include "budget.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace loom {

enum class NodeKind {
    UNIT,     // sandboxed execution unit
    APPROVAL  // 无副作用的审批节点，仅等待外部批准
};

std::string to_string(NodeKind kind);
NodeKind node_kind_from_string(const std::string& text);

// 一次沙箱执行请求
struct ExecutionUnit {
    std::string engine = "script";
    std::string code;
    Value params = Value::object();
    std::vector<ToolName> allowed_tools;
    Budget budget;
};

struct NodeSpec {
    NodeId id;
    NodeKind kind = NodeKind::UNIT;
    std::vector<NodeId> deps; // declaration order is kept
    ExecutionUnit unit;
    bool idempotent = false;
    bool mutating = false;
    std::vector<std::string> write_fields;
    std::string description;
    int generation = 0; // 0 for the original plan, n for the n-th re-plan

    const Budget& budget() const { return unit.budget; }
    bool is_approval() const { return kind == NodeKind::APPROVAL; }
};

void to_json(nlohmann::json& j, const ExecutionUnit& u);
void from_json(const nlohmann::json& j, ExecutionUnit& u);
void to_json(nlohmann::json& j, const NodeSpec& n);
void from_json(const nlohmann::json& j, NodeSpec& n);

// Immutable DAG of NodeSpecs. Nodes are kept sorted by id; the hash is
// BLAKE3 over the canonical serialization.
class Plan {
public:
    Plan() = default;
    // Throws LoomError(CODE/PLAN_INVALID) on duplicate ids, unknown deps or cycles
    explicit Plan(std::vector<NodeSpec> nodes);

    const std::vector<NodeSpec>& nodes() const { return nodes_; }
    const NodeSpec* find(const NodeId& id) const;
    const std::string& hash() const { return hash_; }
    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    nlohmann::json canonical_json() const;

    // Kahn's algorithm, ready ties broken by ascending id
    const std::vector<NodeId>& topological_order() const { return topo_order_; }

    // Direct dependents of a node
    std::vector<NodeId> dependents(const NodeId& id) const;

private:
    std::vector<NodeSpec> nodes_;
    std::unordered_map<NodeId, size_t> index_;
    std::vector<NodeId> topo_order_;
    std::string hash_;
};

} // namespace loom

#endif // LOOM_TYPES_PLAN_H
