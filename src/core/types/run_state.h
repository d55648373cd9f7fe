#ifndef LOOM_TYPES_RUN_STATE_H
#define LOOM_TYPES_RUN_STATE_H

#include "context.h"
#include "error.h"
#include "result.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace loom {

// Pending → Ready → Running → {Succeeded, Failed, Skipped}
enum class NodeState {
    PENDING,
    READY,
    RUNNING,
    SUCCEEDED,
    FAILED,
    SKIPPED
};

std::string to_string(NodeState state);
NodeState node_state_from_string(const std::string& text);
inline bool is_terminal(NodeState s) {
    return s == NodeState::SUCCEEDED || s == NodeState::FAILED || s == NodeState::SKIPPED;
}

struct NodeRecord {
    NodeId id;
    NodeState state = NodeState::PENDING;
    int attempts = 0;
    bool from_cache = false;
    std::optional<ResultEnvelope> result;
    std::optional<Error> error;
    uint64_t completion_seq = 0; // 终态顺序，0 表示未完成
};

// 单次运行的共享状态。只有 Executor 在节点进入终态后修改它。
class RunState {
public:
    explicit RunState(Value initial_state = Value::object());

    NodeRecord& record(const NodeId& id);
    const NodeRecord* find(const NodeId& id) const;
    const std::map<NodeId, NodeRecord>& records() const { return records_; }

    void mark(const NodeId& id, NodeState state);

    // Terminal success: state_updates are merged immediately (last writer wins)
    void complete(const NodeId& id, ResultEnvelope envelope, bool from_cache);
    void fail(const NodeId& id, Error error);
    void skip(const NodeId& id, std::optional<Error> reason = std::nullopt);

    const Value& state() const { return state_; }
    const Value& initial_state() const { return initial_state_; }

    // Ids in terminal completion order, ties by id
    std::vector<NodeId> completion_order() const;

private:
    std::map<NodeId, NodeRecord> records_;
    Value initial_state_;
    Value state_;
    uint64_t next_seq_ = 1;
};

enum class RunOutcome {
    SUCCEEDED,
    PARTIAL,
    FAILED,
    CANCELLED
};

std::string to_string(RunOutcome outcome);

struct NodeError {
    NodeId node;
    Error error;
};

struct RunSummary {
    RunId run_id;
    std::string plan_hash;
    RunOutcome outcome = RunOutcome::SUCCEEDED;
    std::string summary;
    std::string summary_hash;
    std::vector<ArtifactHandle> artifacts;
    Value state = Value::object();
    std::map<NodeId, NodeState> nodes;
    std::vector<NodeError> errors;
    std::optional<Error> terminating_error;
    Metrics totals;
    int replans = 0;
};

void to_json(nlohmann::json& j, const NodeError& e);
void to_json(nlohmann::json& j, const RunSummary& s);

} // namespace loom

#endif // LOOM_TYPES_RUN_STATE_H
