#include "core/types/run_state.h"
#include <algorithm>
#include <stdexcept>

namespace loom {

std::string to_string(NodeState state) {
    switch (state) {
        case NodeState::PENDING: return "pending";
        case NodeState::READY: return "ready";
        case NodeState::RUNNING: return "running";
        case NodeState::SUCCEEDED: return "succeeded";
        case NodeState::FAILED: return "failed";
        case NodeState::SKIPPED: return "skipped";
    }
    return "pending";
}

NodeState node_state_from_string(const std::string& text) {
    if (text == "pending") return NodeState::PENDING;
    if (text == "ready") return NodeState::READY;
    if (text == "running") return NodeState::RUNNING;
    if (text == "succeeded") return NodeState::SUCCEEDED;
    if (text == "failed") return NodeState::FAILED;
    if (text == "skipped") return NodeState::SKIPPED;
    throw std::runtime_error("Unknown node state '" + text + "'");
}

std::string to_string(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::SUCCEEDED: return "succeeded";
        case RunOutcome::PARTIAL: return "partial";
        case RunOutcome::FAILED: return "failed";
        case RunOutcome::CANCELLED: return "cancelled";
    }
    return "failed";
}

RunState::RunState(Value initial_state)
    : initial_state_(initial_state.is_object() ? std::move(initial_state) : Value::object()),
      state_(initial_state_) {}

NodeRecord& RunState::record(const NodeId& id) {
    auto& rec = records_[id];
    rec.id = id;
    return rec;
}

const NodeRecord* RunState::find(const NodeId& id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

void RunState::mark(const NodeId& id, NodeState state) {
    record(id).state = state;
}

void RunState::complete(const NodeId& id, ResultEnvelope envelope, bool from_cache) {
    auto& rec = record(id);
    rec.state = NodeState::SUCCEEDED;
    rec.from_cache = from_cache;
    rec.error.reset();
    rec.completion_seq = next_seq_++;
    for (auto it = envelope.state_updates.begin(); it != envelope.state_updates.end(); ++it) {
        state_[it.key()] = it.value();
    }
    rec.result = std::move(envelope);
}

void RunState::fail(const NodeId& id, Error error) {
    auto& rec = record(id);
    rec.state = NodeState::FAILED;
    rec.error = std::move(error);
    rec.completion_seq = next_seq_++;
}

void RunState::skip(const NodeId& id, std::optional<Error> reason) {
    auto& rec = record(id);
    rec.state = NodeState::SKIPPED;
    rec.error = std::move(reason);
    rec.completion_seq = next_seq_++;
}

std::vector<NodeId> RunState::completion_order() const {
    std::vector<const NodeRecord*> done;
    for (const auto& [id, rec] : records_) {
        if (is_terminal(rec.state)) done.push_back(&rec);
    }
    std::sort(done.begin(), done.end(), [](const NodeRecord* a, const NodeRecord* b) {
        if (a->completion_seq != b->completion_seq) return a->completion_seq < b->completion_seq;
        return a->id < b->id;
    });
    std::vector<NodeId> out;
    out.reserve(done.size());
    for (const auto* rec : done) out.push_back(rec->id);
    return out;
}

void to_json(nlohmann::json& j, const NodeError& e) {
    j = nlohmann::json{{"node", e.node}, {"error", e.error}};
}

void to_json(nlohmann::json& j, const RunSummary& s) {
    nlohmann::json nodes = nlohmann::json::object();
    for (const auto& [id, state] : s.nodes) {
        nodes[id] = to_string(state);
    }
    j = nlohmann::json{
        {"run_id", s.run_id},
        {"plan_hash", s.plan_hash},
        {"outcome", to_string(s.outcome)},
        {"summary", s.summary},
        {"summary_hash", s.summary_hash},
        {"artifacts", s.artifacts},
        {"state", s.state},
        {"nodes", nodes},
        {"errors", s.errors},
        {"terminating_error", s.terminating_error ? nlohmann::json(*s.terminating_error) : nlohmann::json()},
        {"totals", s.totals},
        {"replans", s.replans}
    };
}

} // namespace loom
