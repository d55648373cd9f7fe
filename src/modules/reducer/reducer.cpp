// modules/reducer/reducer.cpp
#include "modules/reducer/reducer.h"
#include "common/utils/hash.h"
#include <set>

namespace loom {

void Reducer::merge_state(Value& target, const Value& updates) {
    if (!updates.is_object()) return;
    if (!target.is_object()) target = Value::object();
    for (auto it = updates.begin(); it != updates.end(); ++it) {
        target[it.key()] = it.value();
    }
}

std::string Reducer::compose_summary(const std::vector<std::string>& lines) const {
    const size_t budget = config_.summary_char_budget;
    std::string out;
    size_t used_lines = 0;
    for (const auto& line : lines) {
        size_t needed = line.size() + (out.empty() ? 0 : 1);
        size_t left_after = lines.size() - used_lines - 1;
        // 还有剩余行时为 "+N more" 预留位置
        size_t reserve = left_after > 0 ? std::to_string(left_after).size() + 8 : 0;
        if (out.size() + needed + reserve > budget) break;
        if (!out.empty()) out += '\n';
        out += line;
        ++used_lines;
    }
    if (used_lines < lines.size()) {
        if (!out.empty()) out += '\n';
        out += "+" + std::to_string(lines.size() - used_lines) + " more";
    }
    return out;
}

RunSummary Reducer::reduce(const RunState& run_state, const ReduceRequest& request) const {
    RunSummary summary;
    summary.run_id = request.run_id;
    summary.plan_hash = request.plan_hash;
    summary.replans = request.replans;
    summary.terminating_error = request.terminating_error;
    summary.state = run_state.initial_state().is_object() ? run_state.initial_state() : Value::object();

    // 合并顺序：执行图的拓扑序，其后是被替换的节点（按 id）
    std::vector<NodeId> order = request.order;
    std::set<NodeId> listed(order.begin(), order.end());
    for (const auto& [id, _] : run_state.records()) {
        if (!listed.count(id)) order.push_back(id);
    }
    const std::set<NodeId> superseded(request.superseded.begin(), request.superseded.end());

    std::vector<std::string> lines;
    bool any_succeeded = false;
    bool all_succeeded = true;
    for (const auto& id : order) {
        const NodeRecord* rec = run_state.find(id);
        NodeState state = rec ? rec->state : NodeState::PENDING;
        summary.nodes[id] = state;

        if (rec && rec->result) {
            merge_state(summary.state, rec->result->state_updates);
            for (const auto& a : rec->result->artifacts) summary.artifacts.push_back(a);
            summary.totals.accumulate(rec->result->metrics);
        }
        if (rec && rec->error) {
            summary.errors.push_back(NodeError{id, *rec->error});
        }

        if (state == NodeState::SUCCEEDED) {
            if (rec && rec->result && !rec->result->summary.empty()) {
                lines.push_back("[" + id + "] " + rec->result->summary);
            }
        } else if (state == NodeState::FAILED && rec && rec->error) {
            lines.push_back("[" + id + "] failed: " + rec->error->qualified());
        }

        if (superseded.count(id)) continue;
        if (state == NodeState::SUCCEEDED) {
            any_succeeded = true;
        } else {
            all_succeeded = false;
        }
    }

    if (request.cancelled) {
        summary.outcome = RunOutcome::CANCELLED;
    } else if (request.terminating_error) {
        summary.outcome = RunOutcome::FAILED;
    } else if (all_succeeded) {
        summary.outcome = RunOutcome::SUCCEEDED;
    } else {
        summary.outcome = any_succeeded ? RunOutcome::PARTIAL : RunOutcome::FAILED;
    }

    summary.summary = compose_summary(lines);
    summary.summary_hash = hash_bytes(HashDomain::SUMMARY, summary.summary);
    return summary;
}

} // namespace loom
