// modules/executor/approval_broker.cpp
#include "modules/executor/approval_broker.h"
#include "common/logging/logging.h"

namespace loom {

std::string to_string(ApprovalDecision decision) {
    switch (decision) {
        case ApprovalDecision::APPROVED: return "approved";
        case ApprovalDecision::DENIED: return "denied";
        case ApprovalDecision::TIMED_OUT: return "timed_out";
        case ApprovalDecision::CANCELLED: return "cancelled";
    }
    return "cancelled";
}

void ApprovalBroker::open(const RunId& run_id, const NodeId& node_id, Clock::time_point deadline,
                          Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    waiting_[{run_id, node_id}] = Entry{deadline, std::move(callback)};
    LOOM_LOG_INFO("approval requested", {StringField("run", run_id), StringField("node", node_id)});
}

bool ApprovalBroker::resolve(const RunId& run_id, const NodeId& node_id, bool approved) {
    Callback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = waiting_.find({run_id, node_id});
        if (it == waiting_.end()) return false;
        callback = std::move(it->second.callback);
        waiting_.erase(it);
    }
    LOOM_LOG_INFO("approval resolved", {StringField("run", run_id), StringField("node", node_id),
                                        BoolField("approved", approved)});
    // 回调在锁外执行
    callback(node_id, approved ? ApprovalDecision::APPROVED : ApprovalDecision::DENIED);
    return true;
}

std::vector<NodeId> ApprovalBroker::expire(const RunId& run_id, Clock::time_point now) {
    std::vector<std::pair<NodeId, Callback>> fired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = waiting_.lower_bound({run_id, NodeId()}); it != waiting_.end() && it->first.first == run_id;) {
            if (it->second.deadline <= now) {
                fired.emplace_back(it->first.second, std::move(it->second.callback));
                it = waiting_.erase(it);
            } else {
                ++it;
            }
        }
    }
    std::vector<NodeId> ids;
    for (auto& [node_id, callback] : fired) {
        LOOM_LOG_WARN("approval timed out", {StringField("run", run_id), StringField("node", node_id)});
        callback(node_id, ApprovalDecision::TIMED_OUT);
        ids.push_back(node_id);
    }
    return ids;
}

void ApprovalBroker::cancel_run(const RunId& run_id) {
    std::vector<std::pair<NodeId, Callback>> fired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = waiting_.lower_bound({run_id, NodeId()}); it != waiting_.end() && it->first.first == run_id;) {
            fired.emplace_back(it->first.second, std::move(it->second.callback));
            it = waiting_.erase(it);
        }
    }
    for (auto& [node_id, callback] : fired) {
        callback(node_id, ApprovalDecision::CANCELLED);
    }
}

std::vector<NodeId> ApprovalBroker::pending(const RunId& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NodeId> ids;
    for (auto it = waiting_.lower_bound({run_id, NodeId()}); it != waiting_.end() && it->first.first == run_id; ++it) {
        ids.push_back(it->first.second);
    }
    return ids;
}

} // namespace loom
