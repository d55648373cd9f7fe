// modules/executor/approval_broker.h
#ifndef LOOM_MODULES_EXECUTOR_APPROVAL_BROKER_H
#define LOOM_MODULES_EXECUTOR_APPROVAL_BROKER_H

#include "core/types/context.h"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace loom {

enum class ApprovalDecision {
    APPROVED,
    DENIED,
    TIMED_OUT,
    CANCELLED
};

std::string to_string(ApprovalDecision decision);

// 外部审批信号的汇合点。每个待审批节点只会得到一次决定：
// resolve / expire / cancel_run 谁先摘掉条目谁生效。
class ApprovalBroker {
public:
    using Callback = std::function<void(const NodeId&, ApprovalDecision)>;
    using Clock = std::chrono::steady_clock;

    void open(const RunId& run_id, const NodeId& node_id, Clock::time_point deadline, Callback callback);

    // false when nothing is waiting under that id
    bool resolve(const RunId& run_id, const NodeId& node_id, bool approved);

    // Fires TIMED_OUT for entries of run_id whose deadline has passed
    std::vector<NodeId> expire(const RunId& run_id, Clock::time_point now = Clock::now());

    // Fires CANCELLED for every entry of run_id
    void cancel_run(const RunId& run_id);

    std::vector<NodeId> pending(const RunId& run_id) const;

private:
    struct Entry {
        Clock::time_point deadline;
        Callback callback;
    };
    using Key = std::pair<RunId, NodeId>;

    mutable std::mutex mutex_;
    std::map<Key, Entry> waiting_;
};

} // namespace loom

#endif // LOOM_MODULES_EXECUTOR_APPROVAL_BROKER_H
