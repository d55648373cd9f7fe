#ifndef LOOM_TYPES_BUDGET_H
#define LOOM_TYPES_BUDGET_H

#include "context.h" // 引入 Value
#include <atomic>
#include <chrono>
#include <cstdint>

namespace loom {

// 单个节点的资源上限
struct Budget {
    int64_t cpu_ms = 2000;
    int64_t mem_mb = 256;
    int64_t max_ops = 1'000'000;
    int64_t max_output_bytes = 64 * 1024;
    int64_t token_cap = 2048;
    int64_t wall_ms = -1; // -1 表示由引擎推导 (2 * cpu_ms + grace)

    // Field-wise minimum; a ceiling of -1 on wall_ms leaves it untouched
    Budget clamped_to(const Budget& ceiling) const;
    bool operator==(const Budget&) const = default;
};

void to_json(nlohmann::json& j, const Budget& b);
// Missing fields keep the defaults already present in b
void from_json(const nlohmann::json& j, Budget& b);
Budget budget_from_json(const nlohmann::json& j, const Budget& defaults);

// 运行级限制
struct RunLimits {
    int max_nodes = -1;         // -1 表示无限制
    int64_t max_wall_ms = -1;
    int max_tool_calls = -1;
    int max_replans = 1;
};

void to_json(nlohmann::json& j, const RunLimits& r);
void from_json(const nlohmann::json& j, RunLimits& r);

// Run-level counters shared by the executor and the tool client
struct RunBudget {
    RunLimits limits;

    mutable std::atomic<int> nodes_used{0};
    mutable std::atomic<int> tool_calls_used{0};
    // 有调用因额度耗尽被拒绝；即使脚本吞掉了错误，运行也要中止
    mutable std::atomic<bool> tool_limit_hit{false};
    std::chrono::steady_clock::time_point start_time;

    explicit RunBudget(RunLimits l = {})
        : limits(l), start_time(std::chrono::steady_clock::now()) {}

    RunBudget(const RunBudget&) = delete;
    RunBudget& operator=(const RunBudget&) = delete;

    int64_t elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
    }

    // Milliseconds until the run wall clock expires, -1 when unbounded
    int64_t remaining_wall_ms() const {
        if (limits.max_wall_ms < 0) return -1;
        int64_t left = limits.max_wall_ms - elapsed_ms();
        return left > 0 ? left : 0;
    }

    bool wall_exceeded() const {
        return limits.max_wall_ms >= 0 && elapsed_ms() >= limits.max_wall_ms;
    }

    bool try_consume_node() {
        int expected = nodes_used.load();
        do {
            if (limits.max_nodes >= 0 && expected >= limits.max_nodes) return false;
        } while (!nodes_used.compare_exchange_weak(expected, expected + 1));
        return true;
    }

    bool try_consume_tool_call() {
        int expected = tool_calls_used.load();
        do {
            if (limits.max_tool_calls >= 0 && expected >= limits.max_tool_calls) {
                tool_limit_hit.store(true);
                return false;
            }
        } while (!tool_calls_used.compare_exchange_weak(expected, expected + 1));
        return true;
    }

    bool nodes_exhausted() const {
        return limits.max_nodes >= 0 && nodes_used.load() >= limits.max_nodes;
    }

    bool tool_limit_breached() const { return tool_limit_hit.load(); }

    bool tool_calls_exhausted() const {
        return limits.max_tool_calls >= 0 && tool_calls_used.load() >= limits.max_tool_calls;
    }
};

} // namespace loom

#endif // LOOM_TYPES_BUDGET_H
