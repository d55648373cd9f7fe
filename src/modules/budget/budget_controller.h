// modules/budget/budget_controller.h
#ifndef LOOM_MODULES_BUDGET_BUDGET_CONTROLLER_H
#define LOOM_MODULES_BUDGET_BUDGET_CONTROLLER_H

#include "core/types/budget.h" // 引入 RunBudget (已包含 atomic 计数器)
#include "core/types/error.h"
#include "core/types/plan.h"
#include <optional>

namespace loom {

// BudgetController 封装运行级预算的检查逻辑，在每次派发前调用
class BudgetController {
public:
    explicit BudgetController(RunBudget& budget) : budget_(budget) {}

    // 尝试为节点占用运行预算
    // 返回 BUDGET/RUN_LIMIT 表示运行必须中止
    std::optional<Error> admit(const NodeSpec& node);

    // 运行墙钟已用尽
    bool exceeded() const { return budget_.wall_exceeded(); }

    // A run-level limit was breached while nodes were running
    std::optional<Error> breach() const;

    // Nodes still allowed to run, -1 when unbounded
    int remaining_nodes() const;

    // 节点预算 + 运行计数器，写入 trace span
    nlohmann::json snapshot(const Budget& node_budget) const;

    const RunBudget& budget() const { return budget_; }

private:
    RunBudget& budget_;
};

} // namespace loom

#endif // LOOM_MODULES_BUDGET_BUDGET_CONTROLLER_H
