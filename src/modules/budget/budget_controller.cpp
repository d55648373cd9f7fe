// modules/budget/budget_controller.cpp
#include "modules/budget/budget_controller.h"

namespace loom {

std::optional<Error> BudgetController::admit(const NodeSpec& node) {
    if (budget_.wall_exceeded()) {
        return make_error(ErrorKind::BUDGET, codes::RUN_LIMIT,
                          "run wall clock exhausted after " + std::to_string(budget_.elapsed_ms()) + "ms");
    }
    // 有工具的节点在工具调用额度耗尽后无法完成
    if (!node.unit.allowed_tools.empty() && budget_.tool_calls_exhausted()) {
        return make_error(ErrorKind::BUDGET, codes::RUN_LIMIT,
                          "run tool call limit reached (" + std::to_string(budget_.limits.max_tool_calls) + ")");
    }
    if (!budget_.try_consume_node()) {
        return make_error(ErrorKind::BUDGET, codes::RUN_LIMIT,
                          "run node limit reached (" + std::to_string(budget_.limits.max_nodes) + ")");
    }
    return std::nullopt;
}

std::optional<Error> BudgetController::breach() const {
    if (budget_.wall_exceeded()) {
        return make_error(ErrorKind::BUDGET, codes::RUN_LIMIT,
                          "run wall clock exhausted after " + std::to_string(budget_.elapsed_ms()) + "ms");
    }
    if (budget_.tool_limit_breached()) {
        return make_error(ErrorKind::BUDGET, codes::RUN_LIMIT,
                          "run tool call limit exceeded (" + std::to_string(budget_.limits.max_tool_calls) + ")");
    }
    return std::nullopt;
}

int BudgetController::remaining_nodes() const {
    if (budget_.limits.max_nodes < 0) return -1;
    int left = budget_.limits.max_nodes - budget_.nodes_used.load();
    return left > 0 ? left : 0;
}

nlohmann::json BudgetController::snapshot(const Budget& node_budget) const {
    return {
        {"node", node_budget},
        {"run", {
            {"nodes_used", budget_.nodes_used.load()},
            {"tool_calls_used", budget_.tool_calls_used.load()},
            {"elapsed_ms", budget_.elapsed_ms()},
            {"limits", budget_.limits}
        }}
    };
}

} // namespace loom
