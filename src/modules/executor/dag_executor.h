// modules/executor/dag_executor.h
#ifndef LOOM_MODULES_EXECUTOR_DAG_EXECUTOR_H
#define LOOM_MODULES_EXECUTOR_DAG_EXECUTOR_H

#include "core/types/budget.h"
#include "core/types/plan.h"
#include "core/types/run_state.h"
#include "common/config/loom_config.h"
#include "modules/cache/result_cache.h"
#include "modules/executor/approval_broker.h"
#include "modules/executor/plan_arena.h"
#include "modules/executor/worker_pool.h"
#include "modules/planner/planner.h"
#include "modules/policy/policy_gate.h"
#include "modules/reducer/reducer.h"
#include "modules/sandbox/cancel_token.h"
#include "modules/sandbox/sandbox_engine.h"
#include "modules/tools/tool_client.h"
#include "modules/trace/trace_exporter.h"
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace loom {

struct ExecutionReport {
    RunState state;
    PlanArena arena;
    std::optional<Error> terminating_error;
    bool cancelled = false;
    int replans = 0;
};

// Runs one Plan to completion. Ready nodes are dispatched in ascending id
// order onto a fixed pool; the calling thread is the only one that touches
// RunState, and it does so only when a node reaches a terminal state.
class DagExecutor {
public:
    using ReplanHook = std::function<std::vector<NodeSpec>(const ReplanRequest&)>;

    DagExecutor(RunId run_id, const EngineRegistry& engines, ToolClient& tools, PolicyGate& gate,
                ResultCache& cache, ApprovalBroker& approvals, TraceExporter& trace,
                ExecutorConfig config = {}, int max_workers = 4);
    ~DagExecutor();

    DagExecutor(const DagExecutor&) = delete;
    DagExecutor& operator=(const DagExecutor&) = delete;

    // Without a hook failed nodes are never re-planned
    void set_replan_hook(ReplanHook hook) { replan_hook_ = std::move(hook); }

    // inputs: Constraints::inputs; inputs["state"] seeds the run state
    ExecutionReport execute(const Plan& plan, RunBudget& budget, const Value& inputs,
                            std::shared_ptr<CancelToken> cancel = nullptr);

    // execute() + Reducer; writes the run record to the trace
    RunSummary run(const Plan& plan, RunBudget& budget, const Value& inputs, const Reducer& reducer,
                   std::shared_ptr<CancelToken> cancel = nullptr);

    const RunId& run_id() const { return run_id_; }

private:
    struct Completion;
    struct Session;

    void dispatch_ready(Session& s);
    void dispatch_approval(Session& s, const NodeSpec& node);
    void dispatch_unit(Session& s, const NodeSpec& node, int attempt);
    void handle_completion(Session& s, Completion c);
    bool try_replan(Session& s, const NodeSpec& failed, const Error& error);
    void skip_dependents(Session& s, const NodeId& id);
    void abort(Session& s, std::optional<Error> reason);
    Value state_view(const Session& s, const NodeId& id) const;

    static bool retry_allowed(const NodeSpec& node, const Error& error, int attempt);
    static bool replan_allowed(const Error& error);

    RunId run_id_;
    const EngineRegistry& engines_;
    ToolClient& tools_;
    PolicyGate& gate_;
    ResultCache& cache_;
    ApprovalBroker& approvals_;
    TraceExporter& trace_;
    ExecutorConfig config_;
    ReplanHook replan_hook_;
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace loom

#endif // LOOM_MODULES_EXECUTOR_DAG_EXECUTOR_H
