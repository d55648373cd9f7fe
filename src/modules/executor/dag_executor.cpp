// modules/executor/dag_executor.cpp
#include "modules/executor/dag_executor.h"
#include "modules/budget/budget_controller.h"
#include "modules/executor/blocking_queue.h"
#include "common/logging/logging.h"
#include "common/utils/template_renderer.h"
#include <algorithm>
#include <chrono>
#include <map>
#include <set>

namespace loom {

namespace {

constexpr std::chrono::milliseconds kPollInterval{50};
// approval_timeout_ms < 0 时的截止时间
constexpr std::chrono::hours kNoApprovalDeadline{24 * 365};

} // namespace

struct DagExecutor::Completion {
    NodeId node_id;
    int attempt = 1;
    bool approval = false;
    ExecuteResult result;
    std::string cache_key; // 空表示结果不进缓存
};

struct DagExecutor::Session {
    Session(const Plan& plan, RunBudget& run_budget, const Value& run_inputs)
        : arena(plan),
          state(run_inputs.is_object() && run_inputs.contains("state") ? run_inputs["state"] : Value::object()),
          budget(run_budget),
          controller(run_budget),
          inputs(run_inputs.is_object() ? run_inputs : Value::object()) {}

    PlanArena arena;
    RunState state;
    RunBudget& budget;
    BudgetController controller;
    Value inputs;

    std::shared_ptr<CancelToken> external_cancel;
    std::shared_ptr<CancelToken> stop = std::make_shared<CancelToken>();
    std::shared_ptr<BlockingQueue<Completion>> completions = std::make_shared<BlockingQueue<Completion>>();

    std::set<NodeId> in_flight;
    std::optional<Error> terminating_error;
    bool cancelled = false;
    int replans = 0;

    bool stopping() const { return cancelled || terminating_error.has_value(); }
};

DagExecutor::DagExecutor(RunId run_id, const EngineRegistry& engines, ToolClient& tools, PolicyGate& gate,
                         ResultCache& cache, ApprovalBroker& approvals, TraceExporter& trace,
                         ExecutorConfig config, int max_workers)
    : run_id_(std::move(run_id)),
      engines_(engines),
      tools_(tools),
      gate_(gate),
      cache_(cache),
      approvals_(approvals),
      trace_(trace),
      config_(config),
      pool_(std::make_unique<WorkerPool>(std::max(1, max_workers))) {}

DagExecutor::~DagExecutor() = default;

ExecutionReport DagExecutor::execute(const Plan& plan, RunBudget& budget, const Value& inputs,
                                     std::shared_ptr<CancelToken> cancel) {
    Session s(plan, budget, inputs);
    s.external_cancel = std::move(cancel);

    LOOM_LOG_INFO("run started", {StringField("run", run_id_), StringField("plan", plan.hash()),
                                  IntField("nodes", static_cast<int64_t>(plan.size()))});

    while (true) {
        if (!s.stopping()) {
            if (s.external_cancel && s.external_cancel->cancelled()) {
                abort(s, std::nullopt);
            } else if (auto breach = s.controller.breach()) {
                abort(s, *breach);
            }
        }
        approvals_.expire(run_id_);

        if (!s.stopping()) dispatch_ready(s);
        if (s.in_flight.empty()) break;

        auto completion = s.completions->pop_for(kPollInterval);
        if (completion) handle_completion(s, std::move(*completion));
    }

    // 剩余未终态的节点一律跳过
    for (const auto& id : s.arena.order()) {
        const NodeRecord* rec = s.state.find(id);
        if (rec && is_terminal(rec->state)) continue;
        bool was_running = rec && rec->state == NodeState::RUNNING;
        s.state.skip(id);
        if (was_running) {
            trace_.on_node_end(id, "skipped", std::nullopt, Metrics{}, false);
        }
    }

    LOOM_LOG_INFO("run finished", {StringField("run", run_id_), BoolField("cancelled", s.cancelled),
                                   BoolField("aborted", s.terminating_error.has_value()),
                                   IntField("replans", s.replans)});

    return ExecutionReport{std::move(s.state), std::move(s.arena), std::move(s.terminating_error),
                           s.cancelled, s.replans};
}

RunSummary DagExecutor::run(const Plan& plan, RunBudget& budget, const Value& inputs, const Reducer& reducer,
                            std::shared_ptr<CancelToken> cancel) {
    ExecutionReport report = execute(plan, budget, inputs, std::move(cancel));

    ReduceRequest request;
    request.run_id = run_id_;
    request.plan_hash = report.arena.original_hash();
    request.order = report.arena.order();
    for (const auto& [id, node] : report.arena.nodes()) {
        if (!node.active()) request.superseded.push_back(id);
    }
    request.replans = report.replans;
    request.cancelled = report.cancelled;
    request.terminating_error = report.terminating_error;

    RunSummary summary = reducer.reduce(report.state, request);

    nlohmann::json record = summary;
    record["executed_plan"] = report.arena.to_json();
    trace_.on_run_end(record);
    return summary;
}

void DagExecutor::dispatch_ready(Session& s) {
    std::vector<NodeId> ready;
    for (const auto& id : s.arena.order()) {
        const NodeRecord* rec = s.state.find(id);
        if (rec && rec->state != NodeState::PENDING) continue;
        const NodeSpec* spec = s.arena.find(id);
        bool deps_done = std::all_of(spec->deps.begin(), spec->deps.end(), [&](const NodeId& dep) {
            const NodeRecord* d = s.state.find(dep);
            return d && d->state == NodeState::SUCCEEDED;
        });
        if (deps_done) ready.push_back(id);
    }
    std::sort(ready.begin(), ready.end());

    for (const auto& id : ready) {
        if (s.stopping()) return;
        // 前一个节点的失败可能已跳过或替换了它
        const NodeSpec* spec = s.arena.find(id);
        const NodeRecord* rec = s.state.find(id);
        if (!spec || (rec && rec->state != NodeState::PENDING)) continue;

        s.state.mark(id, NodeState::READY);
        if (spec->is_approval()) {
            dispatch_approval(s, *spec);
        } else {
            NodeSpec node = *spec;
            dispatch_unit(s, node, 1);
        }
    }
}

void DagExecutor::dispatch_approval(Session& s, const NodeSpec& node) {
    s.state.mark(node.id, NodeState::RUNNING);
    s.state.record(node.id).attempts = 1;
    s.in_flight.insert(node.id);
    trace_.on_node_start(node.id, to_string(node.kind), 1, nlohmann::json::object());

    ApprovalBroker::Clock::duration wait = kNoApprovalDeadline;
    if (config_.approval_timeout_ms >= 0) wait = std::chrono::milliseconds(config_.approval_timeout_ms);
    auto deadline = ApprovalBroker::Clock::now() + wait;

    auto queue = s.completions;
    approvals_.open(run_id_, node.id, deadline, [queue](const NodeId& id, ApprovalDecision decision) {
        Completion c;
        c.node_id = id;
        c.approval = true;
        switch (decision) {
            case ApprovalDecision::APPROVED:
                c.result = ExecuteResult::ok(ResultEnvelope{});
                break;
            case ApprovalDecision::DENIED:
                c.result = ExecuteResult::fail(make_error(ErrorKind::POLICY, codes::APPROVAL_DENIED,
                                                          "approval denied for " + id));
                break;
            case ApprovalDecision::TIMED_OUT:
                c.result = ExecuteResult::fail(make_error(ErrorKind::POLICY, codes::APPROVAL_TIMEOUT,
                                                          "approval timed out for " + id));
                break;
            case ApprovalDecision::CANCELLED:
                c.result = ExecuteResult::fail(make_error(ErrorKind::SANDBOX, codes::CANCELLED,
                                                          "run cancelled while waiting for approval"));
                break;
        }
        queue->push(std::move(c));
    });
}

void DagExecutor::dispatch_unit(Session& s, const NodeSpec& node, int attempt) {
    const NodeId& id = node.id;
    s.state.mark(id, NodeState::RUNNING);
    s.state.record(id).attempts = attempt;
    s.in_flight.insert(id);

    auto fail_now = [&](Error error) {
        Completion c;
        c.node_id = id;
        c.attempt = attempt;
        c.result = ExecuteResult::fail(std::move(error));
        handle_completion(s, std::move(c));
    };

    // 审批与 PolicyGate 在占用运行预算之前检查；被拒的节点不会进入沙箱
    std::optional<Error> refusal;
    if (node.mutating) {
        bool approved = std::any_of(node.deps.begin(), node.deps.end(), [&](const NodeId& dep) {
            const ArenaNode* a = s.arena.node(dep);
            const NodeRecord* r = s.state.find(dep);
            return a && a->spec.is_approval() && r && r->state == NodeState::SUCCEEDED;
        });
        if (!approved) {
            refusal = make_error(ErrorKind::POLICY, codes::WRITE_WITHOUT_APPROVAL,
                                 "node " + id + " writes without a granted approval");
        }
    }
    if (!refusal) {
        Decision decision = gate_.check_allowed_tools(node.unit.allowed_tools);
        if (!decision) refusal = *decision.reason;
    }

    // 重试不再占用运行预算
    if (attempt == 1 && !refusal) {
        if (auto breach = s.controller.admit(node)) {
            s.in_flight.erase(id);
            s.state.mark(id, NodeState::PENDING);
            abort(s, *breach);
            return;
        }
    }

    trace_.on_node_start(id, to_string(node.kind), attempt, s.controller.snapshot(node.budget()));
    if (refusal) {
        fail_now(*refusal);
        return;
    }

    auto engine = engines_.find(node.unit.engine);
    if (!engine) {
        fail_now(make_error(ErrorKind::SANDBOX, codes::ENGINE_UNAVAILABLE,
                            "no sandbox engine named '" + node.unit.engine + "'"));
        return;
    }

    Value view = state_view(s, id);
    ExecutionUnit unit = node.unit;
    try {
        unit.params = InjaTemplateRenderer::render_params(node.unit.params, {{"state", view}, {"inputs", s.inputs}});
    } catch (const std::exception& e) {
        fail_now(make_error(ErrorKind::CODE, codes::RUNTIME_ERROR, std::string("params template: ") + e.what()));
        return;
    }

    ResultKey key;
    key.plan_hash = s.arena.original_hash();
    key.node_id = id;
    key.inputs = {{"params", unit.params}, {"state", view}};
    if (!unit.allowed_tools.empty()) {
        try {
            key.schemas = tools_.resolve_versions(unit.allowed_tools);
        } catch (const LoomError& e) {
            fail_now(e.error());
            return;
        }
    }

    std::string cache_key;
    if (!node.mutating) {
        cache_key = key.digest();
        if (auto hit = cache_.get(cache_key)) {
            LOOM_LOG_DEBUG("cache hit", {StringField("run", run_id_), StringField("node", id)});
            s.in_flight.erase(id);
            Metrics metrics = hit->metrics;
            s.state.complete(id, std::move(*hit), true);
            trace_.on_node_end(id, "succeeded", std::nullopt, metrics, true);
            return;
        }
    }

    ExecutionContext ctx;
    ctx.node_id = id;
    ctx.inputs = {{"params", unit.params}, {"state", view}};
    ctx.cancel = s.stop;
    InvocationScope scope{id, unit.allowed_tools, node.write_fields};
    ctx.invoke_tool = [this, scope](const ToolName& tool, const Value& args) {
        return tools_.invoke(scope, tool, args);
    };

    LOOM_LOG_DEBUG("dispatch", {StringField("run", run_id_), StringField("node", id), IntField("attempt", attempt)});

    auto queue = s.completions;
    auto stop = s.stop;
    pool_->submit([engine, unit = std::move(unit), ctx = std::move(ctx), queue, stop, id, attempt,
                   cache_key = std::move(cache_key)]() {
        Completion c;
        c.node_id = id;
        c.attempt = attempt;
        c.cache_key = cache_key;
        if (stop->cancelled()) {
            c.result = ExecuteResult::fail(make_error(ErrorKind::SANDBOX, codes::CANCELLED, "run stopped before dispatch"));
        } else {
            try {
                c.result = engine->execute(unit, ctx);
            } catch (const LoomError& e) {
                c.result = ExecuteResult::fail(e.error());
            } catch (const std::exception& e) {
                c.result = ExecuteResult::fail(make_error(ErrorKind::SANDBOX, codes::PROC_CRASH, e.what()));
            }
        }
        queue->push(std::move(c));
    });
}

void DagExecutor::handle_completion(Session& s, Completion c) {
    const NodeId id = c.node_id;
    s.in_flight.erase(id);

    if (c.result.success) {
        if (!c.cache_key.empty()) cache_.put(c.cache_key, c.result.envelope);
        Metrics metrics = c.result.envelope.metrics;
        s.state.complete(id, std::move(c.result.envelope), false);
        trace_.on_node_end(id, "succeeded", std::nullopt, metrics, false);
        return;
    }

    Error error = c.result.error.value_or(make_error(ErrorKind::SANDBOX, codes::PROC_CRASH, "engine returned no error"));
    const Metrics& metrics = c.result.envelope.metrics;

    // 中止或取消期间，被打断的节点记为跳过
    if (s.stopping() && error.is(ErrorKind::SANDBOX, codes::CANCELLED)) {
        s.state.skip(id, error);
        trace_.on_node_end(id, "skipped", error, metrics, false);
        return;
    }

    trace_.on_node_end(id, "failed", error, metrics, false);
    LOOM_LOG_WARN("node failed", {StringField("run", run_id_), StringField("node", id),
                                  StringField("error", error.qualified()), StringField("message", error.message),
                                  IntField("attempt", c.attempt)});

    // 运行级预算被突破：整个运行中止
    if (error.is(ErrorKind::BUDGET, codes::RUN_LIMIT)) {
        s.state.fail(id, error);
        skip_dependents(s, id);
        if (!s.stopping()) abort(s, error);
        return;
    }

    const NodeSpec* spec = s.arena.find(id);
    if (c.approval || !spec || s.stopping()) {
        s.state.fail(id, error);
        skip_dependents(s, id);
        return;
    }

    NodeSpec node = *spec;
    if (retry_allowed(node, error, c.attempt)) {
        LOOM_LOG_INFO("retrying idempotent node", {StringField("run", run_id_), StringField("node", id)});
        dispatch_unit(s, node, c.attempt + 1);
        return;
    }

    s.state.fail(id, error);
    if (try_replan(s, node, error)) return;
    skip_dependents(s, id);
}

bool DagExecutor::try_replan(Session& s, const NodeSpec& failed, const Error& error) {
    int limit = std::min(s.budget.limits.max_replans, config_.max_replans);
    if (!replan_hook_ || s.replans >= limit || !replan_allowed(error)) return false;

    std::set<NodeId> dependents = s.arena.transitive_dependents(failed.id);
    ReplanRequest request;
    request.failed_node = failed.id;
    request.error = error;
    request.superseded.push_back(failed.id);
    for (const auto& dep : dependents) {
        const NodeRecord* rec = s.state.find(dep);
        if (!rec || !is_terminal(rec->state)) request.superseded.push_back(dep);
    }
    for (const auto& id : s.arena.order()) {
        const NodeRecord* rec = s.state.find(id);
        if (rec && rec->state == NodeState::SUCCEEDED) request.completed.push_back(id);
    }
    request.failed_unit = failed.unit;
    request.state = s.state.state();
    request.generation = s.arena.generation() + 1;
    request.remaining_nodes = s.controller.remaining_nodes();

    std::vector<NodeSpec> subgraph;
    try {
        subgraph = replan_hook_(request);
        if (subgraph.empty()) return false;
        s.arena.supersede(request.superseded, std::move(subgraph));
    } catch (const LoomError& e) {
        LOOM_LOG_WARN("re-plan rejected", {StringField("run", run_id_), StringField("node", failed.id),
                                           StringField("error", e.error().qualified()),
                                           StringField("message", e.error().message)});
        return false;
    } catch (const std::exception& e) {
        LOOM_LOG_WARN("re-plan failed", {StringField("run", run_id_), StringField("node", failed.id),
                                         StringField("message", redact(e.what()))});
        return false;
    }

    ++s.replans;
    for (const auto& id : request.superseded) {
        if (id != failed.id) s.state.skip(id);
    }
    LOOM_LOG_INFO("re-plan accepted", {StringField("run", run_id_), StringField("node", failed.id),
                                       IntField("generation", s.arena.generation()),
                                       IntField("superseded", static_cast<int64_t>(request.superseded.size()))});
    return true;
}

void DagExecutor::skip_dependents(Session& s, const NodeId& id) {
    for (const auto& dep : s.arena.transitive_dependents(id)) {
        const NodeRecord* rec = s.state.find(dep);
        if (rec && is_terminal(rec->state)) continue;
        s.state.skip(dep);
        LOOM_LOG_DEBUG("node skipped", {StringField("run", run_id_), StringField("node", dep),
                                        StringField("upstream", id)});
    }
}

void DagExecutor::abort(Session& s, std::optional<Error> reason) {
    if (reason) {
        s.terminating_error = *reason;
        LOOM_LOG_ERROR("run aborted", {StringField("run", run_id_), StringField("error", reason->qualified()),
                                       StringField("message", reason->message)});
    } else {
        s.cancelled = true;
        LOOM_LOG_WARN("run cancelled", {StringField("run", run_id_)});
    }
    // 与超时同一路径：watchdog 收到取消信号后终止 worker
    s.stop->cancel();
    approvals_.cancel_run(run_id_);
}

Value DagExecutor::state_view(const Session& s, const NodeId& id) const {
    Value view = s.state.initial_state();
    std::set<NodeId> ancestors = s.arena.ancestors(id);
    for (const auto& a : s.arena.order()) {
        if (!ancestors.count(a)) continue;
        const NodeRecord* rec = s.state.find(a);
        if (rec && rec->result) Reducer::merge_state(view, rec->result->state_updates);
    }
    return view;
}

bool DagExecutor::retry_allowed(const NodeSpec& node, const Error& error, int attempt) {
    if (!node.idempotent || attempt >= 2) return false;
    if (error.kind == ErrorKind::POLICY) return false;
    if (error.is(ErrorKind::CODE, codes::STATIC_REJECTED) || error.is(ErrorKind::CODE, codes::SYNTAX_ERROR)) return false;
    if (error.kind == ErrorKind::TOOL && !error.retriable) return false;
    if (error.is(ErrorKind::SANDBOX, codes::CANCELLED) || error.is(ErrorKind::BUDGET, codes::RUN_LIMIT)) return false;
    return true;
}

bool DagExecutor::replan_allowed(const Error& error) {
    switch (error.kind) {
        case ErrorKind::BUDGET: return error.code != codes::RUN_LIMIT;
        case ErrorKind::TOOL: return true;
        case ErrorKind::CODE: return error.code == codes::RUNTIME_ERROR;
        default: return false;
    }
}

} // namespace loom
