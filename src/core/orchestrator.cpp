// core/orchestrator.cpp
#include "core/orchestrator.h"
#include "common/logging/logging.h"
#include "common/utils/hash.h"
#include "common/utils/ids.h"
#include "modules/executor/dag_executor.h"
#include "modules/policy/policy_gate.h"
#include "modules/sandbox/cancel_token.h"
#include "modules/sandbox/script_worker_engine.h"
#include "modules/tools/tool_client.h"
#include <algorithm>
#include <condition_variable>
#include <thread>

namespace loom {

struct Orchestrator::Run {
    RunId id;
    std::string goal;
    Constraints constraints;
    std::shared_ptr<const CapabilityManifest> manifest;
    Plan plan;

    std::unique_ptr<RunBudget> budget;
    std::unique_ptr<PolicyGate> gate;
    std::unique_ptr<ToolClient> tools;
    std::unique_ptr<TraceExporter> trace;
    std::shared_ptr<CancelToken> cancel = std::make_shared<CancelToken>();
    std::thread thread;
    uint64_t sequence = 0; // start order

    mutable std::mutex mutex;
    std::condition_variable done;
    std::optional<RunSummary> summary;
};

void to_json(nlohmann::json& j, const RunStatus& s) {
    j = {{"in_progress", s.in_progress}};
    if (s.summary) j["summary"] = *s.summary;
}

std::shared_ptr<EngineRegistry> make_default_engines(const LoomConfig& config,
                                                     std::shared_ptr<ArtifactStore> artifacts,
                                                     std::set<ToolName> tool_surface) {
    auto registry = std::make_shared<EngineRegistry>();
    registry->register_engine(std::make_shared<ScriptWorkerEngine>(config.sandbox, std::move(artifacts),
                                                                   std::move(tool_surface)));
    return registry;
}

Orchestrator::Orchestrator(LoomConfig config, std::shared_ptr<EngineRegistry> engines, ToolTransport& transport,
                           CompletionProvider* completion, std::shared_ptr<RunSummarySink> sink)
    : config_(std::move(config)),
      engines_(std::move(engines)),
      transport_(transport),
      sink_(std::move(sink)),
      planner_(*engines_, completion, config_.default_budget),
      reducer_(config_.reducer) {}

Orchestrator::~Orchestrator() {
    std::vector<std::shared_ptr<Run>> runs;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        for (auto& [id, run] : runs_) runs.push_back(run);
    }
    for (auto& run : runs) {
        run->cancel->cancel();
        if (run->thread.joinable()) run->thread.join();
    }
}

std::shared_ptr<const CapabilityManifest> Orchestrator::load_manifest(const Constraints& constraints) const {
    CapabilityManifest manifest;
    if (constraints.manifest) {
        manifest = CapabilityManifest::from_json(*constraints.manifest);
    } else if (!config_.manifest_path.empty()) {
        manifest = CapabilityManifest::load_file(config_.manifest_path);
    } else {
        throw LoomError(make_error(ErrorKind::POLICY, codes::MANIFEST_MISSING,
                                   "no capability manifest supplied; refusing to run"));
    }
    return std::make_shared<const CapabilityManifest>(manifest.with_denied(constraints.disallowed_tools));
}

void Orchestrator::check_engines(const Plan& plan) const {
    std::set<std::string> needed;
    for (const auto& node : plan.nodes()) {
        if (!node.is_approval()) needed.insert(node.unit.engine);
    }
    for (const auto& name : needed) {
        auto engine = engines_->find(name);
        if (!engine) {
            throw LoomError(make_error(ErrorKind::SANDBOX, codes::ENGINE_UNAVAILABLE,
                                       "no sandbox engine named '" + name + "'"));
        }
        SandboxHealth health = engine->health();
        if (!health.available) {
            throw LoomError(make_error(ErrorKind::SANDBOX, codes::ENGINE_UNAVAILABLE,
                                       "sandbox engine '" + name + "' unavailable: " + health.detail));
        }
    }
}

RunHandle Orchestrator::start(const std::string& goal, const Constraints& constraints) {
    if (!engines_ || engines_->names().empty()) {
        throw LoomError(make_error(ErrorKind::SANDBOX, codes::ENGINE_UNAVAILABLE, "no sandbox engine registered"));
    }
    auto manifest = load_manifest(constraints);

    auto run = std::make_shared<Run>();
    run->id = new_run_id();
    run->goal = goal;
    run->constraints = constraints;
    run->manifest = manifest;
    run->plan = planner_.plan(goal, constraints, *manifest);
    check_engines(run->plan);

    run->budget = std::make_unique<RunBudget>(constraints.run_limits);
    run->gate = std::make_unique<PolicyGate>(manifest);
    run->tools = std::make_unique<ToolClient>(transport_, schema_cache_, *run->gate, run->budget.get());
    run->trace = std::make_unique<TraceExporter>(run->id);
    TraceExporter* trace = run->trace.get();
    run->tools->add_listener([trace](const ToolEvent& event) { trace->on_tool_event(event); });

    LOOM_LOG_INFO("run planned", {StringField("run", run->id), StringField("plan", run->plan.hash()),
                                  IntField("nodes", static_cast<int64_t>(run->plan.size()))});

    prune_finished_runs();

    RunHandle handle{run->id, run->plan.hash(), run->plan.size()};
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        run->sequence = next_sequence_++;
        runs_[run->id] = run;
    }
    run->thread = std::thread([this, run] { execute_run(run); });
    return handle;
}

void Orchestrator::execute_run(const std::shared_ptr<Run>& run) {
    ExecutorConfig executor_config = config_.executor;
    if (run->constraints.approval_timeout_ms >= 0) {
        executor_config.approval_timeout_ms = run->constraints.approval_timeout_ms;
    }

    RunSummary summary;
    try {
        DagExecutor executor(run->id, *engines_, *run->tools, *run->gate, cache_, approvals_, *run->trace,
                             executor_config, config_.sandbox.max_concurrent_workers);
        executor.set_replan_hook([this, run](const ReplanRequest& request) {
            ReplanRequest full = request;
            full.goal = run->goal;
            return planner_.replan(full, run->constraints, *run->manifest);
        });
        summary = executor.run(run->plan, *run->budget, run->constraints.inputs, reducer_, run->cancel);
    } catch (const std::exception& e) {
        LOOM_LOG_ERROR("run crashed", {StringField("run", run->id), StringField("message", redact(e.what()))});
        summary.run_id = run->id;
        summary.plan_hash = run->plan.hash();
        summary.outcome = RunOutcome::FAILED;
        summary.terminating_error = make_error(ErrorKind::CODE, codes::RUNTIME_ERROR, e.what());
        summary.summary_hash = hash_bytes(HashDomain::SUMMARY, summary.summary);
    }

    LOOM_LOG_INFO("run summary", {StringField("run", run->id), StringField("outcome", to_string(summary.outcome)),
                                  StringField("summary_hash", summary.summary_hash)});

    if (sink_) {
        try {
            sink_->store(summary);
        } catch (const std::exception& e) {
            LOOM_LOG_ERROR("failed to persist run summary", {StringField("run", run->id),
                                                             StringField("message", e.what())});
        }
    }

    {
        std::lock_guard<std::mutex> lock(run->mutex);
        run->summary = std::move(summary);
    }
    run->done.notify_all();
}

std::shared_ptr<Orchestrator::Run> Orchestrator::find_run(const RunId& run_id) const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        throw LoomError(make_error(ErrorKind::CODE, codes::RUNTIME_ERROR, "unknown run " + run_id));
    }
    return it->second;
}

bool Orchestrator::cancel(const RunId& run_id) {
    std::shared_ptr<Run> run;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        auto it = runs_.find(run_id);
        if (it == runs_.end()) return false;
        run = it->second;
    }
    {
        std::lock_guard<std::mutex> lock(run->mutex);
        if (run->summary) return false;
    }
    run->cancel->cancel();
    return true;
}

bool Orchestrator::forget(const RunId& run_id) {
    std::shared_ptr<Run> run;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        auto it = runs_.find(run_id);
        if (it == runs_.end()) return false;
        {
            std::lock_guard<std::mutex> run_lock(it->second->mutex);
            if (!it->second->summary) return false;
        }
        run = it->second;
        runs_.erase(it);
    }
    if (run->thread.joinable()) run->thread.join();
    return true;
}

void Orchestrator::prune_finished_runs() {
    std::vector<std::shared_ptr<Run>> dropped;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        std::vector<std::shared_ptr<Run>> finished;
        for (const auto& [id, run] : runs_) {
            std::lock_guard<std::mutex> run_lock(run->mutex);
            if (run->summary) finished.push_back(run);
        }
        const auto keep = static_cast<size_t>(std::max<int64_t>(config_.retained_runs, 0));
        if (finished.size() <= keep) return;
        std::sort(finished.begin(), finished.end(),
                  [](const auto& a, const auto& b) { return a->sequence < b->sequence; });
        finished.resize(finished.size() - keep);
        for (auto& run : finished) {
            runs_.erase(run->id);
            dropped.push_back(std::move(run));
        }
    }
    for (auto& run : dropped) {
        if (run->thread.joinable()) run->thread.join();
    }
    LOOM_LOG_DEBUG("finished runs dropped", {IntField("count", static_cast<int64_t>(dropped.size()))});
}

RunStatus Orchestrator::status(const RunId& run_id) const {
    auto run = find_run(run_id);
    std::lock_guard<std::mutex> lock(run->mutex);
    RunStatus status;
    status.in_progress = !run->summary.has_value();
    status.summary = run->summary;
    return status;
}

RunSummary Orchestrator::wait(const RunId& run_id) {
    auto run = find_run(run_id);
    std::unique_lock<std::mutex> lock(run->mutex);
    run->done.wait(lock, [&] { return run->summary.has_value(); });
    return *run->summary;
}

bool Orchestrator::approve(const RunId& run_id, const NodeId& node_id, bool approved) {
    return approvals_.resolve(run_id, node_id, approved);
}

std::vector<NodeId> Orchestrator::pending_approvals(const RunId& run_id) const {
    return approvals_.pending(run_id);
}

std::vector<TraceRecord> Orchestrator::traces(const RunId& run_id) const {
    return find_run(run_id)->trace->get_traces();
}

nlohmann::json Orchestrator::trace_json(const RunId& run_id) const {
    return find_run(run_id)->trace->to_json();
}

void Orchestrator::export_trace(const RunId& run_id, const std::string& path) const {
    find_run(run_id)->trace->export_to_file(path);
}

const Plan& Orchestrator::plan_of(const RunId& run_id) const {
    return find_run(run_id)->plan;
}

} // namespace loom
