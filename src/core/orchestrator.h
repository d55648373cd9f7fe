// core/orchestrator.h
#ifndef LOOM_CORE_ORCHESTRATOR_H
#define LOOM_CORE_ORCHESTRATOR_H

#include "core/types/constraints.h"
#include "core/types/run_state.h"
#include "common/config/loom_config.h"
#include "common/llm/completion.h"
#include "common/tools/tool_transport.h"
#include "modules/cache/artifact_store.h"
#include "modules/cache/result_cache.h"
#include "modules/cache/schema_cache.h"
#include "modules/executor/approval_broker.h"
#include "modules/persistence/run_summary_sink.h"
#include "modules/planner/planner.h"
#include "modules/reducer/reducer.h"
#include "modules/sandbox/sandbox_engine.h"
#include "modules/trace/trace_exporter.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace loom {

struct RunHandle {
    RunId run_id;
    std::string plan_hash;
    size_t nodes = 0;
};

struct RunStatus {
    bool in_progress = true;
    std::optional<RunSummary> summary; // set once the run is finished
};

void to_json(nlohmann::json& j, const RunStatus& s);

// Registry holding the script worker engine
std::shared_ptr<EngineRegistry> make_default_engines(const LoomConfig& config,
                                                     std::shared_ptr<ArtifactStore> artifacts,
                                                     std::set<ToolName> tool_surface);

// Planner → Executor (with re-plans) → Reducer, one background thread per run.
// Configuration comes in through the constructor; each run gets its own
// manifest, PolicyGate, ToolClient and trace. Result and schema caches are
// shared between runs.
class Orchestrator {
public:
    Orchestrator(LoomConfig config, std::shared_ptr<EngineRegistry> engines, ToolTransport& transport,
                 CompletionProvider* completion = nullptr, std::shared_ptr<RunSummarySink> sink = nullptr);
    ~Orchestrator(); // cancels unfinished runs and joins them

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Plans synchronously. Throws LoomError for CODE/PLAN_INVALID,
    // POLICY/MANIFEST_MISSING and SANDBOX/ENGINE_UNAVAILABLE; no node runs then.
    RunHandle start(const std::string& goal, const Constraints& constraints);

    // false when the run is unknown or already finished
    bool cancel(const RunId& run_id);

    // Throws LoomError(CODE/RUNTIME_ERROR) for unknown ids
    RunStatus status(const RunId& run_id) const;
    RunSummary wait(const RunId& run_id);

    // Drops a finished run and joins its thread; false when unknown or still
    // running. References from plan_of() die with it. Past retained_runs the
    // oldest finished runs are dropped on start().
    bool forget(const RunId& run_id);

    bool approve(const RunId& run_id, const NodeId& node_id, bool approved);
    std::vector<NodeId> pending_approvals(const RunId& run_id) const;

    std::vector<TraceRecord> traces(const RunId& run_id) const;
    nlohmann::json trace_json(const RunId& run_id) const;
    void export_trace(const RunId& run_id, const std::string& path) const;

    const Plan& plan_of(const RunId& run_id) const;

    const ResultCache& result_cache() const { return cache_; }
    const LoomConfig& config() const { return config_; }

private:
    struct Run;

    std::shared_ptr<Run> find_run(const RunId& run_id) const;
    std::shared_ptr<const CapabilityManifest> load_manifest(const Constraints& constraints) const;
    void check_engines(const Plan& plan) const;
    void execute_run(const std::shared_ptr<Run>& run);
    void prune_finished_runs();

    LoomConfig config_;
    std::shared_ptr<EngineRegistry> engines_;
    ToolTransport& transport_;
    std::shared_ptr<RunSummarySink> sink_;
    Planner planner_;
    Reducer reducer_;

    ResultCache cache_;
    SchemaCache schema_cache_;
    ApprovalBroker approvals_;

    mutable std::mutex runs_mutex_;
    std::map<RunId, std::shared_ptr<Run>> runs_;
    uint64_t next_sequence_ = 0;
};

} // namespace loom

#endif // LOOM_CORE_ORCHESTRATOR_H
