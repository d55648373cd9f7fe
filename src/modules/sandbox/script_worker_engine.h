// modules/sandbox/script_worker_engine.h
#ifndef LOOM_MODULES_SANDBOX_SCRIPT_WORKER_ENGINE_H
#define LOOM_MODULES_SANDBOX_SCRIPT_WORKER_ENGINE_H

#include "modules/sandbox/sandbox_engine.h"
#include "modules/sandbox/watchdog.h"
#include "modules/sandbox/worker_process.h"
#include "modules/cache/artifact_store.h"
#include "common/config/loom_config.h"
#include <atomic>
#include <memory>
#include <set>
#include <string>

namespace loom {

// The required engine: runs a unit's script inside a separate loom_worker
// process and relays tool calls over the framed stdin/stdout channel.
class ScriptWorkerEngine : public SandboxEngine {
public:
    static constexpr const char* kName = "script";

    ScriptWorkerEngine(SandboxConfig config, std::shared_ptr<ArtifactStore> artifacts,
                       std::set<ToolName> tool_surface);

    std::string name() const override { return kName; }
    ExecuteResult execute(const ExecutionUnit& unit, const ExecutionContext& ctx) override;
    SandboxHealth health() const override;
    std::set<ToolName> capabilities() const override { return tool_surface_; }

    // wall_ms from the budget, or 2 * cpu_ms + grace when unset
    int64_t wall_clock_ms(const Budget& budget) const;

    const SandboxConfig& config() const { return config_; }

private:
    struct Exchange {
        bool terminal = false;
        bool violation = false;
        std::string violation_detail;
        std::optional<ResultEnvelope> envelope;
        std::optional<Error> error;
    };

    Exchange converse(WorkerProcess& process, Watchdog& watchdog, const ExecutionContext& ctx);
    bool handle_frame(const nlohmann::json& frame, WorkerProcess& process, const ExecutionContext& ctx,
                      Exchange& exchange);
    Error classify_abnormal_exit(Watchdog::Cause cause, const WorkerExit& exit, const Budget& budget,
                                 const Exchange& exchange) const;

    nlohmann::json execute_frame(const ExecutionUnit& unit, const ExecutionContext& ctx) const;

    SandboxConfig config_;
    std::shared_ptr<ArtifactStore> artifacts_;
    std::set<ToolName> tool_surface_;
    std::atomic<int> active_{0};
};

} // namespace loom

#endif // LOOM_MODULES_SANDBOX_SCRIPT_WORKER_ENGINE_H
