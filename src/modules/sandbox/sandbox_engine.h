// modules/sandbox/sandbox_engine.h
#ifndef LOOM_MODULES_SANDBOX_SANDBOX_ENGINE_H
#define LOOM_MODULES_SANDBOX_SANDBOX_ENGINE_H

#include "core/types/plan.h"
#include "core/types/result.h"
#include "common/tools/tool_transport.h"
#include "modules/sandbox/cancel_token.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace loom {

struct SandboxHealth {
    bool available = false;
    int active_workers = 0;
    int max_workers = 0;
    std::string detail;

    bool idle() const { return active_workers == 0; }
};

void to_json(nlohmann::json& j, const SandboxHealth& h);

// Host-side tool entry point handed to an engine for one node. Policy checks
// happen behind it; the engine only relays.
using ToolInvoker = std::function<ToolCallResult(const ToolName& tool, const Value& args)>;

struct ExecutionContext {
    NodeId node_id;
    Value inputs = Value::object(); // {params, state}
    ToolInvoker invoke_tool;
    std::shared_ptr<CancelToken> cancel;
};

// 沙箱执行后端的统一接口；新增后端只需实现此接口
class SandboxEngine {
public:
    virtual ~SandboxEngine() = default;

    virtual std::string name() const = 0;

    // Never throws for node-level failures; they come back as ExecuteResult::fail
    virtual ExecuteResult execute(const ExecutionUnit& unit, const ExecutionContext& ctx) = 0;

    virtual SandboxHealth health() const = 0;

    // Tool surface the engine can expose to code it runs
    virtual std::set<ToolName> capabilities() const = 0;
};

class EngineRegistry {
public:
    void register_engine(std::shared_ptr<SandboxEngine> engine);

    std::shared_ptr<SandboxEngine> find(const std::string& name) const;
    bool has_engine(const std::string& name) const { return find(name) != nullptr; }
    std::vector<std::string> names() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SandboxEngine>> engines_;
};

} // namespace loom

#endif // LOOM_MODULES_SANDBOX_SANDBOX_ENGINE_H
