// tests/support/fake_engine.h
#ifndef LOOM_TESTS_SUPPORT_FAKE_ENGINE_H
#define LOOM_TESTS_SUPPORT_FAKE_ENGINE_H

#include "core/types/plan.h"
#include "modules/policy/capability_manifest.h"
#include "modules/sandbox/sandbox_engine.h"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace loom::testing {

// In-process engine. Each node id can get its own behaviour; the default
// succeeds with summary "ran <id>".
class FakeEngine : public SandboxEngine {
public:
    using Behaviour = std::function<ExecuteResult(const ExecutionUnit&, const ExecutionContext&)>;

    explicit FakeEngine(std::set<ToolName> tools = {}, std::string name = "script")
        : tools_(std::move(tools)), name_(std::move(name)) {}

    void on(const NodeId& id, Behaviour behaviour);
    void set_available(bool available) { available_ = available; }

    std::string name() const override { return name_; }
    ExecuteResult execute(const ExecutionUnit& unit, const ExecutionContext& ctx) override;
    SandboxHealth health() const override;
    std::set<ToolName> capabilities() const override { return tools_; }

    int calls(const NodeId& id) const;
    int total_calls() const;
    // Inputs seen by the last call of a node
    Value last_inputs(const NodeId& id) const;
    int max_concurrency() const { return max_active_.load(); }

    // Succeeds after calling every allowed tool once
    static Behaviour call_tools();
    // Waits until the run is cancelled
    static Behaviour block_until_cancelled();
    static Behaviour fail_with(Error error);
    // Fails the first `times` calls, then succeeds
    static Behaviour fail_then_succeed(Error error, int times);
    static Behaviour write_state(Value updates, std::string summary = "");

private:
    std::set<ToolName> tools_;
    std::string name_;
    std::atomic<bool> available_{true};
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};

    mutable std::mutex mutex_;
    std::map<NodeId, Behaviour> behaviours_;
    std::map<NodeId, int> calls_;
    std::map<NodeId, Value> inputs_;
};

// Allow list of exact tool URIs, nothing denied
CapabilityManifest manifest_allowing(const std::vector<ToolName>& tools);

NodeSpec unit_node(const NodeId& id, std::vector<NodeId> deps = {}, std::vector<ToolName> tools = {});

} // namespace loom::testing

#endif // LOOM_TESTS_SUPPORT_FAKE_ENGINE_H
