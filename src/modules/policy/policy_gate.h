// modules/policy/policy_gate.h
#ifndef LOOM_MODULES_POLICY_POLICY_GATE_H
#define LOOM_MODULES_POLICY_POLICY_GATE_H

#include "modules/policy/capability_manifest.h"
#include "core/types/error.h"
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace loom {

struct CapabilityRequest {
    ToolName tool;
    bool write = false;
    std::vector<std::string> write_fields;
};

struct Decision {
    bool allowed = false;
    std::optional<Error> reason; // set when denied

    static Decision allow() { return Decision{true, std::nullopt}; }
    static Decision deny(Error reason) { return Decision{false, std::move(reason)}; }
    explicit operator bool() const { return allowed; }
};

// Fail-closed gate. decide() is pure; check() adds the per-run sliding
// window rate limits and is safe for concurrent callers.
class PolicyGate {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit PolicyGate(std::shared_ptr<const CapabilityManifest> manifest, Clock clock = {});

    static Decision decide(const CapabilityRequest& request, const CapabilityManifest& manifest);

    // decide() + rate limit; an allowed call is counted against its window
    Decision check(const CapabilityRequest& request);

    // Every tool must be individually allowed; no rate accounting
    Decision check_allowed_tools(const std::vector<ToolName>& tools, bool write = false,
                                 const std::vector<std::string>& write_fields = {}) const;

    // 每次运行开始时清空窗口
    void reset();

    const CapabilityManifest& manifest() const { return *manifest_; }

private:
    std::shared_ptr<const CapabilityManifest> manifest_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<ToolName, std::deque<std::chrono::steady_clock::time_point>> windows_;
};

} // namespace loom

#endif // LOOM_MODULES_POLICY_POLICY_GATE_H
