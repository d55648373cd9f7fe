// modules/policy/policy_gate.cpp
#include "modules/policy/policy_gate.h"
#include "common/logging/logging.h"
#include <algorithm>

namespace loom {

PolicyGate::PolicyGate(std::shared_ptr<const CapabilityManifest> manifest, Clock clock)
    : manifest_(std::move(manifest)), clock_(std::move(clock)) {
    if (!manifest_) {
        throw LoomError(make_error(ErrorKind::POLICY, codes::MANIFEST_MISSING, "no capability manifest"));
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

Decision PolicyGate::decide(const CapabilityRequest& request, const CapabilityManifest& manifest) {
    // 1. deny 优先
    if (manifest.find_deny(request.tool)) {
        return Decision::deny(make_error(ErrorKind::POLICY, codes::CAPABILITY_DENIED,
                                         "tool denied by manifest: " + request.tool));
    }

    // 2. 没有显式 allow 即拒绝
    const ManifestEntry* entry = manifest.find_allow(request.tool);
    if (!entry) {
        return Decision::deny(make_error(ErrorKind::POLICY, codes::CAPABILITY_DENIED,
                                         "tool not allowed by manifest: " + request.tool));
    }

    // 3. 写权限限定
    if (request.write) {
        if (!entry->write) {
            return Decision::deny(make_error(ErrorKind::POLICY, codes::WRITE_SCOPE_DENIED,
                                             "write not permitted for " + request.tool));
        }
        if (!entry->write_fields.empty()) {
            for (const auto& field : request.write_fields) {
                bool covered = std::any_of(entry->write_fields.begin(), entry->write_fields.end(),
                                           [&](const std::string& p) { return pattern_matches(p, field); });
                if (!covered) {
                    return Decision::deny(make_error(ErrorKind::POLICY, codes::WRITE_SCOPE_DENIED,
                                                     "field '" + field + "' outside write scope of " + request.tool));
                }
            }
        }
    }
    return Decision::allow();
}

Decision PolicyGate::check(const CapabilityRequest& request) {
    Decision decision = decide(request, *manifest_);
    if (!decision) {
        LOOM_LOG_WARN("policy denied", {StringField("tool", request.tool),
                                        StringField("code", decision.reason->code)});
        return decision;
    }

    const ManifestEntry* entry = manifest_->find_allow(request.tool);
    if (!entry->rate_limit) {
        return decision;
    }

    const auto now = clock_();
    const auto window = std::chrono::milliseconds(entry->rate_limit->window_ms);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& calls = windows_[request.tool];
    while (!calls.empty() && now - calls.front() >= window) {
        calls.pop_front();
    }
    if (static_cast<int>(calls.size()) >= entry->rate_limit->max_calls) {
        LOOM_LOG_WARN("rate limited", {StringField("tool", request.tool)});
        return Decision::deny(make_error(ErrorKind::POLICY, codes::RATE_LIMITED,
                                         "rate limit reached for " + request.tool));
    }
    calls.push_back(now);
    return decision;
}

Decision PolicyGate::check_allowed_tools(const std::vector<ToolName>& tools, bool write,
                                         const std::vector<std::string>& write_fields) const {
    for (const auto& tool : tools) {
        Decision d = decide(CapabilityRequest{tool, write, write_fields}, *manifest_);
        if (!d) return d;
    }
    return Decision::allow();
}

void PolicyGate::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.clear();
}

} // namespace loom
