// modules/policy/capability_manifest.h
#ifndef LOOM_MODULES_POLICY_CAPABILITY_MANIFEST_H
#define LOOM_MODULES_POLICY_CAPABILITY_MANIFEST_H

#include "core/types/context.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace loom {

struct RateLimit {
    int max_calls = 0;
    int64_t window_ms = 0;
};

// Exact tool URI, or a prefix when the pattern ends with '*'
bool pattern_matches(const std::string& pattern, const std::string& value);

struct ManifestEntry {
    std::string pattern;
    bool write = false;                     // allow entries only
    std::vector<std::string> write_fields;  // empty = any field when write is true
    std::optional<RateLimit> rate_limit;

    bool matches(const ToolName& tool) const { return pattern_matches(pattern, tool); }
    // Exact entries outrank every prefix; longer prefixes outrank shorter ones
    size_t specificity() const;
};

// allow/deny 列表，整个运行期间不可变
class CapabilityManifest {
public:
    CapabilityManifest() = default;
    CapabilityManifest(std::vector<ManifestEntry> allow, std::vector<ManifestEntry> deny);

    // Throws LoomError(POLICY/MANIFEST_MISSING) when the document is unusable
    static CapabilityManifest from_json(const nlohmann::json& doc);
    static CapabilityManifest load_file(const std::string& path);

    // Copy with extra exact deny entries (a run's disallowed tools)
    CapabilityManifest with_denied(const std::vector<ToolName>& tools) const;

    const std::vector<ManifestEntry>& allow() const { return allow_; }
    const std::vector<ManifestEntry>& deny() const { return deny_; }

    const ManifestEntry* find_allow(const ToolName& tool) const;
    const ManifestEntry* find_deny(const ToolName& tool) const;

    nlohmann::json to_json() const;

private:
    std::vector<ManifestEntry> allow_;
    std::vector<ManifestEntry> deny_;
};

} // namespace loom

#endif // LOOM_MODULES_POLICY_CAPABILITY_MANIFEST_H
