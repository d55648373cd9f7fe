// modules/policy/capability_manifest.cpp
#include "modules/policy/capability_manifest.h"
#include "common/utils/yaml_json.h"
#include "core/types/error.h"
#include <filesystem>
#include <limits>

namespace loom {

namespace {

Error manifest_error(const std::string& message) {
    return make_error(ErrorKind::POLICY, codes::MANIFEST_MISSING, message);
}

ManifestEntry parse_entry(const nlohmann::json& j, bool allow_list) {
    ManifestEntry entry;
    if (j.is_string()) {
        entry.pattern = j.get<std::string>();
    } else if (j.is_object()) {
        entry.pattern = j.value("tool", std::string());
        if (allow_list) {
            entry.write = j.value("write", false);
            entry.write_fields = j.value("write_fields", std::vector<std::string>{});
            if (!entry.write_fields.empty()) {
                entry.write = true;
            }
            if (j.contains("rate_limit")) {
                const auto& rl = j["rate_limit"];
                RateLimit limit;
                limit.max_calls = rl.value("max_calls", 0);
                limit.window_ms = rl.value("window_ms", int64_t{0});
                if (limit.max_calls <= 0 || limit.window_ms <= 0) {
                    throw LoomError(manifest_error("rate_limit for '" + entry.pattern +
                                                   "' needs positive max_calls and window_ms"));
                }
                entry.rate_limit = limit;
            }
        }
    } else {
        throw LoomError(manifest_error("manifest entries must be strings or objects"));
    }
    if (entry.pattern.empty()) {
        throw LoomError(manifest_error("manifest entry without tool pattern"));
    }
    return entry;
}

std::vector<ManifestEntry> parse_list(const nlohmann::json& doc, const char* key, bool allow_list) {
    std::vector<ManifestEntry> out;
    if (!doc.contains(key) || doc[key].is_null()) {
        return out;
    }
    if (!doc[key].is_array()) {
        throw LoomError(manifest_error(std::string("'") + key + "' must be a list"));
    }
    for (const auto& item : doc[key]) {
        out.push_back(parse_entry(item, allow_list));
    }
    return out;
}

const ManifestEntry* best_match(const std::vector<ManifestEntry>& entries, const ToolName& tool) {
    const ManifestEntry* best = nullptr;
    for (const auto& entry : entries) {
        if (entry.matches(tool) && (!best || entry.specificity() > best->specificity())) {
            best = &entry;
        }
    }
    return best;
}

} // namespace

bool pattern_matches(const std::string& pattern, const std::string& value) {
    if (!pattern.empty() && pattern.back() == '*') {
        return value.compare(0, pattern.size() - 1, pattern, 0, pattern.size() - 1) == 0;
    }
    return pattern == value;
}

size_t ManifestEntry::specificity() const {
    if (!pattern.empty() && pattern.back() == '*') {
        return pattern.size() - 1;
    }
    return std::numeric_limits<size_t>::max();
}

CapabilityManifest::CapabilityManifest(std::vector<ManifestEntry> allow, std::vector<ManifestEntry> deny)
    : allow_(std::move(allow)), deny_(std::move(deny)) {}

CapabilityManifest CapabilityManifest::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw LoomError(manifest_error("manifest must be a mapping with allow/deny lists"));
    }
    if (!doc.contains("allow") && !doc.contains("deny")) {
        throw LoomError(manifest_error("manifest has neither 'allow' nor 'deny'"));
    }
    return CapabilityManifest(parse_list(doc, "allow", true), parse_list(doc, "deny", false));
}

CapabilityManifest CapabilityManifest::load_file(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        throw LoomError(manifest_error("capability manifest not found: " + path));
    }
    nlohmann::json doc;
    try {
        doc = load_structured_file(path);
    } catch (const std::runtime_error& e) {
        throw LoomError(manifest_error(std::string("capability manifest unreadable: ") + e.what()));
    }
    return from_json(doc);
}

CapabilityManifest CapabilityManifest::with_denied(const std::vector<ToolName>& tools) const {
    CapabilityManifest copy = *this;
    for (const auto& tool : tools) {
        ManifestEntry entry;
        entry.pattern = tool;
        copy.deny_.push_back(std::move(entry));
    }
    return copy;
}

const ManifestEntry* CapabilityManifest::find_allow(const ToolName& tool) const {
    return best_match(allow_, tool);
}

const ManifestEntry* CapabilityManifest::find_deny(const ToolName& tool) const {
    return best_match(deny_, tool);
}

nlohmann::json CapabilityManifest::to_json() const {
    nlohmann::json allow = nlohmann::json::array();
    for (const auto& e : allow_) {
        nlohmann::json j{{"tool", e.pattern}, {"write", e.write}, {"write_fields", e.write_fields}};
        if (e.rate_limit) {
            j["rate_limit"] = {{"max_calls", e.rate_limit->max_calls}, {"window_ms", e.rate_limit->window_ms}};
        }
        allow.push_back(std::move(j));
    }
    nlohmann::json deny = nlohmann::json::array();
    for (const auto& e : deny_) {
        deny.push_back(e.pattern);
    }
    return nlohmann::json{{"allow", allow}, {"deny", deny}};
}

} // namespace loom
