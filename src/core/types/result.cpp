#include "core/types/result.h"
#include <algorithm>

namespace loom {

void Metrics::accumulate(const Metrics& other) {
    cpu_ms += other.cpu_ms;
    mem_mb = std::max(mem_mb, other.mem_mb);
    operation_count += other.operation_count;
    tool_call_count += other.tool_call_count;
}

size_t ResultEnvelope::serialized_size() const {
    return nlohmann::json(*this).dump().size();
}

void to_json(nlohmann::json& j, const ArtifactHandle& a) {
    j = nlohmann::json{{"uri", a.uri}, {"content_type", a.content_type}, {"size", a.size}};
}

void from_json(const nlohmann::json& j, ArtifactHandle& a) {
    a.uri = j.at("uri").get<std::string>();
    a.content_type = j.value("content_type", std::string("application/octet-stream"));
    a.size = j.value("size", uint64_t{0});
}

void to_json(nlohmann::json& j, const Metrics& m) {
    j = nlohmann::json{
        {"cpu_ms", m.cpu_ms},
        {"mem_mb", m.mem_mb},
        {"operation_count", m.operation_count},
        {"tool_call_count", m.tool_call_count}
    };
}

void from_json(const nlohmann::json& j, Metrics& m) {
    m.cpu_ms = j.value("cpu_ms", int64_t{0});
    m.mem_mb = j.value("mem_mb", int64_t{0});
    m.operation_count = j.value("operation_count", int64_t{0});
    m.tool_call_count = j.value("tool_call_count", int64_t{0});
}

void to_json(nlohmann::json& j, const ResultEnvelope& r) {
    j = nlohmann::json{
        {"summary", r.summary},
        {"artifacts", r.artifacts},
        {"state_updates", r.state_updates},
        {"metrics", r.metrics}
    };
}

void from_json(const nlohmann::json& j, ResultEnvelope& r) {
    r.summary = j.value("summary", std::string());
    r.artifacts = j.value("artifacts", std::vector<ArtifactHandle>{});
    r.state_updates = j.value("state_updates", nlohmann::json::object());
    if (!r.state_updates.is_object()) {
        throw std::runtime_error("state_updates must be an object");
    }
    r.metrics = j.value("metrics", Metrics{});
}

} // namespace loom
