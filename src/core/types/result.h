#ifndef LOOM_TYPES_RESULT_H
#define LOOM_TYPES_RESULT_H

#include "context.h"
#include "error.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace loom {

// Reference to a payload kept out of band; the bytes never travel with it
struct ArtifactHandle {
    std::string uri;          // artifact://blake3/<hex>
    std::string content_type;
    uint64_t size = 0;

    bool operator==(const ArtifactHandle&) const = default;
};

struct Metrics {
    int64_t cpu_ms = 0;
    int64_t mem_mb = 0;
    int64_t operation_count = 0;
    int64_t tool_call_count = 0;

    // cpu, ops and tool calls add up; memory keeps the peak
    void accumulate(const Metrics& other);
    bool operator==(const Metrics&) const = default;
};

// Sandbox Engine 的唯一返回类型
struct ResultEnvelope {
    std::string summary;
    std::vector<ArtifactHandle> artifacts;
    Value state_updates = Value::object();
    Metrics metrics;

    // Size of the compact JSON serialization
    size_t serialized_size() const;
};

void to_json(nlohmann::json& j, const ArtifactHandle& a);
void from_json(const nlohmann::json& j, ArtifactHandle& a);
void to_json(nlohmann::json& j, const Metrics& m);
void from_json(const nlohmann::json& j, Metrics& m);
void to_json(nlohmann::json& j, const ResultEnvelope& r);
void from_json(const nlohmann::json& j, ResultEnvelope& r);

// Outcome of one engine call. Failures still carry whatever metrics were measured.
struct ExecuteResult {
    bool success = false;
    ResultEnvelope envelope;
    std::optional<Error> error;

    static ExecuteResult ok(ResultEnvelope envelope) {
        return ExecuteResult{true, std::move(envelope), std::nullopt};
    }
    static ExecuteResult fail(Error error, Metrics metrics = {}) {
        ExecuteResult r;
        r.success = false;
        r.envelope.metrics = metrics;
        r.error = std::move(error);
        return r;
    }
};

} // namespace loom

#endif // LOOM_TYPES_RESULT_H
