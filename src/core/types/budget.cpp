#include "core/types/budget.h"
#include <algorithm>
#include <stdexcept>

namespace loom {

Budget Budget::clamped_to(const Budget& ceiling) const {
    Budget out = *this;
    out.cpu_ms = std::min(cpu_ms, ceiling.cpu_ms);
    out.mem_mb = std::min(mem_mb, ceiling.mem_mb);
    out.max_ops = std::min(max_ops, ceiling.max_ops);
    out.max_output_bytes = std::min(max_output_bytes, ceiling.max_output_bytes);
    out.token_cap = std::min(token_cap, ceiling.token_cap);
    if (ceiling.wall_ms >= 0) {
        out.wall_ms = (wall_ms < 0) ? ceiling.wall_ms : std::min(wall_ms, ceiling.wall_ms);
    }
    return out;
}

void to_json(nlohmann::json& j, const Budget& b) {
    j = nlohmann::json{
        {"cpu_ms", b.cpu_ms},
        {"mem_mb", b.mem_mb},
        {"max_ops", b.max_ops},
        {"max_output_bytes", b.max_output_bytes},
        {"token_cap", b.token_cap},
        {"wall_ms", b.wall_ms}
    };
}

void from_json(const nlohmann::json& j, Budget& b) {
    if (!j.is_object()) {
        throw std::runtime_error("budget must be an object");
    }
    b.cpu_ms = j.value("cpu_ms", b.cpu_ms);
    b.mem_mb = j.value("mem_mb", b.mem_mb);
    b.max_ops = j.value("max_ops", b.max_ops);
    b.max_output_bytes = j.value("max_output_bytes", b.max_output_bytes);
    b.token_cap = j.value("token_cap", b.token_cap);
    b.wall_ms = j.value("wall_ms", b.wall_ms);
}

Budget budget_from_json(const nlohmann::json& j, const Budget& defaults) {
    Budget b = defaults;
    if (!j.is_null()) {
        from_json(j, b);
    }
    return b;
}

void to_json(nlohmann::json& j, const RunLimits& r) {
    j = nlohmann::json{
        {"max_nodes", r.max_nodes},
        {"max_wall_ms", r.max_wall_ms},
        {"max_tool_calls", r.max_tool_calls},
        {"max_replans", r.max_replans}
    };
}

void from_json(const nlohmann::json& j, RunLimits& r) {
    r.max_nodes = j.value("max_nodes", r.max_nodes);
    r.max_wall_ms = j.value("max_wall_ms", r.max_wall_ms);
    r.max_tool_calls = j.value("max_tool_calls", r.max_tool_calls);
    r.max_replans = j.value("max_replans", r.max_replans);
}

} // namespace loom
