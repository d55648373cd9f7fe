// modules/trace/trace_exporter.h
#ifndef LOOM_MODULES_TRACE_TRACE_EXPORTER_H
#define LOOM_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/context.h"
#include "core/types/error.h"
#include "core/types/result.h"
#include "modules/tools/tool_client.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace loom {

// 每次节点尝试一个 span
struct TraceRecord {
    std::string trace_id;   // run id
    NodeId node_id;
    std::string kind;       // "unit" or "approval"
    int attempt = 1;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status;     // running, succeeded, failed, skipped
    bool from_cache = false;
    std::optional<Error> error;
    Metrics metrics;
    nlohmann::json budget_snapshot; // node budget and run counters at dispatch
};

struct ToolEventRecord {
    std::string trace_id;
    std::chrono::system_clock::time_point time;
    ToolEvent event;
};

void to_json(nlohmann::json& j, const TraceRecord& r);
void to_json(nlohmann::json& j, const ToolEventRecord& r);

// Collects spans, tool events and the final run record of one run. Safe for
// concurrent callers.
class TraceExporter {
public:
    explicit TraceExporter(std::string trace_id = "t-default") : trace_id_(std::move(trace_id)) {}

    void on_node_start(const NodeId& node_id, const std::string& kind, int attempt,
                       const nlohmann::json& budget_snapshot);

    void on_node_end(const NodeId& node_id, const std::string& status, const std::optional<Error>& error,
                     const Metrics& metrics, bool from_cache);

    void on_tool_event(const ToolEvent& event);

    // 运行结束时的汇总记录
    void on_run_end(const nlohmann::json& run_record);

    std::vector<TraceRecord> get_traces() const;
    std::vector<ToolEventRecord> get_tool_events() const;
    std::optional<nlohmann::json> get_run_record() const;
    void clear_traces();

    nlohmann::json to_json() const;
    // Throws std::runtime_error when the file cannot be written
    void export_to_file(const std::string& path) const;

    const std::string& trace_id() const { return trace_id_; }

private:
    std::string trace_id_;
    mutable std::mutex mutex_;
    std::vector<TraceRecord> traces_;
    std::vector<ToolEventRecord> tool_events_;
    std::optional<nlohmann::json> run_record_;
};

} // namespace loom

#endif // LOOM_MODULES_TRACE_TRACE_EXPORTER_H
