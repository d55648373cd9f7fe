// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include "common/logging/logging.h"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace loom {

namespace {

int64_t epoch_ms(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

} // namespace

void to_json(nlohmann::json& j, const TraceRecord& r) {
    j = nlohmann::json{
        {"trace_id", r.trace_id},
        {"node_id", r.node_id},
        {"kind", r.kind},
        {"attempt", r.attempt},
        {"start_ms", epoch_ms(r.start_time)},
        {"end_ms", epoch_ms(r.end_time)},
        {"duration_ms", std::max<int64_t>(0, epoch_ms(r.end_time) - epoch_ms(r.start_time))},
        {"status", r.status},
        {"from_cache", r.from_cache},
        {"error", r.error ? nlohmann::json(*r.error) : nlohmann::json()},
        {"metrics", r.metrics},
        {"budget", r.budget_snapshot}
    };
}

void to_json(nlohmann::json& j, const ToolEventRecord& r) {
    j = nlohmann::json{
        {"trace_id", r.trace_id},
        {"time_ms", epoch_ms(r.time)},
        {"kind", to_string(r.event.kind)},
        {"tool", r.event.tool},
        {"server", r.event.server},
        {"detail", r.event.detail}
    };
}

void TraceExporter::on_node_start(const NodeId& node_id, const std::string& kind, int attempt,
                                  const nlohmann::json& budget_snapshot) {
    TraceRecord record;
    record.trace_id = trace_id_;
    record.node_id = node_id;
    record.kind = kind;
    record.attempt = attempt;
    record.start_time = std::chrono::system_clock::now();
    record.end_time = record.start_time;
    record.status = "running"; // on_node_end 更新
    record.budget_snapshot = budget_snapshot;

    std::lock_guard<std::mutex> lock(mutex_);
    traces_.push_back(std::move(record));
}

void TraceExporter::on_node_end(const NodeId& node_id, const std::string& status,
                                const std::optional<Error>& error, const Metrics& metrics, bool from_cache) {
    TraceRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(traces_.rbegin(), traces_.rend(), [&node_id](const TraceRecord& r) {
            return r.node_id == node_id && r.status == "running";
        });
        if (it == traces_.rend()) {
            // 未经 start 的节点（如被跳过）直接补一条
            TraceRecord record;
            record.trace_id = trace_id_;
            record.node_id = node_id;
            record.kind = "unit";
            record.attempt = 0;
            record.start_time = std::chrono::system_clock::now();
            traces_.push_back(std::move(record));
            it = traces_.rbegin();
        }
        it->end_time = std::chrono::system_clock::now();
        it->status = status;
        it->error = error;
        it->metrics = metrics;
        it->from_cache = from_cache;
        snapshot = *it;
    }

    nlohmann::json span = snapshot;
    LOOM_LOG_INFO("span", {StringField("trace_id", snapshot.trace_id), StringField("node", node_id),
                           StringField("status", status), IntField("attempt", snapshot.attempt),
                           BoolField("from_cache", from_cache),
                           StringField("error", error ? error->qualified() : ""),
                           IntField("duration_ms", span["duration_ms"].get<int64_t>())});
}

void TraceExporter::on_tool_event(const ToolEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    tool_events_.push_back(ToolEventRecord{trace_id_, std::chrono::system_clock::now(), event});
}

void TraceExporter::on_run_end(const nlohmann::json& run_record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        run_record_ = run_record;
    }
    LOOM_LOG_INFO("run record", {StringField("trace_id", trace_id_),
                                 StringField("outcome", run_record.value("outcome", std::string())),
                                 StringField("summary_hash", run_record.value("summary_hash", std::string()))});
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

std::vector<ToolEventRecord> TraceExporter::get_tool_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tool_events_;
}

std::optional<nlohmann::json> TraceExporter::get_run_record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return run_record_;
}

void TraceExporter::clear_traces() {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.clear();
    tool_events_.clear();
    run_record_.reset();
}

nlohmann::json TraceExporter::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nlohmann::json{
        {"trace_id", trace_id_},
        {"spans", traces_},
        {"tool_events", tool_events_},
        {"run", run_record_ ? *run_record_ : nlohmann::json()}
    };
}

void TraceExporter::export_to_file(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot write trace file: " + path);
    }
    out << to_json().dump(2) << "\n";
}

} // namespace loom
