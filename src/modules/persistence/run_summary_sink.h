// modules/persistence/run_summary_sink.h
#ifndef LOOM_MODULES_PERSISTENCE_RUN_SUMMARY_SINK_H
#define LOOM_MODULES_PERSISTENCE_RUN_SUMMARY_SINK_H

#include "core/types/run_state.h"
#include <mutex>
#include <string>
#include <vector>

namespace loom {

// 运行摘要的持久化接口，由外部应用实现
class RunSummarySink {
public:
    virtual ~RunSummarySink() = default;
    virtual void store(const RunSummary& summary) = 0;
};

// Appends one compact JSON line per finished run
class JsonlRunSummarySink : public RunSummarySink {
public:
    explicit JsonlRunSummarySink(std::string path) : path_(std::move(path)) {}

    // Throws std::runtime_error when the file cannot be written
    void store(const RunSummary& summary) override;

    // Every stored line, oldest first; malformed lines are skipped
    std::vector<nlohmann::json> load_all() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace loom

#endif // LOOM_MODULES_PERSISTENCE_RUN_SUMMARY_SINK_H
