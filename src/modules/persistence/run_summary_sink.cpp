// modules/persistence/run_summary_sink.cpp
#include "modules/persistence/run_summary_sink.h"
#include "common/logging/logging.h"
#include <fstream>
#include <stdexcept>

namespace loom {

void JsonlRunSummarySink::store(const RunSummary& summary) {
    nlohmann::json line = summary;
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open run summary file: " + path_);
    }
    file << line.dump() << '\n';
    if (!file) {
        throw std::runtime_error("Failed to write run summary file: " + path_);
    }
}

std::vector<nlohmann::json> JsonlRunSummarySink::load_all() const {
    std::vector<nlohmann::json> out;
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream file(path_);
    if (!file.is_open()) return out;

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty()) continue;
        auto parsed = nlohmann::json::parse(line, nullptr, false);
        if (parsed.is_discarded()) {
            LOOM_LOG_WARN("skipping malformed run summary line", {StringField("path", path_),
                                                                  IntField("line", static_cast<int64_t>(line_no))});
            continue;
        }
        out.push_back(std::move(parsed));
    }
    return out;
}

} // namespace loom
