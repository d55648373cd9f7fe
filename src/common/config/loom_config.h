#ifndef LOOM_COMMON_CONFIG_LOOM_CONFIG_H
#define LOOM_COMMON_CONFIG_LOOM_CONFIG_H

#include "core/types/budget.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace loom {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern;
    bool to_stderr = false;
};

// 解释器内部限制
struct ScriptLimits {
    int max_call_depth = 64;
    int64_t max_collection_size = 100'000;
    int64_t max_string_bytes = 1 << 20;
};

struct SandboxConfig {
    std::string worker_path;
    int max_concurrent_workers = 4;
    int64_t max_source_bytes = 64 * 1024;
    uint32_t max_frame_bytes = 4u << 20;
    int64_t envelope_cap_bytes = 256 * 1024;
    int max_fds = 32;
    int64_t wall_grace_ms = 500;
    bool isolate_network = true;
    ScriptLimits script;
};

struct ExecutorConfig {
    int64_t approval_timeout_ms = 5 * 60 * 1000;
    int max_replans = 1;
};

struct ReducerConfig {
    size_t summary_char_budget = 4000;
};

struct LlmConfig {
    std::string model_path = "models/qwen-0.6b.gguf";
    int n_ctx = 2048;
    int n_threads = 4;
    float temperature = 0.7f;
    float min_p = 0.05f;
    int n_predict = 512;
};

struct LoomConfig {
    LoggingConfig logging;
    SandboxConfig sandbox;
    ExecutorConfig executor;
    ReducerConfig reducer;
    LlmConfig llm;
    std::string manifest_path;
    Budget default_budget;
    int64_t retained_runs = 64; // finished runs kept for status/trace queries
};

// Sections absent from the document keep their defaults
LoomConfig config_from_json(const nlohmann::json& doc);

// Loads YAML or JSON; an empty path or missing file yields defaults.
// Environment overrides are applied last. Throws LoomError on a malformed file.
LoomConfig load_config(const std::string& path);

// LOOM_WORKER_PATH, LOOM_LOG_LEVEL, LOOM_MAX_WORKERS
void apply_env_overrides(LoomConfig& config);

} // namespace loom

#endif // LOOM_COMMON_CONFIG_LOOM_CONFIG_H
