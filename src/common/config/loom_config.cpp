// common/config/loom_config.cpp
#include "common/config/loom_config.h"
#include "common/utils/yaml_json.h"
#include "core/types/error.h"
#include <cstdlib>
#include <filesystem>
#include <string>

namespace loom {

namespace {

std::string default_worker_path() {
#ifdef LOOM_DEFAULT_WORKER_PATH
    return LOOM_DEFAULT_WORKER_PATH;
#else
    return "loom_worker";
#endif
}

} // namespace

LoomConfig config_from_json(const nlohmann::json& doc) {
    LoomConfig config;
    config.sandbox.worker_path = default_worker_path();
    if (doc.is_null()) {
        return config;
    }
    if (!doc.is_object()) {
        throw std::runtime_error("configuration root must be a mapping");
    }

    if (doc.contains("logging")) {
        const auto& j = doc["logging"];
        config.logging.level = j.value("level", config.logging.level);
        config.logging.pattern = j.value("pattern", config.logging.pattern);
    }

    if (doc.contains("sandbox")) {
        const auto& j = doc["sandbox"];
        auto& s = config.sandbox;
        s.worker_path = j.value("worker_path", s.worker_path);
        s.max_concurrent_workers = j.value("max_concurrent_workers", s.max_concurrent_workers);
        s.max_source_bytes = j.value("max_source_bytes", s.max_source_bytes);
        s.max_frame_bytes = j.value("max_frame_bytes", s.max_frame_bytes);
        s.envelope_cap_bytes = j.value("envelope_cap_bytes", s.envelope_cap_bytes);
        s.max_fds = j.value("max_fds", s.max_fds);
        s.wall_grace_ms = j.value("wall_grace_ms", s.wall_grace_ms);
        s.isolate_network = j.value("isolate_network", s.isolate_network);
        if (j.contains("script")) {
            const auto& sj = j["script"];
            s.script.max_call_depth = sj.value("max_call_depth", s.script.max_call_depth);
            s.script.max_collection_size = sj.value("max_collection_size", s.script.max_collection_size);
            s.script.max_string_bytes = sj.value("max_string_bytes", s.script.max_string_bytes);
        }
        if (s.max_concurrent_workers < 1) {
            throw std::runtime_error("sandbox.max_concurrent_workers must be >= 1");
        }
    }

    if (doc.contains("executor")) {
        const auto& j = doc["executor"];
        config.executor.approval_timeout_ms = j.value("approval_timeout_ms", config.executor.approval_timeout_ms);
        config.executor.max_replans = j.value("max_replans", config.executor.max_replans);
    }

    if (doc.contains("reducer")) {
        config.reducer.summary_char_budget =
            doc["reducer"].value("summary_char_budget", config.reducer.summary_char_budget);
    }

    if (doc.contains("llm")) {
        const auto& j = doc["llm"];
        auto& l = config.llm;
        l.model_path = j.value("model_path", l.model_path);
        l.n_ctx = j.value("n_ctx", l.n_ctx);
        l.n_threads = j.value("n_threads", l.n_threads);
        l.temperature = j.value("temperature", l.temperature);
        l.min_p = j.value("min_p", l.min_p);
        l.n_predict = j.value("n_predict", l.n_predict);
    }

    config.manifest_path = doc.value("manifest_path", config.manifest_path);
    config.retained_runs = doc.value("retained_runs", config.retained_runs);
    if (config.retained_runs < 0) {
        throw LoomError(make_error(ErrorKind::CODE, codes::RUNTIME_ERROR, "retained_runs must not be negative"));
    }
    if (doc.contains("default_budget")) {
        config.default_budget = budget_from_json(doc["default_budget"], config.default_budget);
    }
    return config;
}

void apply_env_overrides(LoomConfig& config) {
    if (const char* path = std::getenv("LOOM_WORKER_PATH")) {
        config.sandbox.worker_path = path;
    }
    if (const char* level = std::getenv("LOOM_LOG_LEVEL")) {
        config.logging.level = level;
    }
    if (const char* workers = std::getenv("LOOM_MAX_WORKERS")) {
        try {
            int n = std::stoi(workers);
            if (n >= 1) config.sandbox.max_concurrent_workers = n;
        } catch (const std::exception&) {
            throw LoomError(make_error(ErrorKind::CODE, codes::RUNTIME_ERROR,
                                       "LOOM_MAX_WORKERS is not a number"));
        }
    }
}

LoomConfig load_config(const std::string& path) {
    LoomConfig config;
    if (path.empty() || !std::filesystem::exists(path)) {
        config = config_from_json(nlohmann::json());
    } else {
        try {
            config = config_from_json(load_structured_file(path));
            // relative model paths resolve against the config file's directory
            std::filesystem::path model(config.llm.model_path);
            if (model.is_relative()) {
                auto dir = std::filesystem::path(path).parent_path();
                if (dir.empty()) dir = ".";
                config.llm.model_path = std::filesystem::absolute(dir / model).string();
            }
        } catch (const nlohmann::json::exception& e) {
            throw LoomError(make_error(ErrorKind::CODE, codes::RUNTIME_ERROR,
                                       "invalid configuration " + path + ": " + e.what()));
        } catch (const std::runtime_error& e) {
            throw LoomError(make_error(ErrorKind::CODE, codes::RUNTIME_ERROR,
                                       "invalid configuration " + path + ": " + e.what()));
        }
    }
    apply_env_overrides(config);
    return config;
}

} // namespace loom
