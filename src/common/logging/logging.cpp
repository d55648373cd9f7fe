// common/logging/logging.cpp
#include "common/logging/logging.h"
#include "common/config/loom_config.h"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace loom {
namespace {

constexpr const char* kLoggerName = "loom";

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("LOOM_LOG_LEVEL")) {
        return level;
    }
    if (!config.level.empty()) {
        return config.level;
    }
    return "info";
}

std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("LOOM_LOG_PATTERN")) {
        return pattern;
    }
    if (!config.pattern.empty()) {
        return config.pattern;
    }
    return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string serialize_fields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first) {
            out << ' ';
        }
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

void init_logging(const LoggingConfig& config) {
    spdlog::drop(kLoggerName);
    // the worker's stdout is the protocol channel
    auto logger = config.to_stderr ? spdlog::stderr_color_mt(kLoggerName)
                                   : spdlog::stdout_color_mt(kLoggerName);
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
    auto serialized_fields = serialize_fields(fields);
    if (!serialized_fields.empty()) {
        spdlog::log(level, "{} {}", message, serialized_fields);
        return;
    }
    spdlog::log(level, "{}", message);
}

} // namespace loom
