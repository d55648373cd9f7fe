#ifndef LOOM_COMMON_LOGGING_LOGGING_H
#define LOOM_COMMON_LOGGING_LOGGING_H

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace loom {

struct LoggingConfig;

struct LogField {
    std::string key;
    std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs the "loom" logger as spdlog default. LOOM_LOG_LEVEL and
// LOOM_LOG_PATTERN override the configured values.
void init_logging(const LoggingConfig& config);
void shutdown_logging();

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::err, message, fields);
}

} // namespace loom

#define LOOM_LOG_DEBUG(message, ...) ::loom::log_debug((message), ##__VA_ARGS__)
#define LOOM_LOG_INFO(message, ...) ::loom::log_info((message), ##__VA_ARGS__)
#define LOOM_LOG_WARN(message, ...) ::loom::log_warn((message), ##__VA_ARGS__)
#define LOOM_LOG_ERROR(message, ...) ::loom::log_error((message), ##__VA_ARGS__)

#endif // LOOM_COMMON_LOGGING_LOGGING_H
