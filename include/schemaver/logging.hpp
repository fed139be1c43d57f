#pragma once
#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace schemaver {

struct PlanConfig;

struct LogField {
    std::string key;
    std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Level and pattern come from the config; SCHEMAVER_LOG_LEVEL and
// SCHEMAVER_LOG_PATTERN override them.
void init_logging(const PlanConfig& config);
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

} // namespace schemaver

#define SCHEMAVER_LOG_DEBUG(message, ...) ::schemaver::log_debug((message), ##__VA_ARGS__)
#define SCHEMAVER_LOG_INFO(message, ...) ::schemaver::log_info((message), ##__VA_ARGS__)
#define SCHEMAVER_LOG_WARN(message, ...) ::schemaver::log_warn((message), ##__VA_ARGS__)
#define SCHEMAVER_LOG_ERROR(message, ...) ::schemaver::log_error((message), ##__VA_ARGS__)
