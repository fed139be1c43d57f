#include "schemaver/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "schemaver/config.hpp"

namespace schemaver {

namespace {

    std::string resolve_level(const PlanConfig& config) {
        if (const char* level = std::getenv("SCHEMAVER_LOG_LEVEL")) {
            return level;
        }
        if (!config.log_level.empty()) {
            return config.log_level;
        }
        return "info";
    }

    std::string resolve_pattern(const PlanConfig& config) {
        if (const char* pattern = std::getenv("SCHEMAVER_LOG_PATTERN")) {
            return pattern;
        }
        if (!config.log_pattern.empty()) {
            return config.log_pattern;
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

void init_logging(const PlanConfig& config) {
    auto logger = spdlog::get("schemaver");
    if (!logger) {
        // stderr keeps stdout free for the generated report
        logger = spdlog::stderr_color_mt("schemaver");
    }
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

} // namespace schemaver
