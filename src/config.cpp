#include "schemaver/config.hpp"

#define PROP_LOG_LEVEL          "log_level"
#define PROP_LOG_PATTERN        "log_pattern"
#define PROP_WARNINGS_AS_ERRORS "warnings_as_errors"
#define PROP_PLATFORMS          "platforms"

namespace schemaver {

bool PlanConfig::from_json(const jdoc& doc, PlanConfig& config) {
    if (!doc.IsObject()) return false;
    const jval& j = doc;

    config.log_level = jhlp::get<std::string>(j, PROP_LOG_LEVEL, config.log_level);
    config.log_pattern = jhlp::get<std::string>(j, PROP_LOG_PATTERN, config.log_pattern);
    config.warnings_as_errors = jhlp::get<bool>(j, PROP_WARNINGS_AS_ERRORS, config.warnings_as_errors);

    auto platforms = jhlp::get_strings(j, PROP_PLATFORMS);
    if (!platforms.empty()) config.platforms = std::move(platforms);
    return true;
}

bool PlanConfig::parse(const std::string& text, PlanConfig& config) {
    jdoc doc;
    if (!jhlp::parse_str(text, doc)) return false;
    return from_json(doc, config);
}

bool PlanConfig::load_file(const std::string& path, PlanConfig& config) {
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) return false;
    return from_json(doc, config);
}

} // namespace schemaver
