#pragma once
#include <string>
#include <vector>
#include "jsonhlp.hpp"

namespace schemaver {

/**
 * PlanConfig
 *  - log_level / log_pattern: spdlog settings
 *  - warnings_as_errors: a plan with warnings is blocked
 *  - platforms: preference list used to pick SQL snippets
 */
struct PlanConfig {
    std::string log_level = "info";
    std::string log_pattern;
    bool warnings_as_errors = false;
    std::vector<std::string> platforms {"any"};

    // False when the document is not an object. Unknown keys are ignored and
    // keys of the wrong type keep their default.
    static bool from_json(const jdoc& doc, PlanConfig& config);
    static bool parse(const std::string& text, PlanConfig& config);
    static bool load_file(const std::string& path, PlanConfig& config);
};

} // namespace schemaver
