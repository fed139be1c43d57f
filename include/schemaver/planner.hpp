#pragma once
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "branch_upgrade.hpp"
#include "config.hpp"
#include "version.hpp"

namespace schemaver {

// The outcome of planning one version of a package.
struct UpgradePlan {
    std::string package;
    std::optional<SchemaVersionNumber> version;      // empty when no version was found
    std::unique_ptr<BranchUpgradeAnalysis> analysis; // empty when no version was found
    std::vector<PlanProblem> problems;
    bool blocked = false;                            // generation must not go on

    bool is_upgrade() const { return analysis && analysis->is_upgrade(); }
};

/**
 * UpgradePlanner
 *  - keeps the packages by name
 *  - plans the newest (or a given) version of a package: package level
 *    problems first, then the problems of the version transition
 *  - a plan is blocked by any error, or by any warning when the config
 *    asks for warnings as errors
 */
class UpgradePlanner {
public:
    explicit UpgradePlanner(PlanConfig config = PlanConfig());

    const PlanConfig& config() const { return config_; }

    // Creates the package on first use.
    SchemaPackage& package(const std::string& name);
    bool has(const std::string& name) const { return catalog_.find(name) != catalog_.end(); }

    // Fatal errors (a dependency cycle, a failing loader) propagate.
    UpgradePlan plan(const std::string& name, const std::optional<SchemaVersionNumber>& version = std::nullopt);

private:
    PlanConfig config_;
    std::unordered_map<std::string, std::unique_ptr<SchemaPackage>> catalog_;
};

} // namespace schemaver
