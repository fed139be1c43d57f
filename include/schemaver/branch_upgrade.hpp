#pragma once
#include <memory>
#include <string>
#include <vector>
#include "upgrade.hpp"
#include "version.hpp"

namespace schemaver {

// A problem of one version transition, whatever found it.
struct PlanProblem {
    Severity severity = Severity::Error;
    std::string version; // the version the problem belongs to, empty for the package
    std::string text;

    std::string str() const;
};

/**
 * BranchUpgradeAnalysis
 *  - a branch without parent is a base version: nothing to diff, the
 *    creation script comes straight from its schema
 *  - otherwise both payloads get resolved (loading them when lazy) and
 *    the parent schema is diffed once against the current top changes and
 *    schema
 *
 * Throws CyclicDependencyError when the upgrades cannot be ordered.
 */
class BranchUpgradeAnalysis {
public:
    explicit BranchUpgradeAnalysis(SchemaBranch& branch);
    ~BranchUpgradeAnalysis();

    BranchUpgradeAnalysis(const BranchUpgradeAnalysis&) = delete;
    BranchUpgradeAnalysis& operator=(const BranchUpgradeAnalysis&) = delete;

    bool is_upgrade() const { return previous_ != nullptr; }
    const SchemaBranch& branch() const { return branch_; }
    const SchemaVersion& current() const { return *current_; }
    // nullptr for a base version
    const SchemaVersion* previous() const { return previous_; }
    // nullptr for a base version
    const SchemaUpgradedSet* upgrade_set() const { return upgrade_set_.get(); }

    // the ordered upgrades, empty for a base version
    const std::vector<UpgradeItem>& changes() const { return changes_; }

    // parse problems of both versions, then the diff errors and warnings
    const std::vector<PlanProblem>& problems() const { return problems_; }
    bool has_errors() const;

private:
    SchemaBranch& branch_;
    const SchemaVersion* current_ = nullptr;
    const SchemaVersion* previous_ = nullptr;
    std::unique_ptr<SchemaUpgradedSet> upgrade_set_;
    std::vector<UpgradeItem> changes_;
    std::vector<PlanProblem> problems_;
};

} // namespace schemaver
