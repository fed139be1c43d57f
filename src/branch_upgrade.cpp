#include "schemaver/branch_upgrade.hpp"
#include "schemaver/logging.hpp"

namespace schemaver {

namespace {

    void add_parse_problems(std::vector<PlanProblem>& to, const SchemaVersion& version) {
        for (const auto& problem : version.problems()) {
            to.push_back({problem.severity(), version.version().str(),
                          problem.message() + " ; " + problem.source_location()});
        }
    }

}

std::string PlanProblem::str() const {
    std::string ret = severity_name(severity);
    if (!version.empty()) ret += " [" + version + "]";
    return ret + ": " + text;
}

BranchUpgradeAnalysis::BranchUpgradeAnalysis(SchemaBranch& branch) : branch_(branch) {
    // resolved even for a base version, so its parse problems get reported
    current_ = &branch_.payload();
    add_parse_problems(problems_, *current_);

    SchemaBranch* parent = branch_.parent();
    if (!parent) {
        SCHEMAVER_LOG_DEBUG("base version, nothing to diff", {
            StringField("package", branch_.package()),
            StringField("version", branch_.version().str())});
        return;
    }

    previous_ = &parent->payload();
    add_parse_problems(problems_, *previous_);

    std::vector<UpgradeSource> after;
    for (const auto& change : current_->top_changes()) after.emplace_back(&change);
    for (const auto& obj : current_->schema()) after.emplace_back(ref_of(obj));

    std::vector<ObjectRef> before;
    for (const auto& obj : previous_->schema()) before.push_back(ref_of(obj));

    upgrade_set_ = std::make_unique<SchemaUpgradedSet>(before, after);
    changes_ = upgrade_set_->all_upgrades();

    const std::string version = current_->version().str();
    for (const auto& err : upgrade_set_->errors()) problems_.push_back({Severity::Error, version, err.str()});
    for (const auto& warn : upgrade_set_->warnings()) problems_.push_back({Severity::Warning, version, warn.str()});

    SCHEMAVER_LOG_DEBUG("diffed versions", {
        StringField("package", branch_.package()),
        StringField("from", previous_->version().str()),
        StringField("to", version),
        IntField("upgrades", static_cast<std::int64_t>(changes_.size())),
        IntField("errors", static_cast<std::int64_t>(upgrade_set_->errors().size())),
        IntField("warnings", static_cast<std::int64_t>(upgrade_set_->warnings().size()))});
}

BranchUpgradeAnalysis::~BranchUpgradeAnalysis() = default;

bool BranchUpgradeAnalysis::has_errors() const {
    for (const auto& problem : problems_) {
        if (problem.severity == Severity::Error || problem.severity == Severity::Fatal) return true;
    }
    return false;
}

} // namespace schemaver
