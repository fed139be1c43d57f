#include "schemaver/planner.hpp"
#include "schemaver/logging.hpp"

#define MSG_NO_VERSIONS    "no versions in package"
#define MSG_NO_SUCH_VER    "could not find version "
#define MSG_AVAILABLE      " in package; available versions are "
#define MSG_UNKNOWN_PARENT "package references unknown version number "
#define MSG_DETACHED       " never attached to a registered parent"

namespace schemaver {

namespace {

    std::string join_versions(const std::vector<SchemaVersionNumber>& versions) {
        std::string ret;
        for (const auto& v : versions) {
            if (!ret.empty()) ret += ", ";
            ret += "'" + v.str() + "'";
        }
        return ret;
    }

}

UpgradePlanner::UpgradePlanner(PlanConfig config) : config_(std::move(config)) {}

SchemaPackage& UpgradePlanner::package(const std::string& name) {
    auto it = catalog_.find(name);
    if (it == catalog_.end()) {
        it = catalog_.emplace(name, std::make_unique<SchemaPackage>(name)).first;
    }
    return *it->second;
}

UpgradePlan UpgradePlanner::plan(const std::string& name, const std::optional<SchemaVersionNumber>& version) {
    UpgradePlan ret;
    ret.package = name;

    auto it = catalog_.find(name);
    SchemaPackage* pkg = it == catalog_.end() ? nullptr : it->second.get();

    if (pkg) {
        for (const auto& missing : pkg->unresolved_branch_versions()) {
            ret.problems.push_back({Severity::Error, "", MSG_UNKNOWN_PARENT + missing.str()});
        }
        // registration is over, so whatever still waits never attaches
        for (const auto& detached : pkg->deferred_branch_versions()) {
            ret.problems.push_back({Severity::Error, "", "version " + detached.str() + MSG_DETACHED});
        }
    }

    SchemaBranch* branch = nullptr;
    if (!pkg || pkg->size() == 0) {
        ret.problems.push_back({Severity::Error, "", MSG_NO_VERSIONS});
    } else if (version) {
        branch = pkg->find(*version);
        if (!branch) {
            ret.problems.push_back({Severity::Error, "",
                MSG_NO_SUCH_VER "'" + version->str() + "'" MSG_AVAILABLE + join_versions(pkg->versions())});
        }
    } else {
        branch = pkg->newest_version();
    }

    if (branch) {
        ret.version = branch->version();
        ret.analysis = std::make_unique<BranchUpgradeAnalysis>(*branch);
        const auto& found = ret.analysis->problems();
        ret.problems.insert(ret.problems.end(), found.begin(), found.end());
    }

    for (const auto& problem : ret.problems) {
        if (problem.severity == Severity::Error || problem.severity == Severity::Fatal ||
            (problem.severity == Severity::Warning && config_.warnings_as_errors)) {
            ret.blocked = true;
            break;
        }
    }

    SCHEMAVER_LOG_INFO("planned version", {
        StringField("package", name),
        StringField("version", ret.version ? ret.version->str() : "-"),
        BoolField("upgrade", ret.is_upgrade()),
        IntField("problems", static_cast<std::int64_t>(ret.problems.size()))});
    if (ret.blocked) {
        SCHEMAVER_LOG_WARN("plan is blocked", {StringField("package", name)});
    }
    return ret;
}

} // namespace schemaver
