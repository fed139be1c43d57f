#pragma once
#include <string>
#include <vector>
#include "jsonhlp.hpp"
#include "upgrade.hpp"

namespace schemaver {

struct UpgradePlan;

// Walks the ordered upgrade stream; code generators plug in here.
class UpgradeVisitor {
public:
    virtual ~UpgradeVisitor() = default;
    virtual void visit(const UpgradeAnalysis& upgrade) = 0;
    virtual void visit(const Change& change) = 0;

    void walk(const std::vector<UpgradeItem>& items);
};

/**
 * Renders a plan as a JSON report: the problems, then the ordered upgrades
 * for an upgrade, or the creation order for a base version. Raw SQL is
 * picked for the first matching platform.
 */
class JsonPlanWriter : public UpgradeVisitor {
public:
    explicit JsonPlanWriter(std::vector<std::string> platforms = {"any"});

    void visit(const UpgradeAnalysis& upgrade) override;
    void visit(const Change& change) override;

    std::string write(const UpgradePlan& plan, bool pretty = true);

private:
    jval change_val(const Change& change);
    jval sql_val(const SqlSet& sql_set);

    std::vector<std::string> platforms_;
    jdoc doc_;
    jval items_;
};

} // namespace schemaver
