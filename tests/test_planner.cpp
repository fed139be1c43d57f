#include <catch2/catch.hpp>
#include "fixtures.hpp"
#include "schemaver/lib.hpp"
#include "schemaver/planner.hpp"
#include "schemaver/visitor.hpp"

using namespace schemaver;
using namespace fixtures;

namespace {

bool has_text(const UpgradePlan& plan, const std::string& text) {
    for (const auto& p : plan.problems) {
        if (p.text == text) return true;
    }
    return false;
}

void add_price_versions(SchemaPackage& pkg) {
    pkg.add(version("orders", {2}, {table("price", 0, {column("id", 1), column("sku", 2, {add_change(3, ObjectKind::Column)})})},
        {sql_change(0, ObjectKind::Table, {"price"})}), SchemaVersionNumber {1});
    pkg.add(version("orders", {1}, {table("price", 0, {column("id", 1)})}));
}

// Records the stream it is walked over.
class RecordingVisitor : public UpgradeVisitor {
public:
    void visit(const UpgradeAnalysis& upgrade) override { seen.push_back("upgrade " + upgrade.name()); }
    void visit(const Change& change) override { seen.push_back(change.str()); }
    std::vector<std::string> seen;
};

}

TEST_CASE("Planner picks the newest version") {
    UpgradePlanner planner;
    add_price_versions(planner.package("orders"));
    REQUIRE(planner.has("orders"));

    UpgradePlan plan = planner.plan("orders");
    REQUIRE(plan.version == SchemaVersionNumber {2});
    REQUIRE(plan.is_upgrade());
    REQUIRE(plan.problems.empty());
    REQUIRE_FALSE(plan.blocked);

    RecordingVisitor visitor;
    visitor.walk(plan.analysis->changes());
    REQUIRE(visitor.seen == std::vector<std::string> {"upgrade price", "sql table change (0, 0, 0)"});
}

TEST_CASE("Planner plans a given version") {
    UpgradePlanner planner;
    add_price_versions(planner.package("orders"));

    UpgradePlan base = planner.plan("orders", SchemaVersionNumber {1});
    REQUIRE_FALSE(base.is_upgrade());
    REQUIRE_FALSE(base.blocked);

    UpgradePlan missing = planner.plan("orders", SchemaVersionNumber {7});
    REQUIRE(missing.analysis == nullptr);
    REQUIRE(has_text(missing, "could not find version '7' in package; available versions are '1', '2'"));
    REQUIRE(missing.blocked);
}

TEST_CASE("Planner reports package problems") {
    UpgradePlanner planner;

    UpgradePlan unknown = planner.plan("billing");
    REQUIRE(has_text(unknown, "no versions in package"));
    REQUIRE(unknown.blocked);
    REQUIRE_FALSE(planner.has("billing"));

    SchemaPackage& pkg = planner.package("orders");
    pkg.add(version("orders", {1}));
    pkg.add(version("orders", {3}), SchemaVersionNumber {2});
    UpgradePlan plan = planner.plan("orders");
    REQUIRE(plan.version == SchemaVersionNumber {1});
    REQUIRE(has_text(plan, "package references unknown version number 2"));
    REQUIRE(has_text(plan, "version 3 never attached to a registered parent"));
    REQUIRE(plan.blocked);
}

TEST_CASE("Branches waiting on each other are reported") {
    UpgradePlanner planner;
    SchemaPackage& pkg = planner.package("orders");
    pkg.add(version("orders", {1}));
    pkg.add(version("orders", {2}), SchemaVersionNumber {3});
    pkg.add(version("orders", {3}), SchemaVersionNumber {2});
    REQUIRE(pkg.unresolved_branch_versions().empty());

    UpgradePlan plan = planner.plan("orders");
    REQUIRE(plan.version == SchemaVersionNumber {1});
    REQUIRE(has_text(plan, "version 2 never attached to a registered parent"));
    REQUIRE(has_text(plan, "version 3 never attached to a registered parent"));
    REQUIRE(plan.blocked);
}

TEST_CASE("Warnings block only when asked") {
    for (bool as_errors : {false, true}) {
        PlanConfig config;
        config.warnings_as_errors = as_errors;
        UpgradePlanner planner(config);
        SchemaPackage& pkg = planner.package("orders");
        pkg.add(version("orders", {1}, {table("price", 0), table("old", 1)}));
        pkg.add(version("orders", {2}, {table("price", 0)}), SchemaVersionNumber {1});

        UpgradePlan plan = planner.plan("orders");
        REQUIRE(plan.problems.size() == 2);
        REQUIRE(plan.blocked == as_errors);
    }
}

TEST_CASE("Json report of an upgrade") {
    UpgradePlanner planner;
    add_price_versions(planner.package("orders"));
    UpgradePlan plan = planner.plan("orders");

    JsonPlanWriter writer({"postgres"});
    jdoc doc;
    REQUIRE(jhlp::parse_str(writer.write(plan, false), doc));

    REQUIRE(jhlp::get<std::string>(doc, "package") == "orders");
    REQUIRE(jhlp::get<std::string>(doc, "version") == "2");
    REQUIRE(jhlp::get<bool>(doc, "upgrade"));
    REQUIRE_FALSE(jhlp::get<bool>(doc, "blocked", true));
    REQUIRE(doc["problems"].Size() == 0);

    const jval& changes = doc["changes"];
    REQUIRE(changes.Size() == 2);
    REQUIRE(jhlp::get<std::string>(changes[0], "type") == "upgrade");
    REQUIRE(jhlp::get<std::string>(changes[0], "action") == "alter");
    REQUIRE(changes[0]["columns"].Size() == 1);
    REQUIRE(jhlp::get<std::string>(changes[0]["columns"][0], "name") == "sku");
    REQUIRE(jhlp::get<std::string>(changes[0]["columns"][0], "action") == "add");

    REQUIRE(jhlp::get<std::string>(changes[1], "type") == "change");
    REQUIRE(jhlp::get<std::string>(changes[1], "kind") == "sql");
    REQUIRE(jhlp::get<std::string>(changes[1], "sql") == "UPDATE t SET x = 1");
    REQUIRE(changes[1]["order"].Size() == 3);
}

TEST_CASE("Json report of a base version") {
    UpgradePlanner planner;
    SchemaPackage& pkg = planner.package("orders");
    Table items = table("items", 0);
    items.order = Order(0, 0, 0, {}, {"sku"});
    pkg.add(version("orders", {1}, {items, table("sku", 1)}));

    JsonPlanWriter writer;
    jdoc doc;
    REQUIRE(jhlp::parse_str(writer.write(planner.plan("orders")), doc));
    REQUIRE_FALSE(jhlp::get<bool>(doc, "upgrade", true));
    REQUIRE_FALSE(doc.HasMember("changes"));

    const jval& created = doc["creation_order"];
    REQUIRE(created.Size() == 2);
    REQUIRE(jhlp::get<std::string>(created[0], "name") == "sku");
    REQUIRE(jhlp::get<std::string>(created[1], "name") == "items");
}

TEST_CASE("Json report of a missing version") {
    UpgradePlanner planner;
    JsonPlanWriter writer;
    jdoc doc;
    REQUIRE(jhlp::parse_str(writer.write(planner.plan("orders")), doc));
    REQUIRE(doc["version"].IsNull());
    REQUIRE(jhlp::get<bool>(doc, "blocked"));
    REQUIRE(doc["problems"].Size() == 1);
    REQUIRE(jhlp::get<std::string>(doc["problems"][0], "text") == "no versions in package");
}
