#include <catch2/catch.hpp>
#include "fixtures.hpp"
#include "schemaver/branch_upgrade.hpp"
#include "schemaver/lib.hpp"

using namespace schemaver;
using namespace fixtures;

TEST_CASE("A base version is not an upgrade") {
    SchemaPackage pkg("orders");
    pkg.add(version("orders", {1}, {table("price", 0)}, {},
        {VersionProblem(Severity::Note, "no comment", "01_price.yaml")}));

    BranchUpgradeAnalysis analysis(pkg.at({1}));
    REQUIRE_FALSE(analysis.is_upgrade());
    REQUIRE(analysis.previous() == nullptr);
    REQUIRE(analysis.upgrade_set() == nullptr);
    REQUIRE(analysis.changes().empty());
    REQUIRE(analysis.problems().size() == 1);
    REQUIRE(analysis.problems()[0].severity == Severity::Note);
    REQUIRE_FALSE(analysis.has_errors());
}

TEST_CASE("An upgrade diffs the parent schema") {
    SchemaPackage pkg("orders");
    pkg.add(version("orders", {1}, {table("price", 0), table("legacy", 1)}, {},
        {VersionProblem(Severity::Warning, "odd name", "01_price.yaml", 3)}));

    int loads = 0;
    pkg.add([&loads](const SchemaVersionNumber& number) {
        ++loads;
        return version("orders", number,
            {table("product_price", 1, {}, {rename_change(2, "price")})},
            {remove_change(0, "legacy")});
    }, {2}, SchemaVersionNumber {1});

    BranchUpgradeAnalysis analysis(pkg.at({2}));
    REQUIRE(loads == 1);
    REQUIRE(analysis.is_upgrade());
    REQUIRE(analysis.previous()->version() == SchemaVersionNumber {1});
    REQUIRE(analysis.current().version() == SchemaVersionNumber {2});

    const auto& changes = analysis.changes();
    REQUIRE(changes.size() == 2);
    const auto* removal = std::get<const UpgradeAnalysis*>(changes[0]);
    REQUIRE(removal->action() == UpgradeAction::Remove);
    REQUIRE(removal->name() == "legacy");
    REQUIRE(std::get<const UpgradeAnalysis*>(changes[1])->action() == UpgradeAction::Rename);

    // only the parent parse problem
    REQUIRE(analysis.problems().size() == 1);
    REQUIRE(analysis.problems()[0].version == "1");
    REQUIRE(analysis.problems()[0].str() == "warning [1]: odd name ; 01_price.yaml @ line 3");
    REQUIRE_FALSE(analysis.has_errors());
}

TEST_CASE("Upgrade problems are collected with the version") {
    SchemaPackage pkg("orders");
    pkg.add(version("orders", {1}, {table("price", 0)}));
    pkg.add(version("orders", {2}, {table("price", 0, {}, {add_change(1), alter_change(2)})}, {},
        {VersionProblem(Severity::Error, "bad type", "02_price.yaml", 7, 4)}), SchemaVersionNumber {1});

    BranchUpgradeAnalysis analysis(pkg.at({2}));
    REQUIRE(analysis.has_errors());

    const auto& problems = analysis.problems();
    REQUIRE(problems.size() == 2);
    REQUIRE(problems[0].text == "bad type ; 02_price.yaml @ line 7, column 4");
    REQUIRE(problems[1].severity == Severity::Error);
    REQUIRE(problems[1].version == "2");
    REQUIRE(problems[1].text.find("cannot be done with an alter or sql change") != std::string::npos);
}

TEST_CASE("Dropped tables surface as warnings") {
    SchemaPackage pkg("orders");
    pkg.add(version("orders", {1}, {table("price", 0), table("old", 1)}));
    pkg.add(version("orders", {2}, {table("price", 0)}), SchemaVersionNumber {1});

    BranchUpgradeAnalysis analysis(pkg.at({2}));
    REQUIRE_FALSE(analysis.has_errors());
    REQUIRE(analysis.problems().size() == 2);
    for (const auto& problem : analysis.problems()) REQUIRE(problem.severity == Severity::Warning);
    REQUIRE(analysis.upgrade_set()->has_changes());
}
