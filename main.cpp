#include <iostream>
#include <memory>
#include "schemaver/config.hpp"
#include "schemaver/lib.hpp"
#include "schemaver/logging.hpp"
#include "schemaver/planner.hpp"
#include "schemaver/visitor.hpp"

using namespace schemaver;

namespace {

const char* PACKAGE = "orders";

std::vector<Column> price_columns(int file, bool with_currency) {
    std::vector<Column> cols {
        make_column("Price_Id", Order(file, 1, 0), "int",
            {make_constraint("primary key", Order(file, 1, 1), {"Price_Id"}, "Price__Price_Id__Key")}),
        make_column("Product_Sku", Order(file, 2, 0), "nvarchar(255)",
            {make_constraint("not null", Order(file, 2, 1), {"Product_Sku"}),
             make_constraint("unique index", Order(file, 2, 2), {"Product_Sku"}, "Price__Product_Sku__Idx")}),
        make_column("Price", Order(file, 3, 0), "float",
            {make_constraint("not null", Order(file, 3, 1), {"Price"})}),
    };
    cols[0].auto_increment = true;
    if (with_currency) {
        cols.push_back(make_column("Currency", Order(file, 4, 0), "char(3)", {}));
        cols.back().default_value = "USD";
    }
    return cols;
}

SqlSet price_view_query(const std::string& table) {
    return SqlSet({SqlString("SELECT Product_Sku, Price, Currency FROM " + table, "universal", {"all"})});
}

// 1: the price table
std::shared_ptr<const SchemaVersion> version_1() {
    std::vector<SchemaObject> schema {make_table("", "", "PRICE", Order(0, 0, 0), price_columns(0, false))};
    return std::make_shared<SchemaVersion>(PACKAGE, SchemaVersionNumber {1}, std::vector<Change>(), std::move(schema));
}

// 2: a currency column, and a view over the prices
std::shared_ptr<const SchemaVersion> version_2() {
    auto cols = price_columns(0, true);
    cols.back().changes.push_back(Change::schema_change(Order(0, 4, 1), ObjectKind::Column, ChangeKind::Add));

    std::vector<SchemaObject> schema {
        make_table("", "", "PRICE", Order(0, 0, 0), std::move(cols)),
        make_view("", "", "PRICE_VIEW", Order(1, 0, 0, {}, {"PRICE"}), price_view_query("PRICE"),
            {make_column("Product_Sku", Order(1, 1, 0), "nvarchar(255)"),
             make_column("Price", Order(1, 2, 0), "float"),
             make_column("Currency", Order(1, 3, 0), "char(3)")},
            {}, {Change::schema_change(Order(1, 0, 1), ObjectKind::View, ChangeKind::Add)}),
    };
    return std::make_shared<SchemaVersion>(PACKAGE, SchemaVersionNumber {2}, std::vector<Change>(), std::move(schema));
}

// 3: the price table is renamed; the view follows, and old rows get a currency
std::shared_ptr<const SchemaVersion> version_3() {
    std::vector<Change> top {
        Change::sql_change(Order(0, 0, 0, {}, {"PRODUCT_PRICE"}), ObjectKind::Table,
            SqlSet({SqlString("UPDATE PRODUCT_PRICE SET Currency = 'USD' WHERE Currency IS NULL", "universal", {"all"}),
                    SqlString("UPDATE `PRODUCT_PRICE` SET `Currency` = 'USD' WHERE `Currency` IS NULL", "mysql", {"mysql"})}),
            "backfill the currency", {"PRODUCT_PRICE"}),
    };
    std::vector<SchemaObject> schema {
        make_table("", "", "PRODUCT_PRICE", Order(1, 0, 0), price_columns(1, true), {},
            {Change::schema_change(Order(1, 0, 1), ObjectKind::Table, ChangeKind::Rename, std::string("PRICE"))}),
        make_view("", "", "PRICE_VIEW", Order(2, 0, 0, {}, {"PRODUCT_PRICE"}), price_view_query("PRODUCT_PRICE"),
            {make_column("Product_Sku", Order(2, 1, 0), "nvarchar(255)"),
             make_column("Price", Order(2, 2, 0), "float"),
             make_column("Currency", Order(2, 3, 0), "char(3)")},
            {}, {Change::schema_change(Order(2, 0, 1), ObjectKind::View, ChangeKind::Alter)}),
    };
    return std::make_shared<SchemaVersion>(PACKAGE, SchemaVersionNumber {3}, std::move(top), std::move(schema));
}

} // namespace

int main(int argc, char** argv)
{
    PlanConfig config;
    if (argc > 1 && !PlanConfig::load_file(argv[1], config)) {
        std::cerr << "Failed to load config " << argv[1] << std::endl;
        return 1;
    }
    init_logging(config);

    try {
        UpgradePlanner planner(config);
        SchemaPackage& pkg = planner.package(PACKAGE);

        // out of order on purpose: 3 waits for 2, which waits for 1
        pkg.add([](const SchemaVersionNumber&) { return version_3(); }, SchemaVersionNumber {3}, SchemaVersionNumber {2});
        pkg.add(version_2(), SchemaVersionNumber {1});
        pkg.add(version_1());

        UpgradePlan plan = planner.plan(PACKAGE);
        JsonPlanWriter writer(config.platforms);
        std::cout << writer.write(plan) << std::endl;

        shutdown_logging();
        return plan.blocked ? 1 : 0;
    } catch (const Error& e) {
        SCHEMAVER_LOG_ERROR("planning failed", {StringField("error", e.what())});
        shutdown_logging();
        return 2;
    }
}
