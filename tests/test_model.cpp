#include <catch2/catch.hpp>
#include "fixtures.hpp"
#include "schemaver/lib.hpp"

using namespace schemaver;
using namespace fixtures;

TEST_CASE("Schema changes check the previous name") {
    REQUIRE_THROWS_AS(Change::schema_change(ord(0), ObjectKind::Table, ChangeKind::Remove), ModelError);
    REQUIRE_THROWS_AS(Change::schema_change(ord(0), ObjectKind::Table, ChangeKind::Rename), ModelError);
    REQUIRE_THROWS_AS(Change::schema_change(ord(0), ObjectKind::Table, ChangeKind::Add, std::string("x")), ModelError);
    REQUIRE_THROWS_AS(Change::schema_change(ord(0), ObjectKind::Table, ChangeKind::Alter, std::string("x")), ModelError);
    REQUIRE_THROWS_AS(Change::schema_change(ord(0), ObjectKind::Table, ChangeKind::Sql), ModelError);

    auto rename = rename_change(1, "old_name");
    REQUIRE(rename.kind() == ChangeKind::Rename);
    REQUIRE(rename.previous_name() == std::optional<std::string>("old_name"));
    REQUIRE(rename.affects() == std::vector<std::string> {"old_name"});
    REQUIRE_FALSE(rename.is_sql());
    REQUIRE(rename.str() == "rename table change of old_name (0, 0, 1)");
}

TEST_CASE("Sql changes are always of kind sql") {
    auto change = sql_change(3);
    REQUIRE(change.kind() == ChangeKind::Sql);
    REQUIRE(change.is_sql());
    REQUIRE(change.as_schema() == nullptr);
    REQUIRE_FALSE(change.previous_name());
}

TEST_CASE("Sql set picks the snippet for the platform") {
    SqlSet set({
        SqlString("select 1", " Universal ", {"all"}),
        SqlString("select 2", "mysql", {" MySQL "}),
        SqlString("select 3", "pg", {"postgres", "redshift"}),
    }, {{"id", "int", false}, {"ids", "int", true}});

    REQUIRE(set.get()[1].platforms == std::vector<std::string> {"mysql"});
    REQUIRE(set.get_for_platform({"postgres"})->sql == "select 3");
    REQUIRE(set.get_for_platform({"oracle", "MYSQL"})->sql == "select 2");
    REQUIRE(set.get_for_platform({"oracle"})->sql == "select 1");
    REQUIRE(set.simple_arguments().size() == 1);
    REQUIRE(set.collection_arguments()[0].name == "ids");

    SqlSet only_pg({SqlString("select 3", "pg", {"postgres"})});
    REQUIRE(only_pg.get_for_platform({"mysql"}) == nullptr);

    REQUIRE_THROWS_AS(SqlSet({}), ModelError);
    REQUIRE_THROWS_AS(SqlString("", "pg", {"postgres"}), ModelError);
    REQUIRE_THROWS_AS(SqlString("select 1", " ", {"postgres"}), ModelError);
}

TEST_CASE("Full names") {
    REQUIRE(create_full_name({"", "public", "orders"}) == "public.orders");
    REQUIRE(make_table("main", "", "orders", ord(0), {}).full_name == "main.orders");
    REQUIRE(make_view("", "", "orders_v", ord(0), std::nullopt, {}).full_name == "orders_v");

    auto pk = make_constraint("Primary Key", ord(0), {"id"}, "orders_pk");
    REQUIRE(pk.constraint_type == "primarykey");
    REQUIRE(pk.full_name == "orders_pk");

    auto unique = make_constraint("unique_index", ord(1), {"sku", "region"});
    REQUIRE(unique.full_name == "uniqueindex(sku,region)");

    REQUIRE_THROWS_AS(make_constraint("sometimes unique", ord(2), {"sku"}), ModelError);
}

TEST_CASE("Object helpers") {
    Table t = table("orders", 0, {column("id", 1), column("total", 2, {alter_change(3, ObjectKind::Column)})});
    t.constraints.push_back(make_constraint("not null", ord(4), {"id"}));
    ObjectRef ref = ref_of(t);

    REQUIRE(kind_of(ref) == ObjectKind::Table);
    REQUIRE(is_columnar(kind_of(ref)));
    REQUIRE(columns_of(ref)->size() == 2);
    REQUIRE(sub_schema(ref).size() == 3);
    REQUIRE(describe(ref) == "table orders");
    REQUIRE(info_of(ref).changes.empty());
    REQUIRE(has_any_changes(ref));

    Column plain = column("id", 0);
    REQUIRE(columns_of(ref_of(plain)) == nullptr);
    REQUIRE_FALSE(has_any_changes(ref_of(plain)));

    SchemaObject obj = t;
    REQUIRE(kind_of(obj) == ObjectKind::Table);
    REQUIRE(info_of(obj).full_name == "orders");
}
