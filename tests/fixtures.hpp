#pragma once
#include <memory>
#include <string>
#include <vector>
#include "schemaver/schema.hpp"
#include "schemaver/upgrade.hpp"
#include "schemaver/version.hpp"

namespace fixtures {

using namespace schemaver;

inline Order ord(int seq, std::vector<std::string> before = {}, std::vector<std::string> after = {}) {
    return Order(0, 0, seq, before, after);
}

inline Change add_change(int seq, ObjectKind target = ObjectKind::Table) {
    return Change::schema_change(ord(seq), target, ChangeKind::Add);
}

inline Change alter_change(int seq, ObjectKind target = ObjectKind::Table) {
    return Change::schema_change(ord(seq), target, ChangeKind::Alter);
}

inline Change remove_change(int seq, const std::string& previous, ObjectKind target = ObjectKind::Table) {
    return Change::schema_change(ord(seq), target, ChangeKind::Remove, previous);
}

inline Change rename_change(int seq, const std::string& previous, ObjectKind target = ObjectKind::Table) {
    return Change::schema_change(ord(seq), target, ChangeKind::Rename, previous);
}

inline Change sql_change(int seq, ObjectKind target = ObjectKind::Table,
                         std::vector<std::string> after = {}) {
    return Change::sql_change(ord(seq, {}, after), target,
        SqlSet({SqlString("UPDATE t SET x = 1", "universal", {"all"})}));
}

inline Column column(const std::string& name, int seq, std::vector<Change> changes = {}) {
    return make_column(name, ord(seq), "int", {}, std::move(changes));
}

inline Table table(const std::string& name, int seq, std::vector<Column> columns = {},
                   std::vector<Change> changes = {}) {
    return make_table("", "", name, ord(seq), std::move(columns), {}, std::move(changes));
}

inline View view(const std::string& name, int seq, std::vector<Column> columns = {},
                 std::vector<Change> changes = {}) {
    return make_view("", "", name, ord(seq), std::nullopt, std::move(columns), {}, std::move(changes));
}

template <class T>
std::vector<UpgradeSource> sources(const std::vector<T>& objects) {
    std::vector<UpgradeSource> ret;
    for (const auto& obj : objects) ret.emplace_back(ref_of(obj));
    return ret;
}

inline bool has_problem(const std::vector<UpgradeAnalysisProblem>& problems, const std::string& message) {
    for (const auto& p : problems) {
        if (p.message == message) return true;
    }
    return false;
}

inline std::shared_ptr<const SchemaVersion> version(const std::string& package, SchemaVersionNumber number,
                                                    std::vector<SchemaObject> schema = {},
                                                    std::vector<Change> top = {},
                                                    std::vector<VersionProblem> problems = {}) {
    return std::make_shared<SchemaVersion>(package, std::move(number), std::move(top), std::move(schema),
                                           std::move(problems));
}

} // namespace fixtures
