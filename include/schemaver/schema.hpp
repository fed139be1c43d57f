#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "change.hpp"
#include "order.hpp"

namespace schemaver {

// Data shared by every schema object.
struct ObjectInfo {
    std::string name;
    std::string full_name;      // unique name, used to match objects across versions
    Order order;
    std::string comment;
    std::vector<Change> changes; // authored changes from the previous version
};

struct Constraint : ObjectInfo {
    std::string constraint_type; // normalized, one of constraint_types()
    std::vector<std::string> column_names;
    std::optional<SqlSet> sql;
};

struct Column : ObjectInfo {
    std::string value_type;
    std::optional<std::string> default_value;
    bool auto_increment = false;
    std::vector<Constraint> constraints;
};

struct Table : ObjectInfo {
    std::string catalog_name;
    std::string schema_name;
    std::string table_space;
    std::vector<Column> columns;
    std::vector<Constraint> constraints;
};

struct View : ObjectInfo {
    std::string catalog_name;
    std::string schema_name;
    bool replace_if_exists = false;
    std::optional<SqlSet> select_query;
    std::vector<Column> columns;
    std::vector<Constraint> constraints;
};

// Closed set of schema objects.
using SchemaObject = std::variant<Table, View, Column, Constraint>;

// Non-owning handle to any schema object.
using ObjectRef = std::variant<const Table*, const View*, const Column*, const Constraint*>;

/****************** builders */

Table make_table(const std::string& catalog, const std::string& schema, const std::string& name,
                 const Order& order, std::vector<Column> columns,
                 std::vector<Constraint> constraints = {}, std::vector<Change> changes = {});

View make_view(const std::string& catalog, const std::string& schema, const std::string& name,
               const Order& order, std::optional<SqlSet> select_query, std::vector<Column> columns,
               std::vector<Constraint> constraints = {}, std::vector<Change> changes = {});

Column make_column(const std::string& name, const Order& order, const std::string& value_type,
                   std::vector<Constraint> constraints = {}, std::vector<Change> changes = {});

// Throws ModelError for an unknown constraint type.
Constraint make_constraint(const std::string& constraint_type, const Order& order,
                           std::vector<std::string> column_names, const std::string& name = "",
                           std::vector<Change> changes = {});

/****************** helpers */

// Joins the non-empty parts with '.'
std::string create_full_name(const std::vector<std::string>& parts);

// Lower case, without blanks, '_' and '-'. Throws ModelError when unknown.
std::string normalize_constraint_type(const std::string& constraint_type);
const std::vector<std::string>& constraint_types();

inline ObjectRef ref_of(const Table& obj) { return &obj; }
inline ObjectRef ref_of(const View& obj) { return &obj; }
inline ObjectRef ref_of(const Column& obj) { return &obj; }
inline ObjectRef ref_of(const Constraint& obj) { return &obj; }
ObjectRef ref_of(const SchemaObject& obj);

template <class T>
std::vector<ObjectRef> refs_of(const std::vector<T>& objects) {
    std::vector<ObjectRef> ret;
    ret.reserve(objects.size());
    for (const auto& obj : objects) ret.push_back(ref_of(obj));
    return ret;
}

const ObjectInfo& info_of(const ObjectRef& ref);
const ObjectInfo& info_of(const SchemaObject& obj);
ObjectKind kind_of(const ObjectRef& ref);
ObjectKind kind_of(const SchemaObject& obj);

bool is_columnar(ObjectKind kind);

// nullptr unless a table or a view
const std::vector<Column>* columns_of(const ObjectRef& ref);
const std::vector<Constraint>& constraints_of(const ObjectRef& ref);

// Columns and constraints.
std::vector<ObjectRef> sub_schema(const ObjectRef& ref);

// Recursively looks into the sub schema for authored changes.
bool has_any_changes(const ObjectRef& ref);

// "table public.orders"
std::string describe(const ObjectRef& ref);

} // namespace schemaver
