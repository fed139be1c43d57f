#include "schemaver/schema.hpp"
#include <algorithm>
#include <cctype>
#include "schemaver/lib.hpp"

namespace schemaver {

namespace {

    template <class T>
    void fill_info(T& obj, const std::string& name, const std::string& full_name, const Order& order,
                   std::vector<Change> changes) {
        obj.name = name;
        obj.full_name = full_name;
        obj.order = order;
        obj.changes = std::move(changes);
    }

}

const std::vector<std::string>& constraint_types() {
    static const std::vector<std::string> types = {
        "key", "primarykey", "fulltextkey", "uniquekey", "spatialkey", "foreignkey",
        "uniqueindex", "index", "primaryindex", "fulltextindex", "spatialindex",
        "codeindex",      // recognized by the code, not the schema
        "codeforeignkey", // recognized by the code, not the schema
        "initialvalue", "noupdate", "notread", "constantquery",
        "constantupdate", "updatevalue",
        "restrictquery", "notnull", "nullable",
        "validatewrite", "validate",
        "valuerestriction", "createrestriction", "updaterestriction",
        "updaterequired", "requiredupdate",
        "removed", // placeholder; the constraint was dropped in the upgrade
    };
    return types;
}

std::string normalize_constraint_type(const std::string& constraint_type) {
    std::string key;
    for (char c : constraint_type) {
        if (c == ' ' || c == '\r' || c == '\n' || c == '\t' || c == '_' || c == '-') continue;
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    const auto& types = constraint_types();
    if (std::find(types.begin(), types.end(), key) == types.end()) {
        SCHEMAVER_THROW(ModelError, "invalid constraint type '%s'", constraint_type.c_str());
    }
    return key;
}

std::string create_full_name(const std::vector<std::string>& parts) {
    std::string ret;
    for (const auto& part : parts) {
        if (part.empty()) continue;
        if (!ret.empty()) ret += ".";
        ret += part;
    }
    return ret;
}

Table make_table(const std::string& catalog, const std::string& schema, const std::string& name,
                 const Order& order, std::vector<Column> columns,
                 std::vector<Constraint> constraints, std::vector<Change> changes) {
    Table t;
    fill_info(t, name, create_full_name({catalog, schema, name}), order, std::move(changes));
    t.catalog_name = catalog;
    t.schema_name = schema;
    t.columns = std::move(columns);
    t.constraints = std::move(constraints);
    return t;
}

View make_view(const std::string& catalog, const std::string& schema, const std::string& name,
               const Order& order, std::optional<SqlSet> select_query, std::vector<Column> columns,
               std::vector<Constraint> constraints, std::vector<Change> changes) {
    View v;
    fill_info(v, name, create_full_name({catalog, schema, name}), order, std::move(changes));
    v.catalog_name = catalog;
    v.schema_name = schema;
    v.select_query = std::move(select_query);
    v.columns = std::move(columns);
    v.constraints = std::move(constraints);
    return v;
}

Column make_column(const std::string& name, const Order& order, const std::string& value_type,
                   std::vector<Constraint> constraints, std::vector<Change> changes) {
    Column c;
    fill_info(c, name, name, order, std::move(changes));
    c.value_type = value_type;
    c.constraints = std::move(constraints);
    return c;
}

Constraint make_constraint(const std::string& constraint_type, const Order& order,
                           std::vector<std::string> column_names, const std::string& name,
                           std::vector<Change> changes) {
    Constraint c;
    c.constraint_type = normalize_constraint_type(constraint_type);
    c.column_names = std::move(column_names);

    // unnamed constraints are known by their type and columns: "uniquekey(email)"
    std::string full_name = name;
    if (full_name.empty()) {
        full_name = c.constraint_type + "(";
        for (std::size_t i = 0; i < c.column_names.size(); ++i) {
            if (i > 0) full_name += ",";
            full_name += c.column_names[i];
        }
        full_name += ")";
    }
    fill_info(c, name.empty() ? c.constraint_type : name, full_name, order, std::move(changes));
    return c;
}

ObjectRef ref_of(const SchemaObject& obj) {
    return std::visit([](const auto& o) -> ObjectRef { return &o; }, obj);
}

const ObjectInfo& info_of(const ObjectRef& ref) {
    return std::visit([](const auto* o) -> const ObjectInfo& { return *o; }, ref);
}

const ObjectInfo& info_of(const SchemaObject& obj) {
    return std::visit([](const auto& o) -> const ObjectInfo& { return o; }, obj);
}

ObjectKind kind_of(const ObjectRef& ref) {
    return std::visit(overloaded {
        [](const Table*) { return ObjectKind::Table; },
        [](const View*) { return ObjectKind::View; },
        [](const Column*) { return ObjectKind::Column; },
        [](const Constraint*) { return ObjectKind::Constraint; },
    }, ref);
}

ObjectKind kind_of(const SchemaObject& obj) {
    return kind_of(ref_of(obj));
}

bool is_columnar(ObjectKind kind) {
    return kind == ObjectKind::Table || kind == ObjectKind::View;
}

const std::vector<Column>* columns_of(const ObjectRef& ref) {
    return std::visit(overloaded {
        [](const Table* t) -> const std::vector<Column>* { return &t->columns; },
        [](const View* v) -> const std::vector<Column>* { return &v->columns; },
        [](const Column*) -> const std::vector<Column>* { return nullptr; },
        [](const Constraint*) -> const std::vector<Column>* { return nullptr; },
    }, ref);
}

const std::vector<Constraint>& constraints_of(const ObjectRef& ref) {
    static const std::vector<Constraint> none;
    return std::visit(overloaded {
        [](const Table* t) -> const std::vector<Constraint>& { return t->constraints; },
        [](const View* v) -> const std::vector<Constraint>& { return v->constraints; },
        [](const Column* c) -> const std::vector<Constraint>& { return c->constraints; },
        [](const Constraint*) -> const std::vector<Constraint>& { return none; },
    }, ref);
}

std::vector<ObjectRef> sub_schema(const ObjectRef& ref) {
    std::vector<ObjectRef> ret;
    if (const auto* cols = columns_of(ref)) ret = refs_of(*cols);
    for (const auto& c : constraints_of(ref)) ret.push_back(ref_of(c));
    return ret;
}

bool has_any_changes(const ObjectRef& ref) {
    if (!info_of(ref).changes.empty()) return true;
    for (const auto& sub : sub_schema(ref)) {
        if (has_any_changes(sub)) return true;
    }
    return false;
}

std::string describe(const ObjectRef& ref) {
    return std::string(kind_name(kind_of(ref))) + " " + info_of(ref).full_name;
}

} // namespace schemaver
