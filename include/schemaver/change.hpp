#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "order.hpp"

namespace schemaver {

enum class ObjectKind { Table, View, Column, Constraint };
enum class ChangeKind { Add, Remove, Rename, Alter, Sql };

const char* kind_name(ObjectKind kind);
const char* kind_name(ChangeKind kind);

// One SQL snippet, valid for a syntax and a list of platforms.
struct SqlString {
    SqlString(std::string sql, std::string syntax, std::vector<std::string> platforms);

    std::string sql;
    std::string syntax;                 // trimmed, lower case
    std::vector<std::string> platforms; // trimmed, lower case
};

struct SqlArgument {
    std::string name;
    std::string basic_type;
    bool is_collection = false;
};

// The SQL snippets of the different platforms, along with their arguments.
class SqlSet {
public:
    SqlSet(std::vector<SqlString> snippets, std::vector<SqlArgument> arguments = {});

    const std::vector<SqlString>& get() const { return snippets_; }
    const std::vector<SqlArgument>& arguments() const { return arguments_; }
    std::vector<SqlArgument> simple_arguments() const;
    std::vector<SqlArgument> collection_arguments() const;

    /**
     * @brief Picks the snippet for the first matching platform, in the order
     * given. Falls back to a "universal" syntax or an "any"/"all" platform.
     *
     * @return nullptr when nothing matches
     */
    const SqlString* get_for_platform(const std::vector<std::string>& platforms) const;

private:
    std::vector<SqlString> snippets_;
    std::vector<SqlArgument> arguments_;
};

struct SchemaChange {
    ChangeKind kind = ChangeKind::Alter;
    std::optional<std::string> previous_name; // only for remove and rename
};

struct SqlChange {
    SqlSet sql_set;
};

/**
 * An authored delta that moves an object from the previous version to the
 * current one. Either a plain schema change (add/remove/rename/alter) or an
 * explicit SQL change.
 */
class Change {
public:
    // Throws ModelError when previous_name is given for add/alter, is missing
    // for remove/rename, or when kind is Sql.
    static Change schema_change(const Order& order, ObjectKind target, ChangeKind kind,
                                std::optional<std::string> previous_name = std::nullopt,
                                std::string comment = "", std::vector<std::string> affects = {});

    static Change sql_change(const Order& order, ObjectKind target, SqlSet sql_set,
                             std::string comment = "", std::vector<std::string> affects = {});

    const Order& order() const { return order_; }
    ObjectKind target() const { return target_; }
    ChangeKind kind() const;
    const std::string& comment() const { return comment_; }
    const std::vector<std::string>& affects() const { return affects_; }

    bool is_sql() const { return std::holds_alternative<SqlChange>(detail_); }
    const SchemaChange* as_schema() const { return std::get_if<SchemaChange>(&detail_); }
    const SqlChange* as_sql() const { return std::get_if<SqlChange>(&detail_); }
    const std::variant<SchemaChange, SqlChange>& detail() const { return detail_; }

    // empty unless a remove or rename schema change
    std::optional<std::string> previous_name() const;

    std::string str() const;

private:
    Change(const Order& order, ObjectKind target, std::variant<SchemaChange, SqlChange> detail,
           std::string comment, std::vector<std::string> affects);

    Order order_;
    ObjectKind target_;
    std::variant<SchemaChange, SqlChange> detail_;
    std::string comment_;
    std::vector<std::string> affects_;
};

} // namespace schemaver
