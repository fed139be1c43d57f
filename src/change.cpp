#include "schemaver/change.hpp"
#include <algorithm>
#include <cctype>
#include "schemaver/lib.hpp"

namespace schemaver {

namespace {

    std::string normalize(const std::string& s) {
        auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        std::string out = first < last ? std::string(first, last) : std::string();
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    bool contains(const std::vector<std::string>& values, const std::string& value) {
        return std::find(values.begin(), values.end(), value) != values.end();
    }

}

const char* kind_name(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Table:      return "table";
        case ObjectKind::View:       return "view";
        case ObjectKind::Column:     return "column";
        case ObjectKind::Constraint: return "constraint";
    }
    return "";
}

const char* kind_name(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Add:    return "add";
        case ChangeKind::Remove: return "remove";
        case ChangeKind::Rename: return "rename";
        case ChangeKind::Alter:  return "alter";
        case ChangeKind::Sql:    return "sql";
    }
    return "";
}

/* ---------- SQL snippets ---------- */

SqlString::SqlString(std::string sql_, std::string syntax_, std::vector<std::string> platforms_)
    : sql(std::move(sql_)), syntax(normalize(syntax_)) {
    if (sql.empty()) SCHEMAVER_THROW(ModelError, "sql snippet must not be empty");
    if (syntax.empty()) SCHEMAVER_THROW(ModelError, "sql syntax must not be empty");
    if (platforms_.empty()) SCHEMAVER_THROW(ModelError, "sql snippet must name at least one platform");
    for (const auto& p : platforms_) platforms.push_back(normalize(p));
}

SqlSet::SqlSet(std::vector<SqlString> snippets, std::vector<SqlArgument> arguments)
    : snippets_(std::move(snippets)), arguments_(std::move(arguments)) {
    if (snippets_.empty()) SCHEMAVER_THROW(ModelError, "sql set must hold at least one snippet");
}

std::vector<SqlArgument> SqlSet::simple_arguments() const {
    std::vector<SqlArgument> ret;
    for (const auto& arg : arguments_) {
        if (!arg.is_collection) ret.push_back(arg);
    }
    return ret;
}

std::vector<SqlArgument> SqlSet::collection_arguments() const {
    std::vector<SqlArgument> ret;
    for (const auto& arg : arguments_) {
        if (arg.is_collection) ret.push_back(arg);
    }
    return ret;
}

const SqlString* SqlSet::get_for_platform(const std::vector<std::string>& platforms) const {
    for (const auto& plat : platforms) {
        std::string wanted = normalize(plat);
        for (const auto& snippet : snippets_) {
            if (contains(snippet.platforms, wanted)) return &snippet;
        }
    }
    for (const auto& snippet : snippets_) {
        if (snippet.syntax == "universal" || contains(snippet.platforms, "any") || contains(snippet.platforms, "all")) {
            return &snippet;
        }
    }
    return nullptr;
}

/* ---------- Change ---------- */

Change::Change(const Order& order, ObjectKind target, std::variant<SchemaChange, SqlChange> detail,
               std::string comment, std::vector<std::string> affects)
    : order_(order)
    , target_(target)
    , detail_(std::move(detail))
    , comment_(std::move(comment))
    , affects_(std::move(affects)) {}

Change Change::schema_change(const Order& order, ObjectKind target, ChangeKind kind,
                             std::optional<std::string> previous_name,
                             std::string comment, std::vector<std::string> affects) {
    if (kind == ChangeKind::Sql) {
        SCHEMAVER_THROW(ModelError, "a sql change must be built with Change::sql_change");
    }
    bool needs_name = kind == ChangeKind::Remove || kind == ChangeKind::Rename;
    if (needs_name && !previous_name) {
        SCHEMAVER_THROW(ModelError, "%s change %s requires a previous name", kind_name(kind), order.str().c_str());
    }
    if (!needs_name && previous_name) {
        SCHEMAVER_THROW(ModelError, "%s change %s must not have a previous name", kind_name(kind), order.str().c_str());
    }
    if (previous_name && !contains(affects, *previous_name)) affects.push_back(*previous_name);

    return Change(order, target, SchemaChange {kind, std::move(previous_name)}, std::move(comment), std::move(affects));
}

Change Change::sql_change(const Order& order, ObjectKind target, SqlSet sql_set,
                          std::string comment, std::vector<std::string> affects) {
    return Change(order, target, SqlChange {std::move(sql_set)}, std::move(comment), std::move(affects));
}

ChangeKind Change::kind() const {
    if (const auto* sc = as_schema()) return sc->kind;
    return ChangeKind::Sql;
}

std::optional<std::string> Change::previous_name() const {
    if (const auto* sc = as_schema()) return sc->previous_name;
    return std::nullopt;
}

std::string Change::str() const {
    std::string ret = std::string(kind_name(kind())) + " " + kind_name(target_) + " change";
    if (auto prev = previous_name()) ret += " of " + *prev;
    return ret + " " + order_.str();
}

} // namespace schemaver
