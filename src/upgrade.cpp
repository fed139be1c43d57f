#include "schemaver/upgrade.hpp"
#include <unordered_map>
#include <unordered_set>
#include "schemaver/lib.hpp"

namespace schemaver {

namespace {

    std::size_t slot(ChangeKind kind) { return static_cast<std::size_t>(kind); }

    // Changes that belong to the object itself. The column changes declared
    // on a table or view are handled by the column diff.
    std::vector<const Change*> own_changes(const ObjectRef& ref) {
        bool columnar = is_columnar(kind_of(ref));
        std::vector<const Change*> ret;
        for (const auto& change : info_of(ref).changes) {
            if (columnar && change.target() == ObjectKind::Column) continue;
            ret.push_back(&change);
        }
        return ret;
    }

    std::vector<UpgradeSource> sources_of(const std::vector<ObjectRef>& refs) {
        return std::vector<UpgradeSource>(refs.begin(), refs.end());
    }

    void append(std::vector<UpgradeAnalysisProblem>& to, const std::vector<UpgradeAnalysisProblem>& from) {
        to.insert(to.end(), from.begin(), from.end());
    }

}

const char* action_name(UpgradeAction action) {
    switch (action) {
        case UpgradeAction::None:   return "none";
        case UpgradeAction::Add:    return "add";
        case UpgradeAction::Remove: return "remove";
        case UpgradeAction::Rename: return "rename";
        case UpgradeAction::Alter:  return "alter";
    }
    return "";
}

/* ---------- UpgradeAnalysis ---------- */

UpgradeAnalysis::UpgradeAnalysis(ObjectKind kind, std::optional<ObjectRef> before, UpgradeTarget after)
    : before_(std::move(before)), after_(std::move(after)) {
    if (!before_ && std::holds_alternative<std::monostate>(after_)) {
        SCHEMAVER_THROW(ModelError, "an upgrade needs a before or an after object");
    }
    if (const Change* const* marker = std::get_if<const Change*>(&after_)) {
        if (!*marker || (*marker)->kind() != ChangeKind::Remove || !before_) {
            SCHEMAVER_THROW(ModelError, "only a remove change of a known object can replace an object");
        }
    }

    std::vector<const Change*> changes;
    if (std::holds_alternative<std::monostate>(after_)) {
        add_warning(describe(*before_), "implicit removal of object");
    } else if (const Change* marker = remove_change()) {
        changes.push_back(marker);
    } else {
        changes = own_changes(*after_object());
    }
    for (const Change* change : changes) changes_[slot(change->kind())].push_back(change);

    std::vector<ObjectRef> before_constraints;
    std::vector<ObjectRef> after_constraints;
    if (before_) before_constraints = refs_of(constraints_of(*before_));
    if (after_object()) after_constraints = refs_of(constraints_of(*after_object()));
    constraint_changes_ = std::make_unique<SchemaUpgradedSet>(before_constraints, sources_of(after_constraints));
    if (before_ && after_object()) merge_problems(*constraint_changes_);

    // add, remove and rename replace the object: one of them, and alone
    std::size_t big_change_count = 0;
    for (ChangeKind cat : {ChangeKind::Add, ChangeKind::Remove, ChangeKind::Rename}) {
        std::size_t count = changes_[slot(cat)].size();
        big_change_count += count;
        if (count > 1) {
            add_error(subject(), std::string("at most 1 ") + kind_name(cat) + " is allowed");
        }
    }
    std::size_t partial_count = changes_[slot(ChangeKind::Alter)].size() + changes_[slot(ChangeKind::Sql)].size();
    if (big_change_count > 1 || (big_change_count > 0 && partial_count > 0)) {
        add_error(subject(), "at most 1 of an add, remove, or rename is allowed, "
                             "and it cannot be done with an alter or sql change");
    }

    if (!before_) {
        if (changes_[slot(ChangeKind::Add)].empty()) {
            add_warning(subject(), "implicit add");
        }
        if (!changes_[slot(ChangeKind::Remove)].empty() || !changes_[slot(ChangeKind::Rename)].empty() ||
            !changes_[slot(ChangeKind::Alter)].empty()) {
            add_error(subject(), "can only add due to no previous version found");
        }
    }

    if (before_ && after_object()) {
        ObjectKind before_kind = kind_of(*before_);
        if (before_kind != kind) {
            add_error(describe(*before_), std::string("cannot upgrade directly from a ") +
                kind_name(before_kind) + " to a " + kind_name(kind));
        }
    }
}

UpgradeAnalysis::~UpgradeAnalysis() = default;

const Change* UpgradeAnalysis::remove_change() const {
    const Change* const* marker = std::get_if<const Change*>(&after_);
    return marker ? *marker : nullptr;
}

const std::vector<const Change*>& UpgradeAnalysis::changes(ChangeKind kind) const {
    return changes_[slot(kind)];
}

std::vector<const Change*> UpgradeAnalysis::all_changes() const {
    std::vector<const Change*> ret;
    for (const auto& cat : changes_) ret.insert(ret.end(), cat.begin(), cat.end());
    return ret;
}

bool UpgradeAnalysis::has_changes() const {
    for (const auto& cat : changes_) {
        if (!cat.empty()) return true;
    }
    return constraint_changes_->has_changes();
}

const Order& UpgradeAnalysis::order() const {
    if (const ObjectRef* obj = after_object()) return info_of(*obj).order;
    if (const Change* marker = remove_change()) return marker->order();
    return info_of(*before_).order;
}

std::string UpgradeAnalysis::name() const {
    if (const ObjectRef* obj = after_object()) return info_of(*obj).full_name;
    return info_of(*before_).full_name;
}

UpgradeAction UpgradeAnalysis::action() const {
    if (!after_object()) return UpgradeAction::Remove;
    if (!before_) return UpgradeAction::Add;
    if (!changes(ChangeKind::Rename).empty()) return UpgradeAction::Rename;
    if (has_changes()) return UpgradeAction::Alter;
    return UpgradeAction::None;
}

std::string UpgradeAnalysis::subject() const {
    if (const ObjectRef* obj = after_object()) return describe(*obj);
    if (const Change* marker = remove_change()) return marker->str();
    return describe(*before_);
}

void UpgradeAnalysis::add_error(std::string subject, std::string message) {
    errors_.push_back({std::move(subject), std::move(message)});
}

void UpgradeAnalysis::add_warning(std::string subject, std::string message) {
    warnings_.push_back({std::move(subject), std::move(message)});
}

void UpgradeAnalysis::merge_problems(const SchemaUpgradedSet& nested) {
    append(errors_, nested.errors());
    append(warnings_, nested.warnings());
}

ColumnUpgradeAnalysis::ColumnUpgradeAnalysis(std::optional<ObjectRef> before, UpgradeTarget after)
    : UpgradeAnalysis(ObjectKind::Column, std::move(before), std::move(after)) {}

ConstraintUpgradeAnalysis::ConstraintUpgradeAnalysis(std::optional<ObjectRef> before, UpgradeTarget after)
    : UpgradeAnalysis(ObjectKind::Constraint, std::move(before), std::move(after)) {}

/* ---------- tables and views ---------- */

ColumnarUpgradeAnalysis::ColumnarUpgradeAnalysis(ObjectKind kind, std::optional<ObjectRef> before,
                                                 UpgradeTarget after)
    : UpgradeAnalysis(kind, std::move(before), std::move(after)) {
    const ObjectRef* current = after_object();
    if (!current) return;

    const auto* before_columns = this->before() ? columns_of(*this->before()) : nullptr;
    const auto* after_columns = columns_of(*current);
    if (!before_columns || !after_columns) {
        // no column diff to hand the column changes to
        for (const auto& change : info_of(*current).changes) {
            if (change.target() == ObjectKind::Column) add_error(change.str(), "invalid columnar change");
        }
        return;
    }

    std::vector<UpgradeSource> after_set = sources_of(refs_of(*after_columns));
    for (const auto& change : info_of(*current).changes) {
        if (change.target() == ObjectKind::Column) after_set.emplace_back(&change);
    }
    column_changes_ = std::make_unique<SchemaUpgradedSet>(refs_of(*before_columns), after_set);
    merge_problems(*column_changes_);

    // a column change with no column to go with can only be raw sql
    for (const Change* change : column_changes_->stand_alone_changes()) {
        if (!change->is_sql()) add_error(change->str(), "invalid columnar change");
    }
}

ColumnarUpgradeAnalysis::~ColumnarUpgradeAnalysis() = default;

bool ColumnarUpgradeAnalysis::has_changes() const {
    if (UpgradeAnalysis::has_changes()) return true;
    return column_changes_ && column_changes_->has_changes();
}

TableUpgradeAnalysis::TableUpgradeAnalysis(std::optional<ObjectRef> before, UpgradeTarget after)
    : ColumnarUpgradeAnalysis(ObjectKind::Table, std::move(before), std::move(after)) {}

ViewUpgradeAnalysis::ViewUpgradeAnalysis(std::optional<ObjectRef> before, UpgradeTarget after)
    : ColumnarUpgradeAnalysis(ObjectKind::View, std::move(before), std::move(after)) {}

/* ---------- SchemaUpgradedSet ---------- */

SchemaUpgradedSet::SchemaUpgradedSet(const std::vector<ObjectRef>& before, const std::vector<UpgradeSource>& after) {
    // before objects by full name; the first one wins
    std::vector<ObjectRef> index;
    std::unordered_map<std::string, std::size_t> by_name;
    std::vector<bool> claimed;
    for (const auto& ref : before) {
        const std::string& name = info_of(ref).full_name;
        if (by_name.count(name) > 0) {
            errors_.push_back({describe(ref), "duplicate name"});
            continue;
        }
        by_name.emplace(name, index.size());
        index.push_back(ref);
        claimed.push_back(false);
    }

    auto claim = [&](const std::string& name) -> std::optional<ObjectRef> {
        auto it = by_name.find(name);
        if (it == by_name.end()) return std::nullopt;
        std::size_t idx = it->second;
        by_name.erase(it);
        claimed[idx] = true;
        return index[idx];
    };

    std::unordered_set<std::string> after_names;
    for (const auto& source : after) {
        std::visit(overloaded {
            [&](const Change* change) {
                if (change->kind() != ChangeKind::Remove) {
                    // TODO: match on affects() once changes can target an object by name
                    stand_alone_.push_back(change);
                    return;
                }
                if (auto matched = claim(*change->previous_name())) {
                    upgrades_.push_back(create_upgrade(matched, change));
                } else {
                    errors_.push_back({change->str(), "remove change has no known previous object"});
                }
            },
            [&](const ObjectRef& obj) {
                std::string name = info_of(obj).full_name;
                if (!after_names.insert(name).second) {
                    errors_.push_back({describe(obj), "duplicate name"});
                    return;
                }
                for (const Change* change : own_changes(obj)) {
                    if (change->kind() == ChangeKind::Rename) {
                        name = *change->previous_name();
                        break;
                    }
                }
                upgrades_.push_back(create_upgrade(claim(name), obj));
            },
        }, source);
    }

    for (std::size_t idx = 0; idx < index.size(); ++idx) {
        if (claimed[idx]) continue;
        warnings_.push_back({describe(index[idx]), "no explicit removal for " + info_of(index[idx]).full_name});
        upgrades_.push_back(create_upgrade(index[idx], std::monostate {}));
    }

    for (const auto& upgrade : upgrades_) {
        append(errors_, upgrade->errors());
        append(warnings_, upgrade->warnings());
    }
}

SchemaUpgradedSet::~SchemaUpgradedSet() = default;

bool SchemaUpgradedSet::has_changes() const {
    if (!stand_alone_.empty()) return true;
    for (const auto& upgrade : upgrades_) {
        if (!upgrade->before() || !upgrade->after_object() || upgrade->has_changes()) return true;
    }
    return false;
}

std::vector<UpgradeItem> SchemaUpgradedSet::all_upgrades() const {
    std::vector<UpgradeItem> items;
    std::vector<const Order*> orders;
    Order::LabelMap labels;
    for (const Change* change : stand_alone_) {
        items.emplace_back(change);
        orders.push_back(&change->order());
    }
    for (const auto& upgrade : upgrades_) {
        labels.emplace(upgrade->name(), items.size());
        items.emplace_back(upgrade.get());
        orders.push_back(&upgrade->order());
    }

    std::vector<UpgradeItem> ret;
    ret.reserve(items.size());
    for (std::size_t idx : Order::sort_indices(orders, labels)) ret.push_back(items[idx]);
    return ret;
}

std::unique_ptr<UpgradeAnalysis> SchemaUpgradedSet::create_upgrade(std::optional<ObjectRef> before,
                                                                   UpgradeTarget after) {
    std::optional<ObjectRef> basis = before;
    if (const ObjectRef* obj = std::get_if<ObjectRef>(&after)) basis = *obj;
    if (!basis) SCHEMAVER_THROW(ModelError, "an upgrade needs a before or an after object");

    return std::visit(overloaded {
        [&](const Table*) -> std::unique_ptr<UpgradeAnalysis> {
            return std::make_unique<TableUpgradeAnalysis>(before, after);
        },
        [&](const View*) -> std::unique_ptr<UpgradeAnalysis> {
            return std::make_unique<ViewUpgradeAnalysis>(before, after);
        },
        [&](const Column*) -> std::unique_ptr<UpgradeAnalysis> {
            return std::make_unique<ColumnUpgradeAnalysis>(before, after);
        },
        [&](const Constraint*) -> std::unique_ptr<UpgradeAnalysis> {
            return std::make_unique<ConstraintUpgradeAnalysis>(before, after);
        },
    }, *basis);
}

} // namespace schemaver
