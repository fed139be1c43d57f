#pragma once
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "change.hpp"
#include "schema.hpp"

namespace schemaver {

class SchemaUpgradedSet;
class UpgradeAnalysis;

// A problem in the upgrade definition. Never fatal.
struct UpgradeAnalysisProblem {
    std::string subject; // what the problem is about: "table orders", "remove table (0, 0, 1)"
    std::string message;

    std::string str() const { return message + ": " + subject; }
};

// Element of the "after" side of a diff: a schema object or an authored change.
using UpgradeSource = std::variant<ObjectRef, const Change*>;

// The after side of one analysis: absent, the object, or a remove change.
using UpgradeTarget = std::variant<std::monostate, ObjectRef, const Change*>;

// One unit of the ordered upgrade stream.
using UpgradeItem = std::variant<const UpgradeAnalysis*, const Change*>;

// What the generator has to do for one analysis.
enum class UpgradeAction { None, Add, Remove, Rename, Alter };

const char* action_name(UpgradeAction action);

/**
 * The diff of one object between the previous and the current version.
 * The concrete analysis follows the "after" object when there is one, the
 * "before" object otherwise. before and after are never both absent.
 *
 * Problems are collected, never thrown:
 *  - only one add, remove or rename, and not together with alter or sql
 *  - without a previous object only an add is allowed
 *  - the object kind cannot change in place
 */
class UpgradeAnalysis {
public:
    virtual ~UpgradeAnalysis();

    UpgradeAnalysis(const UpgradeAnalysis&) = delete;
    UpgradeAnalysis& operator=(const UpgradeAnalysis&) = delete;

    virtual ObjectKind kind() const = 0;

    const std::optional<ObjectRef>& before() const { return before_; }
    const UpgradeTarget& after() const { return after_; }
    // nullptr unless after is a schema object
    const ObjectRef* after_object() const { return std::get_if<ObjectRef>(&after_); }
    // nullptr unless after is a remove change
    const Change* remove_change() const;

    // authored changes of the object itself, by kind
    const std::vector<const Change*>& changes(ChangeKind kind) const;
    std::vector<const Change*> all_changes() const;

    const std::vector<UpgradeAnalysisProblem>& errors() const { return errors_; }
    const std::vector<UpgradeAnalysisProblem>& warnings() const { return warnings_; }
    // changes that could break the software side; nothing is flagged yet
    const std::vector<const Change*>& incompatible() const { return incompatible_; }

    const SchemaUpgradedSet& constraint_changes() const { return *constraint_changes_; }
    // nullptr unless a table or view with both sides present
    virtual const SchemaUpgradedSet* column_changes() const { return nullptr; }

    virtual bool has_changes() const;

    // the after order, or the before order when after is absent
    const Order& order() const;
    std::string name() const;
    UpgradeAction action() const;

protected:
    UpgradeAnalysis(ObjectKind kind, std::optional<ObjectRef> before, UpgradeTarget after);

    std::string subject() const;
    void add_error(std::string subject, std::string message);
    void add_warning(std::string subject, std::string message);
    void merge_problems(const SchemaUpgradedSet& nested);

    std::vector<UpgradeAnalysisProblem> errors_;
    std::vector<UpgradeAnalysisProblem> warnings_;

private:
    std::optional<ObjectRef> before_;
    UpgradeTarget after_;
    std::array<std::vector<const Change*>, 5> changes_;
    std::vector<const Change*> incompatible_;
    std::unique_ptr<SchemaUpgradedSet> constraint_changes_;
};

class ColumnUpgradeAnalysis : public UpgradeAnalysis {
public:
    ColumnUpgradeAnalysis(std::optional<ObjectRef> before, UpgradeTarget after);
    ObjectKind kind() const override { return ObjectKind::Column; }
};

class ConstraintUpgradeAnalysis : public UpgradeAnalysis {
public:
    ConstraintUpgradeAnalysis(std::optional<ObjectRef> before, UpgradeTarget after);
    ObjectKind kind() const override { return ObjectKind::Constraint; }
};

/**
 * Tables and views also diff their columns: the previous columns against
 * the current ones plus the column changes declared on the object. Only a
 * raw SQL change may stand alone there.
 */
class ColumnarUpgradeAnalysis : public UpgradeAnalysis {
public:
    ~ColumnarUpgradeAnalysis() override;

    const SchemaUpgradedSet* column_changes() const override { return column_changes_.get(); }
    bool has_changes() const override;

protected:
    ColumnarUpgradeAnalysis(ObjectKind kind, std::optional<ObjectRef> before, UpgradeTarget after);

private:
    std::unique_ptr<SchemaUpgradedSet> column_changes_;
};

class TableUpgradeAnalysis : public ColumnarUpgradeAnalysis {
public:
    TableUpgradeAnalysis(std::optional<ObjectRef> before, UpgradeTarget after);
    ObjectKind kind() const override { return ObjectKind::Table; }
};

class ViewUpgradeAnalysis : public ColumnarUpgradeAnalysis {
public:
    ViewUpgradeAnalysis(std::optional<ObjectRef> before, UpgradeTarget after);
    ObjectKind kind() const override { return ObjectKind::View; }
};

/**
 * SchemaUpgradedSet
 *  - matches the previous objects with the current list by full name (or by
 *    the previous name of a rename)
 *  - a remove change pairs with the previous object it names
 *  - any other change stands alone
 *  - a previous object nobody claimed is removed, with a warning
 *
 * The problems of every analysis are rolled up into the set.
 */
class SchemaUpgradedSet {
public:
    SchemaUpgradedSet(const std::vector<ObjectRef>& before, const std::vector<UpgradeSource>& after);
    ~SchemaUpgradedSet();

    SchemaUpgradedSet(const SchemaUpgradedSet&) = delete;
    SchemaUpgradedSet& operator=(const SchemaUpgradedSet&) = delete;

    const std::vector<std::unique_ptr<UpgradeAnalysis>>& upgrades() const { return upgrades_; }
    const std::vector<const Change*>& stand_alone_changes() const { return stand_alone_; }
    const std::vector<UpgradeAnalysisProblem>& errors() const { return errors_; }
    const std::vector<UpgradeAnalysisProblem>& warnings() const { return warnings_; }

    bool has_changes() const;

    /**
     * @brief The stand-alone changes and the upgrades, in upgrade order.
     * An upgrade can be referenced by its full name in before/after labels.
     * Throws CyclicDependencyError.
     */
    std::vector<UpgradeItem> all_upgrades() const;

    // Picks the analysis for the kind of the after object, or of the before
    // object when there is no after object.
    static std::unique_ptr<UpgradeAnalysis> create_upgrade(std::optional<ObjectRef> before, UpgradeTarget after);

private:
    std::vector<std::unique_ptr<UpgradeAnalysis>> upgrades_;
    std::vector<const Change*> stand_alone_;
    std::vector<UpgradeAnalysisProblem> errors_;
    std::vector<UpgradeAnalysisProblem> warnings_;
};

} // namespace schemaver
