#pragma once
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "change.hpp"
#include "schema.hpp"

namespace schemaver {

enum class Severity { Note, Warning, Error, Fatal };

const char* severity_name(Severity severity);

/**
 * A problem found while parsing a version, handed over by the external
 * parser. The position is either given as free text or built from the
 * line and column ("line 4, column 2").
 */
class VersionProblem {
public:
    VersionProblem(Severity severity, std::string message, std::string source_name,
                   std::optional<std::string> source_pos = std::nullopt);
    VersionProblem(Severity severity, std::string message, std::string source_name,
                   int source_line, std::optional<int> source_col = std::nullopt);

    Severity severity() const { return severity_; }
    const std::string& message() const { return message_; }
    const std::string& source_name() const { return source_name_; }
    const std::optional<std::string>& source_pos() const { return source_pos_; }

    // "file.yaml @ line 4, column 2", or just the file name
    std::string source_location() const;
    std::string str() const;

private:
    Severity severity_;
    std::string message_;
    std::string source_name_;
    std::optional<std::string> source_pos_;
};

/**
 * Dewey decimal version number: 1, 1.5, 2.0.1 ...
 *
 * Components are compared left to right. When one number is a prefix of the
 * other, the longer one sorts first: 1.2.3 < 1.2.
 */
class SchemaVersionNumber {
public:
    SchemaVersionNumber() = default;
    // Throws ModelError for a negative component.
    SchemaVersionNumber(std::initializer_list<int> decimals);
    explicit SchemaVersionNumber(std::vector<int> decimals);

    // "1.5", "v1_5", "2". Throws ModelError when not a version number.
    static SchemaVersionNumber parse(const std::string& text);

    const std::vector<int>& decimals() const { return decimals_; }
    std::size_t depth() const { return decimals_.size(); }
    int operator[](std::size_t idx) const { return decimals_.at(idx); }

    // 1.2 is the parent decimal of 1.2.5 and of 1.2.5.1
    bool is_parent_decimal_of(const SchemaVersionNumber& other) const;
    // 1.2.3 and 1.2.7 are siblings
    bool is_sibling_decimal_of(const SchemaVersionNumber& other) const;

    int compare(const SchemaVersionNumber& other) const;

    bool operator==(const SchemaVersionNumber& o) const { return decimals_ == o.decimals_; }
    bool operator!=(const SchemaVersionNumber& o) const { return decimals_ != o.decimals_; }
    bool operator<(const SchemaVersionNumber& o) const { return compare(o) < 0; }
    bool operator<=(const SchemaVersionNumber& o) const { return compare(o) <= 0; }
    bool operator>(const SchemaVersionNumber& o) const { return compare(o) > 0; }
    bool operator>=(const SchemaVersionNumber& o) const { return compare(o) >= 0; }

    std::string str() const;

private:
    std::vector<int> decimals_;
};

struct SchemaVersionNumberHash {
    std::size_t operator()(const SchemaVersionNumber& v) const noexcept;
};

/**
 * One fully parsed version of a package: the top level changes, the schema
 * objects (both sorted by their natural order) and the parse problems.
 */
class SchemaVersion {
public:
    // Throws ModelError when the package name is empty.
    SchemaVersion(std::string package, SchemaVersionNumber version,
                  std::vector<Change> top_changes, std::vector<SchemaObject> schema,
                  std::vector<VersionProblem> problems = {});

    const std::string& package() const { return package_; }
    const SchemaVersionNumber& version() const { return version_; }
    const std::vector<Change>& top_changes() const { return top_changes_; }
    const std::vector<SchemaObject>& schema() const { return schema_; }
    const std::vector<VersionProblem>& problems() const { return problems_; }

    /**
     * @brief Schema objects in creation order: the natural order, adjusted
     * by the before/after labels. Each object can be referenced by its full
     * name. Throws CyclicDependencyError.
     */
    std::vector<const SchemaObject*> creation_order() const;

private:
    std::string package_;
    SchemaVersionNumber version_;
    std::vector<Change> top_changes_;
    std::vector<SchemaObject> schema_;
    std::vector<VersionProblem> problems_;
};

using VersionLoader = std::function<std::shared_ptr<const SchemaVersion>(const SchemaVersionNumber&)>;

class SchemaPackage;

/**
 * A node of the version tree of one package. The payload is either given
 * up front or loaded on first access through the loader; the result is
 * cached. payload() is not safe to call concurrently on the same branch.
 */
class SchemaBranch {
public:
    SchemaBranch(std::string package, std::shared_ptr<const SchemaVersion> version);
    SchemaBranch(std::string package, SchemaVersionNumber number, VersionLoader loader);

    const std::string& package() const { return package_; }
    const SchemaVersionNumber& version() const { return number_; }
    SchemaBranch* parent() const { return parent_; }
    const std::vector<SchemaBranch*>& children() const { return children_; }

    bool is_loaded() const { return payload_ != nullptr; }

    // Throws ModelError when the loader returns nothing or another version.
    const SchemaVersion& payload();

private:
    friend class SchemaPackage;

    std::string package_;
    SchemaVersionNumber number_;
    VersionLoader loader_;
    std::shared_ptr<const SchemaVersion> payload_;
    SchemaBranch* parent_ = nullptr;
    std::vector<SchemaBranch*> children_;
};

/**
 * SchemaPackage
 *  - owns every branch of one package
 *  - a branch whose parent is not known yet is deferred, and attached as
 *    soon as that parent gets registered (which can attach its own waiting
 *    children in turn)
 */
class SchemaPackage {
public:
    explicit SchemaPackage(std::string name);

    SchemaPackage(const SchemaPackage&) = delete;
    SchemaPackage& operator=(const SchemaPackage&) = delete;

    const std::string& name() const { return name_; }

    // Throws AlreadyExists for a known (or deferred) version number and
    // ModelError for a version of another package or a self parent.
    // Returns false when the registration was deferred.
    bool add(std::shared_ptr<const SchemaVersion> version,
             std::optional<SchemaVersionNumber> parent = std::nullopt);
    bool add(VersionLoader loader, const SchemaVersionNumber& number,
             std::optional<SchemaVersionNumber> parent = std::nullopt);

    bool contains(const SchemaVersionNumber& number) const;
    SchemaBranch* find(const SchemaVersionNumber& number) const;
    // Throws NotFound.
    SchemaBranch& at(const SchemaVersionNumber& number) const;

    // attached branches, in registration order
    std::vector<SchemaBranch*> branches() const;
    std::vector<SchemaBranch*> roots() const;
    std::vector<SchemaVersionNumber> versions() const;
    std::size_t size() const { return order_.size(); }

    // nullptr when empty
    SchemaBranch* newest_version() const;

    // Parent versions referenced by a deferred branch but never registered.
    std::vector<SchemaVersionNumber> unresolved_branch_versions() const;
    // The deferred branches themselves.
    std::vector<SchemaVersionNumber> deferred_branch_versions() const;

private:
    bool insert(std::unique_ptr<SchemaBranch> branch, std::optional<SchemaVersionNumber> parent);
    SchemaBranch* attach(std::unique_ptr<SchemaBranch> branch, SchemaBranch* parent);

    std::string name_;
    std::unordered_map<SchemaVersionNumber, std::unique_ptr<SchemaBranch>, SchemaVersionNumberHash> branches_;
    std::vector<SchemaBranch*> order_;
    // missing parent -> branches waiting on it, in registration order
    std::map<SchemaVersionNumber, std::vector<std::unique_ptr<SchemaBranch>>> pending_;
};

} // namespace schemaver
