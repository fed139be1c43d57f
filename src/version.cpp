#include "schemaver/version.hpp"
#include <algorithm>
#include <cctype>
#include <deque>
#include <set>
#include <sstream>
#include "schemaver/lib.hpp"
#include "schemaver/logging.hpp"

namespace schemaver {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Note:    return "note";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
        case Severity::Fatal:   return "fatal";
    }
    return "";
}

/* ---------- VersionProblem ---------- */

VersionProblem::VersionProblem(Severity severity, std::string message, std::string source_name,
                               std::optional<std::string> source_pos)
    : severity_(severity), message_(std::move(message)), source_name_(std::move(source_name)) {
    if (source_pos && !source_pos->empty()) source_pos_ = std::move(source_pos);
}

VersionProblem::VersionProblem(Severity severity, std::string message, std::string source_name,
                               int source_line, std::optional<int> source_col)
    : severity_(severity), message_(std::move(message)), source_name_(std::move(source_name)) {
    std::string pos = "line " + std::to_string(source_line);
    if (source_col) pos += ", column " + std::to_string(*source_col);
    source_pos_ = pos;
}

std::string VersionProblem::source_location() const {
    std::string ret = source_name_;
    if (source_pos_) ret += " @ " + *source_pos_;
    return ret;
}

std::string VersionProblem::str() const {
    return std::string(severity_name(severity_)) + ": " + message_ + " ; " + source_location();
}

/* ---------- SchemaVersionNumber ---------- */

SchemaVersionNumber::SchemaVersionNumber(std::initializer_list<int> decimals)
    : SchemaVersionNumber(std::vector<int>(decimals)) {}

SchemaVersionNumber::SchemaVersionNumber(std::vector<int> decimals) : decimals_(std::move(decimals)) {
    for (int d : decimals_) {
        if (d < 0) SCHEMAVER_THROW(ModelError, "version numbers must not be negative, found %d", d);
    }
}

SchemaVersionNumber SchemaVersionNumber::parse(const std::string& text) {
    std::size_t pos = 0;
    if (!text.empty() && (text[0] == 'v' || text[0] == 'V')) pos = 1;

    std::vector<int> decimals;
    std::string part;
    for (; pos <= text.size(); ++pos) {
        char c = pos < text.size() ? text[pos] : '.';
        if (std::isdigit(static_cast<unsigned char>(c))) {
            part += c;
            continue;
        }
        if ((c != '.' && c != '_') || part.empty() || part.size() > 9) {
            SCHEMAVER_THROW(ModelError, "invalid version number '%s'", text.c_str());
        }
        decimals.push_back(std::stoi(part));
        part.clear();
    }
    return SchemaVersionNumber(std::move(decimals));
}

bool SchemaVersionNumber::is_parent_decimal_of(const SchemaVersionNumber& other) const {
    if (other.depth() <= depth()) return false;
    return std::equal(decimals_.begin(), decimals_.end(), other.decimals_.begin());
}

bool SchemaVersionNumber::is_sibling_decimal_of(const SchemaVersionNumber& other) const {
    if (other.depth() != depth()) return false;
    for (std::size_t idx = 0; idx + 1 < depth(); ++idx) {
        if (decimals_[idx] != other.decimals_[idx]) return false;
    }
    return true;
}

int SchemaVersionNumber::compare(const SchemaVersionNumber& other) const {
    std::size_t common = std::min(depth(), other.depth());
    for (std::size_t idx = 0; idx < common; ++idx) {
        if (decimals_[idx] != other.decimals_[idx]) return decimals_[idx] < other.decimals_[idx] ? -1 : 1;
    }
    // same prefix: the one with more decimals comes first
    if (depth() == other.depth()) return 0;
    return depth() > other.depth() ? -1 : 1;
}

std::string SchemaVersionNumber::str() const {
    std::ostringstream out;
    for (std::size_t idx = 0; idx < decimals_.size(); ++idx) {
        if (idx > 0) out << '.';
        out << decimals_[idx];
    }
    return out.str();
}

std::size_t SchemaVersionNumberHash::operator()(const SchemaVersionNumber& v) const noexcept {
    std::size_t seed = v.depth();
    for (int d : v.decimals()) {
        seed ^= std::hash<int>()(d) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
}

/* ---------- SchemaVersion ---------- */

SchemaVersion::SchemaVersion(std::string package, SchemaVersionNumber version,
                             std::vector<Change> top_changes, std::vector<SchemaObject> schema,
                             std::vector<VersionProblem> problems)
    : package_(std::move(package))
    , version_(std::move(version))
    , top_changes_(std::move(top_changes))
    , schema_(std::move(schema))
    , problems_(std::move(problems)) {
    if (package_.empty()) SCHEMAVER_THROW(ModelError, "a schema version needs a package name");

    std::stable_sort(top_changes_.begin(), top_changes_.end(),
        [](const Change& a, const Change& b) { return a.order() < b.order(); });
    std::stable_sort(schema_.begin(), schema_.end(),
        [](const SchemaObject& a, const SchemaObject& b) { return info_of(a).order < info_of(b).order; });
}

std::vector<const SchemaObject*> SchemaVersion::creation_order() const {
    std::vector<const Order*> orders;
    Order::LabelMap labels;
    for (std::size_t idx = 0; idx < schema_.size(); ++idx) {
        const ObjectInfo& info = info_of(schema_[idx]);
        orders.push_back(&info.order);
        labels.emplace(info.full_name, idx);
    }

    std::vector<const SchemaObject*> ret;
    for (std::size_t idx : Order::sort_indices(orders, labels)) ret.push_back(&schema_[idx]);
    return ret;
}

/* ---------- SchemaBranch ---------- */

SchemaBranch::SchemaBranch(std::string package, std::shared_ptr<const SchemaVersion> version)
    : package_(std::move(package)), payload_(std::move(version)) {
    if (!payload_) SCHEMAVER_THROW(ModelError, "branch of package '%s' has no version", package_.c_str());
    number_ = payload_->version();
}

SchemaBranch::SchemaBranch(std::string package, SchemaVersionNumber number, VersionLoader loader)
    : package_(std::move(package)), number_(std::move(number)), loader_(std::move(loader)) {
    if (!loader_) {
        SCHEMAVER_THROW(ModelError, "branch %s of package '%s' has no loader", number_.str().c_str(), package_.c_str());
    }
}

const SchemaVersion& SchemaBranch::payload() {
    if (payload_) return *payload_;

    SCHEMAVER_LOG_DEBUG("loading branch", {StringField("package", package_), StringField("version", number_.str())});
    auto loaded = loader_(number_);
    if (!loaded) {
        SCHEMAVER_THROW(ModelError, "no version %s found for package '%s'", number_.str().c_str(), package_.c_str());
    }
    if (loaded->version() != number_ || loaded->package() != package_) {
        SCHEMAVER_THROW(ModelError, "loading %s %s returned %s %s", package_.c_str(), number_.str().c_str(),
            loaded->package().c_str(), loaded->version().str().c_str());
    }
    payload_ = std::move(loaded);
    return *payload_;
}

/* ---------- SchemaPackage ---------- */

SchemaPackage::SchemaPackage(std::string name) : name_(std::move(name)) {
    if (name_.empty()) SCHEMAVER_THROW(ModelError, "a package needs a name");
}

bool SchemaPackage::add(std::shared_ptr<const SchemaVersion> version, std::optional<SchemaVersionNumber> parent) {
    if (!version) SCHEMAVER_THROW(ModelError, "cannot add an empty version to package '%s'", name_.c_str());
    if (version->package() != name_) {
        SCHEMAVER_THROW(ModelError, "version %s belongs to package '%s', not '%s'",
            version->version().str().c_str(), version->package().c_str(), name_.c_str());
    }
    return insert(std::make_unique<SchemaBranch>(name_, std::move(version)), std::move(parent));
}

bool SchemaPackage::add(VersionLoader loader, const SchemaVersionNumber& number,
                        std::optional<SchemaVersionNumber> parent) {
    return insert(std::make_unique<SchemaBranch>(name_, number, std::move(loader)), std::move(parent));
}

bool SchemaPackage::insert(std::unique_ptr<SchemaBranch> branch, std::optional<SchemaVersionNumber> parent) {
    const SchemaVersionNumber number = branch->version();
    if (contains(number)) {
        SCHEMAVER_THROW(AlreadyExists, "package '%s' already has version %s", name_.c_str(), number.str().c_str());
    }
    for (const auto& v : deferred_branch_versions()) {
        if (v == number) {
            SCHEMAVER_THROW(AlreadyExists, "package '%s' already has version %s", name_.c_str(), number.str().c_str());
        }
    }
    if (parent && *parent == number) {
        SCHEMAVER_THROW(ModelError, "version %s cannot be its own parent", number.str().c_str());
    }

    SchemaBranch* parent_branch = nullptr;
    if (parent) {
        parent_branch = find(*parent);
        if (!parent_branch) {
            SCHEMAVER_LOG_DEBUG("deferring branch", {
                StringField("package", name_),
                StringField("version", number.str()),
                StringField("parent", parent->str())});
            pending_[*parent].push_back(std::move(branch));
            return false;
        }
    }
    attach(std::move(branch), parent_branch);

    // attach whatever was waiting on the new branch, then on those in turn
    std::deque<SchemaVersionNumber> worklist {number};
    while (!worklist.empty()) {
        SchemaVersionNumber ready = worklist.front();
        worklist.pop_front();
        auto it = pending_.find(ready);
        if (it == pending_.end()) continue;

        auto waiting = std::move(it->second);
        pending_.erase(it);
        SchemaBranch* now_parent = find(ready);
        for (auto& child : waiting) {
            SCHEMAVER_LOG_DEBUG("promoting deferred branch", {
                StringField("package", name_),
                StringField("version", child->version().str()),
                StringField("parent", ready.str())});
            worklist.push_back(attach(std::move(child), now_parent)->version());
        }
    }
    return true;
}

SchemaBranch* SchemaPackage::attach(std::unique_ptr<SchemaBranch> branch, SchemaBranch* parent) {
    SchemaBranch* ret = branch.get();
    ret->parent_ = parent;
    if (parent) parent->children_.push_back(ret);
    order_.push_back(ret);
    branches_.emplace(ret->version(), std::move(branch));
    return ret;
}

bool SchemaPackage::contains(const SchemaVersionNumber& number) const {
    return branches_.find(number) != branches_.end();
}

SchemaBranch* SchemaPackage::find(const SchemaVersionNumber& number) const {
    auto it = branches_.find(number);
    return it == branches_.end() ? nullptr : it->second.get();
}

SchemaBranch& SchemaPackage::at(const SchemaVersionNumber& number) const {
    SchemaBranch* ret = find(number);
    if (!ret) SCHEMAVER_THROW(NotFound, "package '%s' has no version %s", name_.c_str(), number.str().c_str());
    return *ret;
}

std::vector<SchemaBranch*> SchemaPackage::branches() const {
    return order_;
}

std::vector<SchemaBranch*> SchemaPackage::roots() const {
    std::vector<SchemaBranch*> ret;
    for (auto* b : order_) {
        if (!b->parent()) ret.push_back(b);
    }
    return ret;
}

std::vector<SchemaVersionNumber> SchemaPackage::versions() const {
    std::vector<SchemaVersionNumber> ret;
    for (auto* b : order_) ret.push_back(b->version());
    return ret;
}

SchemaBranch* SchemaPackage::newest_version() const {
    SchemaBranch* ret = nullptr;
    for (auto* b : order_) {
        if (!ret || ret->version() < b->version()) ret = b;
    }
    return ret;
}

std::vector<SchemaVersionNumber> SchemaPackage::unresolved_branch_versions() const {
    // a parent that is itself deferred is known, just not attached yet
    auto deferred = deferred_branch_versions();
    std::set<SchemaVersionNumber> known(deferred.begin(), deferred.end());

    std::vector<SchemaVersionNumber> ret;
    for (const auto& kv : pending_) {
        if (known.count(kv.first) == 0) ret.push_back(kv.first);
    }
    return ret;
}

std::vector<SchemaVersionNumber> SchemaPackage::deferred_branch_versions() const {
    std::vector<SchemaVersionNumber> ret;
    for (const auto& kv : pending_) {
        for (const auto& b : kv.second) ret.push_back(b->version());
    }
    return ret;
}

} // namespace schemaver
