#include "schemaver/visitor.hpp"
#include "schemaver/lib.hpp"
#include "schemaver/planner.hpp"

namespace schemaver {

namespace {

    jval order_val(const Order& order, jdaloc& a) {
        jval ret(rapidjson::kArrayType);
        for (int item : order.items()) ret.PushBack(item, a);
        return ret;
    }

}

void UpgradeVisitor::walk(const std::vector<UpgradeItem>& items) {
    for (const auto& item : items) {
        std::visit(overloaded {
            [this](const UpgradeAnalysis* upgrade) { visit(*upgrade); },
            [this](const Change* change) { visit(*change); },
        }, item);
    }
}

JsonPlanWriter::JsonPlanWriter(std::vector<std::string> platforms)
    : platforms_(std::move(platforms)), items_(rapidjson::kArrayType) {}

jval JsonPlanWriter::sql_val(const SqlSet& sql_set) {
    const SqlString* snippet = sql_set.get_for_platform(platforms_);
    if (!snippet) return jval(rapidjson::kNullType);
    return jhlp::str_val(snippet->sql, doc_.GetAllocator());
}

jval JsonPlanWriter::change_val(const Change& change) {
    auto& a = doc_.GetAllocator();
    jval ret(rapidjson::kObjectType);
    ret.AddMember("kind", jhlp::str_val(kind_name(change.kind()), a), a);
    ret.AddMember("target", jhlp::str_val(kind_name(change.target()), a), a);
    ret.AddMember("order", order_val(change.order(), a), a);
    if (auto prev = change.previous_name()) ret.AddMember("previous_name", jhlp::str_val(*prev, a), a);
    if (!change.comment().empty()) ret.AddMember("comment", jhlp::str_val(change.comment(), a), a);
    if (const SqlChange* sql = change.as_sql()) ret.AddMember("sql", sql_val(sql->sql_set), a);
    return ret;
}

void JsonPlanWriter::visit(const Change& change) {
    auto& a = doc_.GetAllocator();
    jval item = change_val(change);
    item.AddMember("type", "change", a);
    items_.PushBack(item, a);
}

void JsonPlanWriter::visit(const UpgradeAnalysis& upgrade) {
    auto& a = doc_.GetAllocator();
    jval item(rapidjson::kObjectType);
    item.AddMember("type", "upgrade", a);
    item.AddMember("object", jhlp::str_val(kind_name(upgrade.kind()), a), a);
    item.AddMember("name", jhlp::str_val(upgrade.name(), a), a);
    if (upgrade.before() && info_of(*upgrade.before()).full_name != upgrade.name()) {
        item.AddMember("previous_name", jhlp::str_val(info_of(*upgrade.before()).full_name, a), a);
    }
    item.AddMember("action", jhlp::str_val(action_name(upgrade.action()), a), a);
    item.AddMember("order", order_val(upgrade.order(), a), a);

    jval changes(rapidjson::kArrayType);
    for (const Change* change : upgrade.all_changes()) changes.PushBack(change_val(*change), a);
    item.AddMember("changes", changes, a);

    if (const SchemaUpgradedSet* columns = upgrade.column_changes()) {
        jval cols(rapidjson::kArrayType);
        for (const auto& column : columns->upgrades()) {
            if (column->action() == UpgradeAction::None) continue;
            jval col(rapidjson::kObjectType);
            col.AddMember("name", jhlp::str_val(column->name(), a), a);
            col.AddMember("action", jhlp::str_val(action_name(column->action()), a), a);
            cols.PushBack(col, a);
        }
        for (const Change* change : columns->stand_alone_changes()) cols.PushBack(change_val(*change), a);
        item.AddMember("columns", cols, a);
    }
    items_.PushBack(item, a);
}

std::string JsonPlanWriter::write(const UpgradePlan& plan, bool pretty) {
    doc_.SetObject();
    auto& a = doc_.GetAllocator();
    items_.SetArray();

    doc_.AddMember("package", jhlp::str_val(plan.package, a), a);
    if (plan.version) {
        doc_.AddMember("version", jhlp::str_val(plan.version->str(), a), a);
    } else {
        doc_.AddMember("version", jval(rapidjson::kNullType), a);
    }
    doc_.AddMember("upgrade", plan.is_upgrade(), a);
    doc_.AddMember("blocked", plan.blocked, a);

    jval problems(rapidjson::kArrayType);
    for (const auto& problem : plan.problems) {
        jval p(rapidjson::kObjectType);
        p.AddMember("severity", jhlp::str_val(severity_name(problem.severity), a), a);
        p.AddMember("version", jhlp::str_val(problem.version, a), a);
        p.AddMember("text", jhlp::str_val(problem.text, a), a);
        problems.PushBack(p, a);
    }
    doc_.AddMember("problems", problems, a);

    if (plan.is_upgrade()) {
        walk(plan.analysis->changes());
        doc_.AddMember("changes", items_, a);
    } else if (plan.analysis) {
        jval created(rapidjson::kArrayType);
        for (const SchemaObject* obj : plan.analysis->current().creation_order()) {
            const ObjectInfo& info = info_of(*obj);
            jval o(rapidjson::kObjectType);
            o.AddMember("object", jhlp::str_val(kind_name(kind_of(*obj)), a), a);
            o.AddMember("name", jhlp::str_val(info.full_name, a), a);
            o.AddMember("order", order_val(info.order, a), a);
            created.PushBack(o, a);
        }
        doc_.AddMember("creation_order", created, a);
    }

    std::string ret = jhlp::stringify(doc_, pretty);
    items_.SetArray();
    return ret;
}

} // namespace schemaver
