#include "KnowledgeBase.h"
#include "depres_json.h"
#include "depres_req.h"

namespace {

std::set<std::string> canonical_set(const std::vector<std::string>& names) {
    std::set<std::string> out;
    for (const auto& n : names) {
        std::string c = canonical_name(n);
        if (!c.empty()) out.insert(c);
    }
    return out;
}

void load_node_rules(const JsonValue* section, KnowledgeBase& kb, Status& status) {
    if (!section) return;
    if (!section->is_object()) { status.recover("node_specific_rules is not an object"); return; }
    for (const auto& [component, body] : section->members) {
        bool ok = body.is_object();
        NodeRule rule;
        if (ok) {
            rule.extra_files = string_items(body.find("extra_files"), ok);
            rule.inject = string_items(body.find("inject"), ok);
        }
        if (!ok) { status.recover("skipped malformed node rule '" + component + "'"); continue; }
        kb.node_rules[component] = rule;
    }
}

void load_strategies(const JsonValue* section, KnowledgeBase& kb, Status& status) {
    if (!section) return;
    if (!section->is_object()) { status.recover("strategies is not an object"); return; }
    for (const auto& [name, body] : section->members) {
        bool ok = body.is_object();
        Strategy st;
        st.name = name;
        if (ok) {
            if (const JsonValue* en = body.find("enabled")) {
                if (en->is_bool()) st.enabled = en->boolean;
                else ok = false;
            }
            st.override_packages = canonical_set(string_items(body.find("override_packages"), ok));
            st.constraints = verbatim_requirements(string_items(body.find("modern_constraints"), ok));
        }
        if (!ok) { status.recover("skipped malformed strategy '" + name + "'"); continue; }
        kb.strategies.push_back(st);
    }
}

void load_conflict_matrix(const JsonValue* section, KnowledgeBase& kb, Status& status) {
    if (!section) return;
    if (!section->is_array()) { status.recover("conflict_matrix is not an array"); return; }
    size_t idx = 0;
    for (const auto& body : section->items) {
        ++idx;
        bool ok = body.is_object();
        ConflictRule rule;
        if (ok) {
            rule.trigger = canonical_set(string_items(body.find("trigger"), ok));
            rule.ban = canonical_set(string_items(body.find("ban"), ok));
            if (const JsonValue* d = body.find("description")) {
                if (d->is_string()) rule.description = d->str;
                else ok = false;
            }
        }
        if (!ok) { status.recover(std::format("skipped malformed conflict rule #{}", idx)); continue; }
        kb.conflict_matrix.push_back(rule);
    }
}

} // namespace

KnowledgeBase KnowledgeBase::from_json(const std::string& text, Status& status) {
    KnowledgeBase kb;
    std::string err;
    auto root = parse_json(text, err);
    if (!root) { status.recover("malformed knowledge base: " + err); return kb; }
    if (!root->is_object()) { status.recover("knowledge base root is not an object"); return kb; }
    load_node_rules(root->find("node_specific_rules"), kb, status);
    load_strategies(root->find("strategies"), kb, status);
    load_conflict_matrix(root->find("conflict_matrix"), kb, status);
    return kb;
}

KnowledgeBase KnowledgeBase::load(const fs::path& path, Status& status) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        status.recover("knowledge base not found: " + path.string());
        std::cout << YELLOW << "⚠️ Knowledge base " << path << " not found. Using default strategy only." << RESET << std::endl;
        return {};
    }
    bool ok = true;
    std::string text = read_text_file(path, ok);
    if (!ok) {
        status.recover("cannot read knowledge base: " + path.string());
        std::cout << YELLOW << "⚠️ Could not read knowledge base " << path << ". Using default strategy only." << RESET << std::endl;
        return {};
    }
    Status parse_status;
    KnowledgeBase kb = from_json(text, parse_status);
    if (!parse_status.ok()) {
        std::cout << YELLOW << "⚠️ Knowledge base: " << parse_status.message << RESET << std::endl;
        status.recover(parse_status.message);
    }
    std::cout << CYAN << "📚 Knowledge base: " << kb.node_rules.size() << " node rules, " << kb.strategies.size()
              << " strategies, " << kb.conflict_matrix.size() << " conflict rules." << RESET << std::endl;
    return kb;
}
