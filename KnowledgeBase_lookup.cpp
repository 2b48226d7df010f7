#include "KnowledgeBase.h"

const NodeRule* KnowledgeBase::rule_for(const std::string& component) const {
    auto it = node_rules.find(component);
    return it == node_rules.end() ? nullptr : &it->second;
}

std::optional<Strategy> KnowledgeBase::find_strategy(const std::string& name) const {
    for (const auto& st : attempt_order()) if (st.name == name) return st;
    for (const auto& st : strategies) if (st.name == name) return st;
    return std::nullopt;
}

// The default strategy always runs first. A knowledge-base entry named
// "default" supplies its overrides and constraints instead of adding a second pass.
std::vector<Strategy> KnowledgeBase::attempt_order() const {
    std::vector<Strategy> order;
    Strategy def; def.name = std::string(DEFAULT_STRATEGY);
    for (const auto& st : strategies) {
        if (st.name == DEFAULT_STRATEGY) { def = st; def.enabled = true; }
    }
    order.push_back(def);
    for (const auto& st : strategies) {
        if (st.name != DEFAULT_STRATEGY && st.enabled) order.push_back(st);
    }
    return order;
}
