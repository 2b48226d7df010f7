#pragma once
#include "depres_utils.h"

constexpr std::string_view DEFAULT_STRATEGY = "default";

// Rule base shared read-only by the scanner, arbiter and executor for one session.
class KnowledgeBase {
public:
    std::map<std::string, NodeRule> node_rules;
    std::vector<Strategy> strategies;
    std::vector<ConflictRule> conflict_matrix;

    static KnowledgeBase load(const fs::path& path, Status& status);
    static KnowledgeBase from_json(const std::string& text, Status& status);
    const NodeRule* rule_for(const std::string& component) const;
    std::vector<Strategy> attempt_order() const;
    std::optional<Strategy> find_strategy(const std::string& name) const;
};
