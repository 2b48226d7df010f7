#include "depres_arbiter.h"

// A rule fires when any trigger is active; bans accumulate across rules. Removal
// looks only at the ban set, so a package that is both a trigger of one rule and
// banned by another is still removed.
ArbitrationResult arbitrate(const std::vector<Requirement>& requirements, const std::vector<ConflictRule>& matrix, bool verbose) {
    ArbitrationResult res;
    std::set<std::string> active;
    for (const auto& r : requirements) active.insert(r.name);

    for (size_t i = 0; i < matrix.size(); ++i) {
        const ConflictRule& rule = matrix[i];
        std::vector<std::string> hits;
        std::set_intersection(rule.trigger.begin(), rule.trigger.end(), active.begin(), active.end(), std::back_inserter(hits));
        if (hits.empty()) continue;
        res.fired.push_back(i);
        res.banned.insert(rule.ban.begin(), rule.ban.end());
        if (verbose) {
            std::string trig, ban;
            for (const auto& h : hits) trig += (trig.empty() ? "" : ", ") + h;
            for (const auto& b : rule.ban) ban += (ban.empty() ? "" : ", ") + b;
            std::cout << YELLOW << "⚖️  Conflict rule #" << i + 1 << " fired on [" << trig << "] -> ban [" << ban << "]"
                      << (rule.description.empty() ? "" : ": " + rule.description) << RESET << std::endl;
        }
    }

    for (const auto& r : requirements) {
        if (res.banned.count(r.name)) res.removed.push_back(r);
        else res.kept.push_back(r);
    }
    if (verbose && !res.removed.empty()) {
        for (const auto& r : res.removed) std::cout << YELLOW << "   ✂ purged " << r.raw << RESET << std::endl;
    }
    return res;
}
