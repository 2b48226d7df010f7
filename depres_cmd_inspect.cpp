#include "depres_cmd.h"
#include "depres_scan.h"
#include "depres_strategy.h"
#include "SessionHistory.h"

int run_command_scan(Config& cfg) {
    Status st;
    KnowledgeBase kb = KnowledgeBase::load(cfg.kb_file, st);
    Manifest manifest = scan_manifest(cfg.nodes_dir, kb, cfg.requirements_file, st);
    for (const auto& [comp, reqs] : manifest) {
        std::cout << BOLD << comp << RESET << std::endl;
        for (const auto& r : reqs) std::cout << "  " << r.raw << CYAN << "  (" << r.name << ")" << RESET << std::endl;
    }
    return 0;
}

int run_command_plan(Config& cfg, const std::vector<std::string>& args) {
    Status st;
    KnowledgeBase kb = KnowledgeBase::load(cfg.kb_file, st);
    std::string name = args.size() > 1 ? args[1] : std::string(DEFAULT_STRATEGY);
    auto strategy = kb.find_strategy(name);
    if (!strategy) { std::cerr << RED << "❌ Unknown strategy '" << name << "'" << RESET << std::endl; return 1; }
    Manifest manifest = scan_manifest(cfg.nodes_dir, kb, cfg.requirements_file, st);
    InstallPlan plan = build_install_plan(*strategy, manifest, kb.conflict_matrix);
    std::cout << MAGENTA << "# strategy: " << plan.strategy << " (" << plan.requirements.size() << " requirements, "
              << plan.overridden.size() << " overridden, " << plan.arbitration.removed.size() << " purged)" << RESET << std::endl;
    std::cout << render_requirements(plan) << std::flush;
    return 0;
}

int run_command_history(Config& cfg, const std::vector<std::string>& args) {
    int limit = 10;
    if (args.size() > 1) {
        try { limit = std::stoi(args[1]); }
        catch (const std::exception&) { std::cout << "Usage: depres history [n]" << std::endl; return 1; }
    }
    SessionHistory history(cfg.history_db);
    if (!history.is_open()) return 1;
    auto entries = history.recent(limit);
    if (entries.empty()) { std::cout << "No sessions recorded." << std::endl; return 0; }
    for (const auto& e : entries) {
        auto color = e.status == "success" ? GREEN : RED;
        std::cout << color << (e.status == "success" ? "✔ " : "❌ ") << RESET << BOLD << e.session_id << RESET << "  " << e.created_at
                  << "  " << e.component_count << " components, " << e.trial_count << " trials";
        if (!e.winning_strategy.empty()) std::cout << ", won by " << CYAN << e.winning_strategy << RESET;
        std::cout << std::endl;
    }
    return 0;
}
