#include "depres_session.h"
#include "depres_scan.h"
#include "depres_report.h"
#include "SessionHistory.h"

SessionHooks default_hooks(const Config& cfg) {
    return { make_shell_installer(cfg), make_shell_freezer(cfg), make_curl_transport(cfg) };
}

SessionController::SessionController(const Config& c, SessionHooks h) : cfg(c), hooks(std::move(h)) {
    session.id = new_session_id();
    session.timestamp = iso_timestamp();
}

SessionStatus SessionController::run() {
    if (session.status != SessionStatus::Pending) return session.status;
    std::cout << BOLD << "🛡️  depres session " << session.id << RESET << std::endl;
    Status kb_status;
    kb = KnowledgeBase::load(cfg.kb_file, kb_status);
    Status scan_status;
    session.manifest = scan_manifest(cfg.nodes_dir, kb, cfg.requirements_file, scan_status);
    if (!scan_status.ok()) std::cout << YELLOW << "⚠️ Scan: " << scan_status.message << RESET << std::endl;

    attempt_strategies();
    if (session.status == SessionStatus::Success) export_success_recipe();

    write_session_report(session, cfg.logs_dir);
    SessionHistory history(cfg.history_db);
    history.record(session);
    TelemetryReporter reporter(hooks.transport, cfg.work_dir);
    reported = reporter.report(session);
    return session.status;
}

void SessionController::attempt_strategies() {
    auto order = kb.attempt_order();
    for (size_t i = 0; i < order.size(); ++i) {
        if (g_interrupted) {
            std::cout << YELLOW << "⚠️ Interrupted. Skipping remaining strategies." << RESET << std::endl;
            break;
        }
        if (!hooks.installer) break;
        std::cout << BLUE << "[" << i + 1 << "/" << order.size() << "] " << RESET;
        Trial trial = attempt_strategy(order[i], session.manifest, kb.conflict_matrix, hooks.installer, cfg.work_dir);
        session.trials.push_back(trial);
        if (trial.success) { finalize(SessionStatus::Success); return; }
    }
    finalize(SessionStatus::Failed);
}

void SessionController::finalize(SessionStatus status) {
    if (session.status != SessionStatus::Pending) return;
    session.status = status;
    if (status == SessionStatus::Success) std::cout << GREEN << "✅ Dependencies resolved." << RESET << std::endl;
    else std::cout << RED << "❌ All strategies failed." << RESET << std::endl;
}

void SessionController::export_success_recipe() {
    std::string frozen;
    if (hooks.freezer) {
        ExecResult res = hooks.freezer();
        if (res.exit_code == 0) frozen = res.output;
        else std::cout << YELLOW << "⚠️ Could not capture installed packages (exit " << res.exit_code << ")." << RESET << std::endl;
    }
    recipe = build_recipe(session.id, frozen);
    Status st;
    recipe_file = export_recipe(*recipe, cfg.recipes_dir, st);
}
