#pragma once
#include "KnowledgeBase.h"
#include "depres_strategy.h"
#include "depres_recipe.h"
#include "TelemetryReporter.h"

// External collaborators of a session. Empty members disable the step.
struct SessionHooks {
    InstallRunner installer;
    FreezeRunner freezer;
    Transport transport;
};

SessionHooks default_hooks(const Config& cfg);

class SessionController {
    const Config& cfg;
    SessionHooks hooks;
    Session session;
    KnowledgeBase kb;
    std::optional<Recipe> recipe;
    std::optional<fs::path> recipe_file;
    bool reported = false;

public:
    SessionController(const Config& c, SessionHooks h);
    SessionStatus run();
    const Session& state() const { return session; }
    const KnowledgeBase& knowledge_base() const { return kb; }
    const std::optional<Recipe>& exported_recipe() const { return recipe; }
    const std::optional<fs::path>& recipe_path() const { return recipe_file; }
    bool telemetry_sent() const { return reported; }

private:
    void attempt_strategies();
    void finalize(SessionStatus status);
    void export_success_recipe();
};
