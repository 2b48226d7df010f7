#include "depres_env.h"

namespace {
std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : fallback;
}
} // namespace

Config init_config() {
    Config cfg;
    const char* home = std::getenv("HOME");
    cfg.home_dir = home ? fs::path(home) : fs::temp_directory_path();
    cfg.state_root = env_or("DEPRES_HOME", (cfg.home_dir / ".depres").string());
    cfg.nodes_dir = env_or("DEPRES_NODES_DIR", "/app/external/ComfyUI/custom_nodes");
    cfg.kb_file = env_or("DEPRES_KB", (cfg.state_root / "knowledge_base.json").string());
    cfg.history_db = cfg.state_root / "history.db";
    cfg.recipes_dir = env_or("DEPRES_RECIPES_DIR", (cfg.state_root / "recipes").string());
    cfg.logs_dir = env_or("DEPRES_LOGS_DIR", (cfg.state_root / "logs").string());
    cfg.work_dir = cfg.state_root / "tmp";
    cfg.requirements_file = env_or("DEPRES_REQUIREMENTS_FILE", cfg.requirements_file);
    cfg.installer_cmd = env_or("DEPRES_INSTALLER", cfg.installer_cmd);
    cfg.freeze_cmd = env_or("DEPRES_FREEZE", cfg.freeze_cmd);
    cfg.telemetry_url = env_or("DEPRES_TELEMETRY_URL", cfg.telemetry_url);
    std::string timeout = env_or("DEPRES_INSTALL_TIMEOUT", "0");
    try {
        cfg.install_timeout = std::max(0, std::stoi(timeout));
    } catch (const std::exception&) {
        std::cerr << YELLOW << "⚠️ Ignoring invalid DEPRES_INSTALL_TIMEOUT '" << timeout << "'." << RESET << std::endl;
    }
    return cfg;
}

