#include "depres_recipe.h"

// Keeps only exact pins. Editable installs, direct references and comments
// cannot be replayed from an index and are left out.
std::vector<PinnedPackage> parse_freeze_output(const std::string& text) {
    std::vector<PinnedPackage> pkgs;
    for (const auto& raw : split(text, '\n')) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == '-') continue;
        if (line.find(" @ ") != std::string::npos) continue;
        size_t eq = line.find("==");
        if (eq == std::string::npos || eq == 0) continue;
        std::string name = trim(line.substr(0, eq)), version = trim(line.substr(eq + 2));
        if (name.empty() || version.empty() || version.find_first_of(" ;") != std::string::npos) continue;
        pkgs.push_back({name, version});
    }
    return pkgs;
}

Recipe build_recipe(const std::string& session_id, const std::string& freeze_output) {
    Recipe r;
    r.asset_id = "depres-" + session_id;
    r.created_at = iso_timestamp();
    r.packages = parse_freeze_output(freeze_output);
    return r;
}

JsonValue recipe_to_json(const Recipe& recipe) {
    JsonValue root = JsonValue::object();
    root.set("asset_id", JsonValue::of(recipe.asset_id));
    root.set("created_at", JsonValue::of(recipe.created_at));
    JsonValue& comps = root.set("components", JsonValue::array());
    for (const auto& p : recipe.packages) {
        JsonValue c = JsonValue::object();
        c.set("type", JsonValue::of("pip"));
        c.set("source", JsonValue::of(p.name));
        c.set("version", JsonValue::of("==" + p.version));
        comps.push(std::move(c));
    }
    return root;
}

std::optional<fs::path> export_recipe(const Recipe& recipe, const fs::path& dir, Status& status) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    fs::path out = dir / (recipe.asset_id + ".json");
    std::ofstream ofs(out, std::ios::trunc);
    ofs << to_json(recipe_to_json(recipe), 2) << "\n";
    ofs.close();
    if (!ofs) {
        std::cerr << RED << "❌ Failed to write recipe " << out << RESET << std::endl;
        status.recover("failed to write recipe " + out.string());
        return std::nullopt;
    }
    std::cout << GREEN << "🧾 Recipe saved to " << out.string() << " (" << recipe.packages.size() << " packages)" << RESET << std::endl;
    return out;
}

FreezeRunner make_shell_freezer(const Config& cfg) {
    return [cmd = cfg.freeze_cmd]() { return run_captured(cmd); };
}
