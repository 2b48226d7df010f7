#include "depres_scan.h"
#include "depres_req.h"

namespace {

bool is_skipped_dir(const std::string& name) {
    return name.empty() || name[0] == '.' || name == "__pycache__";
}

void read_declarations(const fs::path& file, std::vector<Requirement>& out, Status& status) {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) return;
    bool ok = true;
    std::string text = read_text_file(file, ok);
    if (!ok) {
        std::cout << YELLOW << "⚠️ Skipping unreadable " << file << RESET << std::endl;
        status.recover("unreadable " + file.string());
        return;
    }
    auto reqs = parse_requirement_lines(text);
    out.insert(out.end(), reqs.begin(), reqs.end());
}

} // namespace

Manifest scan_manifest(const fs::path& root, const KnowledgeBase& kb, const std::string& standard_file, Status& status) {
    Manifest manifest;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        std::cout << YELLOW << "⚠️ Component root " << root << " not found." << RESET << std::endl;
        status.recover("component root not found: " + root.string());
        return manifest;
    }
    std::cout << MAGENTA << "🔍 Scanning " << root.string() << "..." << RESET << std::endl;
    std::vector<std::string> components;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code dec;
        if (!it->is_directory(dec)) continue;
        std::string name = it->path().filename().string();
        if (!is_skipped_dir(name)) components.push_back(name);
    }
    if (ec) {
        std::cout << YELLOW << "⚠️ Listing " << root << " stopped early: " << ec.message() << RESET << std::endl;
        status.recover("directory listing failed: " + ec.message());
    }
    std::sort(components.begin(), components.end());

    for (const auto& comp : components) {
        fs::path dir = root / comp;
        std::vector<Requirement> reqs;
        read_declarations(dir / standard_file, reqs, status);
        if (const NodeRule* rule = kb.rule_for(comp)) {
            for (const auto& extra : rule->extra_files) {
                if (extra == standard_file) continue;
                read_declarations(dir / extra, reqs, status);
            }
            auto injected = parse_requirement_list(rule->inject);
            if (!injected.empty()) std::cout << BLUE << "💉 " << comp << ": injecting " << injected.size() << " requirement(s)" << RESET << std::endl;
            reqs.insert(reqs.end(), injected.begin(), injected.end());
        }
        if (reqs.empty()) continue;
        manifest.emplace_back(comp, std::move(reqs));
    }
    std::cout << GREEN << "✔ " << manifest.size() << " component(s), " << requirement_count(manifest) << " requirement(s)." << RESET << std::endl;
    return manifest;
}

size_t requirement_count(const Manifest& manifest) {
    size_t n = 0;
    for (const auto& [comp, reqs] : manifest) n += reqs.size();
    return n;
}
