#include "depres_strategy.h"

InstallPlan build_install_plan(const Strategy& strategy, const Manifest& manifest, const std::vector<ConflictRule>& matrix, bool verbose) {
    InstallPlan plan;
    plan.strategy = strategy.name;
    std::vector<Requirement> pool;
    for (const auto& [comp, reqs] : manifest) {
        for (const auto& r : reqs) {
            if (strategy.override_packages.count(r.name)) plan.overridden.push_back(r);
            else pool.push_back(r);
        }
    }
    if (verbose && !plan.overridden.empty()) {
        std::cout << BLUE << "🔁 [" << strategy.name << "] overriding " << plan.overridden.size() << " declaration(s)" << RESET << std::endl;
    }
    plan.arbitration = arbitrate(pool, matrix, verbose);
    plan.requirements = plan.arbitration.kept;
    plan.requirements.insert(plan.requirements.end(), strategy.constraints.begin(), strategy.constraints.end());
    return plan;
}

std::string render_requirements(const InstallPlan& plan) {
    std::string out;
    for (const auto& r : plan.requirements) out += r.raw + "\n";
    return out;
}

Trial attempt_strategy(const Strategy& strategy, const Manifest& manifest, const std::vector<ConflictRule>& matrix,
                       const InstallRunner& installer, const fs::path& work_dir) {
    Trial trial;
    trial.strategy = strategy.name;
    std::cout << MAGENTA << "🚀 Attempting strategy '" << strategy.name << "'..." << RESET << std::endl;
    InstallPlan plan = build_install_plan(strategy, manifest, matrix);
    if (plan.requirements.empty()) {
        std::cout << GREEN << "✔ Nothing to install." << RESET << std::endl;
        trial.success = true;
        trial.log_snippet = "no requirements";
        return trial;
    }

    std::error_code ec;
    fs::create_directories(work_dir, ec);
    fs::path req_file = work_dir / std::format("requirements_{}_{}.txt", compute_hash(strategy.name).substr(0, 8), getpid());
    {
        std::ofstream ofs(req_file, std::ios::trunc);
        ofs << render_requirements(plan);
        if (!ofs) {
            std::cerr << RED << "❌ Could not write " << req_file << RESET << std::endl;
            trial.log_snippet = "could not write requirement file " + req_file.string();
            return trial;
        }
    }
    std::cout << BLUE << "📦 Installing " << plan.requirements.size() << " requirement(s)..." << RESET << std::endl;
    ExecResult res = installer(req_file);
    fs::remove(req_file, ec);

    trial.success = res.exit_code == 0;
    trial.duration = res.duration;
    trial.log_snippet = tail_excerpt(res.output);
    if (res.timed_out) trial.log_snippet = tail_excerpt(res.output + "\n[installer timed out]");
    if (trial.success) std::cout << GREEN << "✔ Strategy '" << strategy.name << "' succeeded in " << std::format("{:.1f}", res.duration) << "s." << RESET << std::endl;
    else std::cout << RED << "❌ Strategy '" << strategy.name << "' failed (exit " << res.exit_code << ")." << RESET << std::endl;
    return trial;
}

InstallRunner make_shell_installer(const Config& cfg) {
    return [cmd = cfg.installer_cmd, timeout = cfg.install_timeout](const fs::path& requirements_file) {
        std::string full = std::format("env UV_CONCURRENT_DOWNLOADS=4 UV_LINK_MODE=copy {} {}", cmd, quote_arg(requirements_file.string()));
        return run_captured(full, timeout);
    };
}
