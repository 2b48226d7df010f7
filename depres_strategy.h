#pragma once
#include "depres_arbiter.h"

struct InstallPlan {
    std::string strategy;
    std::vector<Requirement> requirements;
    std::vector<Requirement> overridden;
    ArbitrationResult arbitration;
};

// Installs from a requirement file; the environment it mutates is shared by all attempts.
using InstallRunner = std::function<ExecResult(const fs::path& requirements_file)>;

InstallPlan build_install_plan(const Strategy& strategy, const Manifest& manifest, const std::vector<ConflictRule>& matrix, bool verbose = true);
std::string render_requirements(const InstallPlan& plan);
Trial attempt_strategy(const Strategy& strategy, const Manifest& manifest, const std::vector<ConflictRule>& matrix,
                       const InstallRunner& installer, const fs::path& work_dir);
InstallRunner make_shell_installer(const Config& cfg);
