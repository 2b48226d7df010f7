#pragma once
#include "depres_common.h"

// Fatal is reserved for aborting conditions; every step on the resolve path
// recovers, so none of them produces it.
enum class Severity { Ok, Recoverable, Fatal };

// Outcome of an I/O-bound step. Recoverable means the caller continues with defaults.
struct Status {
    Severity severity = Severity::Ok;
    std::string message;
    bool ok() const { return severity == Severity::Ok; }
    void recover(const std::string& msg) {
        if (severity == Severity::Ok) severity = Severity::Recoverable;
        if (!message.empty()) message += "; ";
        message += msg;
    }
};

struct Config {
    fs::path home_dir;
    fs::path state_root;
    fs::path nodes_dir;
    fs::path kb_file;
    fs::path history_db;
    fs::path recipes_dir;
    fs::path logs_dir;
    fs::path work_dir;
    std::string requirements_file = "requirements.txt";
    std::string installer_cmd = "uv pip install --system -r";
    std::string freeze_cmd = "python3 -m pip freeze";
    std::string telemetry_url = "https://h9qf4nsc0i.execute-api.ap-northeast-1.amazonaws.com/logs";
    int install_timeout = 0;
};

struct Requirement {
    std::string raw;
    std::string name;
};

// Component id -> declared requirements, in scan order.
using Manifest = std::vector<std::pair<std::string, std::vector<Requirement>>>;

struct ConflictRule {
    std::set<std::string> trigger;
    std::set<std::string> ban;
    std::string description;
};

struct NodeRule {
    std::vector<std::string> extra_files;
    std::vector<std::string> inject;
};

struct Strategy {
    std::string name;
    bool enabled = true;
    std::vector<Requirement> constraints;
    std::set<std::string> override_packages;
};

struct Trial {
    std::string strategy;
    bool success = false;
    double duration = 0.0;
    std::string log_snippet;
};

enum class SessionStatus { Pending, Success, Failed };

struct Session {
    std::string id;
    std::string timestamp;
    Manifest manifest;
    std::vector<Trial> trials;
    SessionStatus status = SessionStatus::Pending;
};

struct PinnedPackage {
    std::string name;
    std::string version;
};

struct Recipe {
    std::string asset_id;
    std::string created_at;
    std::vector<PinnedPackage> packages;
};

struct ExecResult {
    int exit_code = -1;
    std::string output;
    double duration = 0.0;
    bool timed_out = false;
};

inline const char* status_name(SessionStatus s) {
    switch (s) {
        case SessionStatus::Success: return "success";
        case SessionStatus::Failed: return "failed";
        default: return "pending";
    }
}
