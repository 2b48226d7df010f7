#pragma once
#include "depres_utils.h"

struct HistoryEntry {
    std::string session_id;
    std::string created_at;
    std::string status;
    int component_count = 0;
    int trial_count = 0;
    std::string winning_strategy;
};

class SessionHistory {
    sqlite3* db = nullptr;
public:
    explicit SessionHistory(const fs::path& db_path);
    ~SessionHistory();
    SessionHistory(const SessionHistory&) = delete;
    SessionHistory& operator=(const SessionHistory&) = delete;
    bool is_open() const { return db != nullptr; }
    bool record(const Session& session);
    std::vector<HistoryEntry> recent(int limit);
    std::vector<Trial> trials_for(const std::string& session_id);
};
