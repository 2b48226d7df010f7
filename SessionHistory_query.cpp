#include "SessionHistory.h"

namespace {
std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}
} // namespace

std::vector<HistoryEntry> SessionHistory::recent(int limit) {
    std::vector<HistoryEntry> out;
    if (!db) return out;
    const char* sql = "SELECT s.session_id, s.created_at, s.status, s.component_count, "
                      "(SELECT COUNT(*) FROM trials t WHERE t.session_id = s.session_id), "
                      "(SELECT strategy FROM trials t WHERE t.session_id = s.session_id AND t.success = 1 ORDER BY seq LIMIT 1) "
                      "FROM sessions s ORDER BY s.created_at DESC, s.rowid DESC LIMIT ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return out;
    sqlite3_bind_int(stmt, 1, limit);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        HistoryEntry e;
        e.session_id = column_text(stmt, 0);
        e.created_at = column_text(stmt, 1);
        e.status = column_text(stmt, 2);
        e.component_count = sqlite3_column_int(stmt, 3);
        e.trial_count = sqlite3_column_int(stmt, 4);
        e.winning_strategy = column_text(stmt, 5);
        out.push_back(e);
    }
    sqlite3_finalize(stmt);
    return out;
}

std::vector<Trial> SessionHistory::trials_for(const std::string& session_id) {
    std::vector<Trial> out;
    if (!db) return out;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT strategy, success, duration, log_snippet FROM trials WHERE session_id = ? ORDER BY seq;", -1, &stmt, nullptr) != SQLITE_OK) return out;
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Trial t;
        t.strategy = column_text(stmt, 0);
        t.success = sqlite3_column_int(stmt, 1) != 0;
        t.duration = sqlite3_column_double(stmt, 2);
        t.log_snippet = column_text(stmt, 3);
        out.push_back(t);
    }
    sqlite3_finalize(stmt);
    return out;
}
