#include "SessionHistory.h"

SessionHistory::SessionHistory(const fs::path& db_path) {
    std::error_code ec;
    if (db_path.has_parent_path()) fs::create_directories(db_path.parent_path(), ec);
    if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
        std::cerr << RED << "❌ Error opening session history: " << sqlite3_errmsg(db) << RESET << std::endl;
        sqlite3_close(db);
        db = nullptr;
        return;
    }
    sqlite3_busy_timeout(db, 10000);
    const char* sql = "CREATE TABLE IF NOT EXISTS sessions ("
                      "session_id TEXT PRIMARY KEY, created_at TEXT, status TEXT, component_count INTEGER);"
                      "CREATE TABLE IF NOT EXISTS trials ("
                      "session_id TEXT, seq INTEGER, strategy TEXT, success INTEGER, duration REAL, log_snippet TEXT,"
                      "PRIMARY KEY (session_id, seq));";
    char* err_msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::cerr << RED << "❌ Error creating history tables: " << err_msg << RESET << std::endl;
        sqlite3_free(err_msg);
        sqlite3_close(db);
        db = nullptr;
    }
}

SessionHistory::~SessionHistory() { if (db) sqlite3_close(db); }

bool SessionHistory::record(const Session& session) {
    if (!db) return false;
    sqlite3_exec(db, "BEGIN;", nullptr, nullptr, nullptr);
    bool ok = true;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT OR REPLACE INTO sessions VALUES (?, ?, ?, ?);", -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, session.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, session.timestamp.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, status_name(session.status), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 4, static_cast<int>(session.manifest.size()));
        ok = sqlite3_step(stmt) == SQLITE_DONE;
    } else ok = false;
    sqlite3_finalize(stmt);

    if (ok && sqlite3_prepare_v2(db, "INSERT OR REPLACE INTO trials VALUES (?, ?, ?, ?, ?, ?);", -1, &stmt, nullptr) == SQLITE_OK) {
        for (size_t i = 0; ok && i < session.trials.size(); ++i) {
            const Trial& t = session.trials[i];
            sqlite3_reset(stmt);
            sqlite3_bind_text(stmt, 1, session.id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 2, static_cast<int>(i));
            sqlite3_bind_text(stmt, 3, t.strategy.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 4, t.success ? 1 : 0);
            sqlite3_bind_double(stmt, 5, t.duration);
            sqlite3_bind_text(stmt, 6, t.log_snippet.c_str(), -1, SQLITE_TRANSIENT);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
        }
        sqlite3_finalize(stmt);
    } else ok = false;

    sqlite3_exec(db, ok ? "COMMIT;" : "ROLLBACK;", nullptr, nullptr, nullptr);
    if (!ok) std::cerr << YELLOW << "⚠️ Could not record session history: " << sqlite3_errmsg(db) << RESET << std::endl;
    return ok;
}
