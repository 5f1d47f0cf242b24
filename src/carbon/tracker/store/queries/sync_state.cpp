#include "queries.h"

#include <spdlog/spdlog.h>

namespace carbon::tracker::queries {

std::vector<SessionRecord> query_unsynced_sessions(const SqliteDatabase &db,
                                                   std::size_t limit) {
    std::string sql = std::string("SELECT ") + SESSION_COLUMNS +
                      " FROM sessions WHERE needs_sync = 1 "
                      "ORDER BY created_at, session_id LIMIT ?";
    SqliteStmt stmt(db, sql.c_str());
    stmt.bind_int64(1, static_cast<std::int64_t>(limit));

    std::vector<SessionRecord> out;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.push_back(read_session_row(stmt));
    }
    return out;
}

std::size_t query_unsynced_count(const SqliteDatabase &db) {
    SqliteStmt stmt(db, "SELECT COUNT(*) FROM sessions WHERE needs_sync = 1");
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        return static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    return 0;
}

std::size_t mark_sessions_synced(const SqliteDatabase &db,
                                 const std::vector<SessionRecord> &records) {
    if (records.empty()) return 0;

    std::size_t cleared = 0;
    db.exec("BEGIN IMMEDIATE;");
    try {
        SqliteStmt stmt(db,
                        "UPDATE sessions SET needs_sync = 0 "
                        "WHERE session_id = ? AND revision = ?");
        for (const auto &record : records) {
            stmt.bind_text(1, record.session_id);
            stmt.bind_int64(2, record.revision);
            stmt.step_done("Marking session synced failed");
            cleared += static_cast<std::size_t>(sqlite3_changes(db.get()));
            stmt.reset();
        }
        db.exec("COMMIT;");
    } catch (const StoreError &e) {
        spdlog::error("Rolling back sync marks: {}", e.what());
        sqlite3_exec(db.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    spdlog::debug("Marked {} of {} session(s) synced", cleared,
                  records.size());
    return cleared;
}

}  // namespace carbon::tracker::queries
