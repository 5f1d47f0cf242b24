#include "queries.h"

#include <spdlog/spdlog.h>

namespace carbon::tracker::queries {

const char *SESSION_COLUMNS =
    "session_id, project_path, project_identifier, input_tokens, "
    "output_tokens, cache_creation_tokens, cache_read_tokens, total_tokens, "
    "energy_wh, co2_grams, primary_model, created_at, updated_at, "
    "needs_sync, revision";

SessionRecord read_session_row(SqliteStmt &stmt) {
    SessionRecord record;
    record.session_id = stmt.column_text(0);
    record.project_path = stmt.column_text(1);
    record.project_identifier = stmt.column_text(2);
    record.input_tokens =
        static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 3));
    record.output_tokens =
        static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 4));
    record.cache_creation_tokens =
        static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 5));
    record.cache_read_tokens =
        static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 6));
    record.total_tokens =
        static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 7));
    record.energy_wh = sqlite3_column_double(stmt, 8);
    record.co2_grams = sqlite3_column_double(stmt, 9);
    record.primary_model = stmt.column_text(10);
    record.created_at =
        utils::parse_iso8601(stmt.column_text(11)).value_or(utils::Timestamp{});
    record.updated_at =
        utils::parse_iso8601(stmt.column_text(12)).value_or(utils::Timestamp{});
    record.needs_sync = sqlite3_column_int(stmt, 13) != 0;
    record.revision = sqlite3_column_int64(stmt, 14);
    return record;
}

void upsert_session(const SqliteDatabase &db, const SessionRecord &record) {
    SqliteStmt stmt(db,
                    "INSERT INTO sessions ("
                    "session_id, project_path, project_identifier, "
                    "input_tokens, output_tokens, cache_creation_tokens, "
                    "cache_read_tokens, total_tokens, energy_wh, co2_grams, "
                    "primary_model, created_at, updated_at, needs_sync, "
                    "revision"
                    ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 1, 1) "
                    "ON CONFLICT(session_id) DO UPDATE SET "
                    "project_path = excluded.project_path, "
                    "project_identifier = excluded.project_identifier, "
                    "input_tokens = excluded.input_tokens, "
                    "output_tokens = excluded.output_tokens, "
                    "cache_creation_tokens = excluded.cache_creation_tokens, "
                    "cache_read_tokens = excluded.cache_read_tokens, "
                    "total_tokens = excluded.total_tokens, "
                    "energy_wh = excluded.energy_wh, "
                    "co2_grams = excluded.co2_grams, "
                    "primary_model = excluded.primary_model, "
                    "updated_at = excluded.updated_at, "
                    "needs_sync = 1, "
                    "revision = sessions.revision + 1");

    stmt.bind_text(1, record.session_id);
    stmt.bind_text(2, record.project_path);
    stmt.bind_text(3, record.project_identifier);
    stmt.bind_int64(4, static_cast<std::int64_t>(record.input_tokens));
    stmt.bind_int64(5, static_cast<std::int64_t>(record.output_tokens));
    stmt.bind_int64(6, static_cast<std::int64_t>(record.cache_creation_tokens));
    stmt.bind_int64(7, static_cast<std::int64_t>(record.cache_read_tokens));
    stmt.bind_int64(8, static_cast<std::int64_t>(record.total_tokens));
    stmt.bind_double(9, record.energy_wh);
    stmt.bind_double(10, record.co2_grams);
    stmt.bind_text(11, record.primary_model);
    stmt.bind_text(12, utils::format_iso8601(record.created_at));
    stmt.bind_text(13, utils::format_iso8601(record.updated_at));

    stmt.step_done("Session upsert failed");
    spdlog::debug("Upserted session {} ({} tokens, {:.4f} g)",
                  record.session_id, record.total_tokens, record.co2_grams);
}

std::optional<SessionRecord> query_session(const SqliteDatabase &db,
                                           const std::string &session_id) {
    std::string sql = std::string("SELECT ") + SESSION_COLUMNS +
                      " FROM sessions WHERE session_id = ?";
    SqliteStmt stmt(db, sql.c_str());
    stmt.bind_text(1, session_id);
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        return read_session_row(stmt);
    }
    return std::nullopt;
}

std::vector<std::string> query_session_ids(const SqliteDatabase &db) {
    std::vector<std::string> ids;
    SqliteStmt stmt(db, "SELECT session_id FROM sessions");
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(stmt.column_text(0));
    }
    return ids;
}

bool query_session_exists(const SqliteDatabase &db,
                          const std::string &session_id) {
    SqliteStmt stmt(db, "SELECT 1 FROM sessions WHERE session_id = ?");
    stmt.bind_text(1, session_id);
    return sqlite3_step(stmt) == SQLITE_ROW;
}

std::size_t delete_project_sessions(const SqliteDatabase &db,
                                    const std::string &project_identifier) {
    SqliteStmt stmt(db, "DELETE FROM sessions WHERE project_identifier = ?");
    stmt.bind_text(1, project_identifier);
    stmt.step_done("Project delete failed");
    return static_cast<std::size_t>(sqlite3_changes(db.get()));
}

}  // namespace carbon::tracker::queries
