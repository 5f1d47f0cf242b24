#include "queries.h"

namespace carbon::tracker::queries {

std::optional<std::string> query_config(const SqliteDatabase &db,
                                        const std::string &key) {
    SqliteStmt stmt(db, "SELECT value FROM plugin_config WHERE key = ?");
    stmt.bind_text(1, key);
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        return stmt.column_text(0);
    }
    return std::nullopt;
}

void upsert_config(const SqliteDatabase &db, const std::string &key,
                   const std::string &value) {
    SqliteStmt stmt(db,
                    "INSERT INTO plugin_config (key, value) VALUES (?, ?) "
                    "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
    stmt.bind_text(1, key);
    stmt.bind_text(2, value);
    stmt.step_done("Config write failed");
}

void insert_config_if_absent(const SqliteDatabase &db, const std::string &key,
                             const std::string &value) {
    SqliteStmt stmt(
        db, "INSERT OR IGNORE INTO plugin_config (key, value) VALUES (?, ?)");
    stmt.bind_text(1, key);
    stmt.bind_text(2, value);
    stmt.step_done("Config insert failed");
}

void delete_config(const SqliteDatabase &db, const std::string &key) {
    SqliteStmt stmt(db, "DELETE FROM plugin_config WHERE key = ?");
    stmt.bind_text(1, key);
    stmt.step_done("Config delete failed");
}

std::optional<std::string> query_project_config(
    const SqliteDatabase &db, const std::string &project_hash,
    const std::string &key) {
    SqliteStmt stmt(db,
                    "SELECT value FROM project_config WHERE project_hash = ? "
                    "AND key = ?");
    stmt.bind_text(1, project_hash);
    stmt.bind_text(2, key);
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        return stmt.column_text(0);
    }
    return std::nullopt;
}

void upsert_project_config(const SqliteDatabase &db,
                           const std::string &project_hash,
                           const std::string &key, const std::string &value) {
    SqliteStmt stmt(db,
                    "INSERT INTO project_config (project_hash, key, value) "
                    "VALUES (?, ?, ?) "
                    "ON CONFLICT(project_hash, key) DO UPDATE SET "
                    "value = excluded.value");
    stmt.bind_text(1, project_hash);
    stmt.bind_text(2, key);
    stmt.bind_text(3, value);
    stmt.step_done("Project config write failed");
}

void delete_project_config(const SqliteDatabase &db,
                           const std::string &project_hash,
                           const std::string &key) {
    SqliteStmt stmt(
        db, "DELETE FROM project_config WHERE project_hash = ? AND key = ?");
    stmt.bind_text(1, project_hash);
    stmt.bind_text(2, key);
    stmt.step_done("Project config delete failed");
}

}  // namespace carbon::tracker::queries
