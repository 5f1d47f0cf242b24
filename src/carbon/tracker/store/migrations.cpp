#include <carbon/tracker/store/migrations.h>
#include <carbon/tracker/store/sqlite/statement.h>
#include <spdlog/spdlog.h>

namespace carbon::tracker {

const std::vector<Migration> &default_migrations() {
    static const std::vector<Migration> migrations = {
        {1, "Add needs_sync flag for delivery tracking",
         [](const SqliteDatabase &db) {
             if (!column_exists(db, "sessions", "needs_sync")) {
                 db.exec(
                     "ALTER TABLE sessions ADD COLUMN needs_sync INTEGER NOT "
                     "NULL DEFAULT 1");
             }
         }},
        {2, "Add project_identifier column",
         [](const SqliteDatabase &db) {
             if (!column_exists(db, "sessions", "project_identifier")) {
                 db.exec(
                     "ALTER TABLE sessions ADD COLUMN project_identifier TEXT "
                     "NOT NULL DEFAULT ''");
             }
             db.exec(
                 "CREATE INDEX IF NOT EXISTS idx_sessions_project_identifier "
                 "ON sessions(project_identifier)");
         }},
        {3, "Add project_config table for per-project settings",
         [](const SqliteDatabase &db) {
             db.exec(
                 "CREATE TABLE IF NOT EXISTS project_config ("
                 "project_hash TEXT NOT NULL, "
                 "key TEXT NOT NULL, "
                 "value TEXT NOT NULL, "
                 "PRIMARY KEY (project_hash, key))");
         }},
        {4, "Index needs_sync for unsynced lookups",
         [](const SqliteDatabase &db) {
             db.exec(
                 "CREATE INDEX IF NOT EXISTS idx_sessions_needs_sync "
                 "ON sessions(needs_sync)");
         }},
        {5, "Add revision counter for sync bookkeeping",
         [](const SqliteDatabase &db) {
             if (!column_exists(db, "sessions", "revision")) {
                 db.exec(
                     "ALTER TABLE sessions ADD COLUMN revision INTEGER NOT "
                     "NULL DEFAULT 0");
             }
         }},
    };
    return migrations;
}

int get_schema_version(const SqliteDatabase &db) {
    SqliteStmt stmt(db, "PRAGMA user_version");
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        return sqlite3_column_int(stmt, 0);
    }
    return 0;
}

void set_schema_version(const SqliteDatabase &db, int version) {
    // PRAGMA does not accept bound parameters
    db.exec("PRAGMA user_version = " + std::to_string(version));
}

bool column_exists(const SqliteDatabase &db, const std::string &table,
                   const std::string &column) {
    std::string sql = "PRAGMA table_info(" + table + ")";
    SqliteStmt stmt(db, sql.c_str());
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        if (stmt.column_text(1) == column) {
            return true;
        }
    }
    return false;
}

bool index_exists(const SqliteDatabase &db, const std::string &index) {
    SqliteStmt stmt(db,
                    "SELECT 1 FROM sqlite_master WHERE type='index' AND "
                    "name = ?");
    stmt.bind_text(1, index);
    return sqlite3_step(stmt) == SQLITE_ROW;
}

int run_migrations(const SqliteDatabase &db,
                   const std::vector<Migration> &migrations) {
    for (std::size_t i = 1; i < migrations.size(); ++i) {
        if (migrations[i].version <= migrations[i - 1].version) {
            throw StoreError(StoreError::Type::MIGRATION_ERROR,
                             "Migration versions must be strictly increasing "
                             "(v" + std::to_string(migrations[i].version) +
                                 " after v" +
                                 std::to_string(migrations[i - 1].version) +
                                 ")");
        }
    }

    int current = get_schema_version(db);

    for (const auto &migration : migrations) {
        if (migration.version <= current) {
            continue;
        }
        try {
            migration.up(db);
            set_schema_version(db, migration.version);
            current = migration.version;
            spdlog::debug("Applied migration v{}: {}", migration.version,
                          migration.description);
        } catch (const std::exception &e) {
            spdlog::error("Migration v{} failed ({}): {}", migration.version,
                          migration.description, e.what());
            break;
        }
    }
    return current;
}

}  // namespace carbon::tracker
