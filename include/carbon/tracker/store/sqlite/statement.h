#ifndef CARBON_TRACKER_STORE_SQLITE_STATEMENT_H
#define CARBON_TRACKER_STORE_SQLITE_STATEMENT_H

#include <carbon/tracker/store/error.h>
#include <carbon/tracker/store/sqlite/database.h>
#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace carbon::tracker {

class SqliteStmt {
   public:
    SqliteStmt(const SqliteDatabase &db, const char *sql) : db_(db.get()) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
            throw StoreError(StoreError::Type::DATABASE_ERROR,
                             "Failed to prepare SQL statement: " +
                                 std::string(sqlite3_errmsg(db_)));
        }
    }

    ~SqliteStmt() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    SqliteStmt(const SqliteStmt &) = delete;
    SqliteStmt &operator=(const SqliteStmt &) = delete;

    operator sqlite3_stmt *() { return stmt_; }
    sqlite3_stmt *get() { return stmt_; }

    void reset() { sqlite3_reset(stmt_); }

    void bind_text(int index, const std::string &value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), -1,
                                SQLITE_TRANSIENT));
    }
    void bind_int64(int index, std::int64_t value) {
        check(sqlite3_bind_int64(stmt_, index,
                                 static_cast<sqlite3_int64>(value)));
    }
    void bind_double(int index, double value) {
        check(sqlite3_bind_double(stmt_, index, value));
    }

    /** Step a statement that returns no rows. */
    void step_done(const char *what) {
        int rc = sqlite3_step(stmt_);
        if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
            throw StoreError(StoreError::Type::DATABASE_ERROR,
                             std::string(what) + ": " + sqlite3_errmsg(db_));
        }
    }

    std::string column_text(int col) {
        const char *text =
            reinterpret_cast<const char *>(sqlite3_column_text(stmt_, col));
        return text ? std::string(text) : std::string();
    }

   private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreError(StoreError::Type::DATABASE_ERROR,
                             "Failed to bind parameter: " +
                                 std::string(sqlite3_errmsg(db_)));
        }
    }

    sqlite3 *db_;
    sqlite3_stmt *stmt_;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_STORE_SQLITE_STATEMENT_H
