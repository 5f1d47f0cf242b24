#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/store/sqlite/database.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace carbon::tracker {

SqliteDatabase::SqliteDatabase(const std::string &path, Mode mode)
    : db_(nullptr) {
    open(path, mode);
}

SqliteDatabase::SqliteDatabase(SqliteDatabase &&other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)) {}

SqliteDatabase &SqliteDatabase::operator=(SqliteDatabase &&other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

void SqliteDatabase::open(const std::string &path, Mode mode) {
    close();
    int flags = mode == Mode::READ_ONLY
                    ? SQLITE_OPEN_READONLY
                    : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        close();
        throw StoreError(StoreError::Type::DATABASE_ERROR,
                         "Cannot open database " + path + ": " + msg);
    }
    path_ = path;
    sqlite3_busy_timeout(db_, constants::store::BUSY_TIMEOUT_MS);
    if (mode == Mode::READ_WRITE) {
        exec("PRAGMA journal_mode=WAL;");
    }
    spdlog::debug("Opened database {} ({})", path,
                  mode == Mode::READ_ONLY ? "read-only" : "read-write");
}

void SqliteDatabase::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteDatabase::exec(const std::string &sql) const {
    char *err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StoreError(StoreError::Type::DATABASE_ERROR,
                         "Failed to execute SQL: " + msg);
    }
}

}  // namespace carbon::tracker
