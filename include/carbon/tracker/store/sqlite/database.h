#ifndef CARBON_TRACKER_STORE_SQLITE_DATABASE_H
#define CARBON_TRACKER_STORE_SQLITE_DATABASE_H

#include <carbon/tracker/store/error.h>
#include <sqlite3.h>

#include <string>

namespace carbon::tracker {

/**
 * Owning handle for one SQLite connection. Opening enables WAL journaling
 * and a busy timeout so short-lived readers and a writer can overlap.
 */
class SqliteDatabase {
   public:
    enum class Mode { READ_WRITE, READ_ONLY };

    SqliteDatabase() : db_(nullptr) {}
    explicit SqliteDatabase(const std::string &path,
                            Mode mode = Mode::READ_WRITE);
    ~SqliteDatabase() { close(); }

    SqliteDatabase(const SqliteDatabase &) = delete;
    SqliteDatabase &operator=(const SqliteDatabase &) = delete;
    SqliteDatabase(SqliteDatabase &&other) noexcept;
    SqliteDatabase &operator=(SqliteDatabase &&other) noexcept;

    void open(const std::string &path, Mode mode = Mode::READ_WRITE);
    void close();
    bool is_open() const { return db_ != nullptr; }

    /** Execute one or more statements without results. */
    void exec(const std::string &sql) const;

    sqlite3 *get() const { return db_; }
    const std::string &path() const { return path_; }

   private:
    sqlite3 *db_;
    std::string path_;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_STORE_SQLITE_DATABASE_H
