#ifndef CARBON_TRACKER_STORE_SESSION_STORE_H
#define CARBON_TRACKER_STORE_SESSION_STORE_H

#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/store/session_record.h>
#include <carbon/tracker/store/sqlite/database.h>
#include <carbon/tracker/utils/time.h>

#include <optional>
#include <string>
#include <vector>

namespace carbon::tracker {

/**
 * Local accounting store. A handle is meant to live for one logical
 * operation: open, operate, close (on destruction).
 *
 * Opening read-write creates the parent directory, applies the base schema
 * and runs pending migrations. Opening read-only touches nothing.
 */
class SessionStore {
   public:
    explicit SessionStore(
        const std::string &path,
        SqliteDatabase::Mode mode = SqliteDatabase::Mode::READ_WRITE);

    SessionStore(const SessionStore &) = delete;
    SessionStore &operator=(const SessionStore &) = delete;
    SessionStore(SessionStore &&) = default;
    SessionStore &operator=(SessionStore &&) = default;

    // Sessions
    /**
     * Insert or replace a row. On conflict every column except created_at
     * is overwritten, and needs_sync is always set.
     */
    void upsert_session(const SessionRecord &record);
    std::optional<SessionRecord> get_session(const std::string &session_id);
    std::vector<std::string> get_all_session_ids();
    bool session_exists(const std::string &session_id);
    /** @return Number of rows removed */
    std::size_t delete_project_sessions(const std::string &project_identifier);

    // Statistics. An empty project identifier means all projects.
    AggregateStats get_aggregate_stats(
        const std::string &project_identifier = "");
    std::vector<DailyStats> get_daily_stats(
        int days = 7, const std::string &project_identifier = "");
    std::vector<ProjectStats> get_project_stats(int days = 7);

    // Global config
    std::optional<std::string> get_config(const std::string &key);
    void set_config(const std::string &key, const std::string &value);
    void delete_config(const std::string &key);

    // Per-project config
    std::optional<std::string> get_project_config(
        const std::string &project_hash, const std::string &key);
    void set_project_config(const std::string &project_hash,
                            const std::string &key, const std::string &value);
    void delete_project_config(const std::string &project_hash,
                               const std::string &key);

    std::optional<utils::Timestamp> get_installed_at();
    /** Records `now` only if no install time is stored yet. */
    void set_installed_at(utils::Timestamp now = utils::Clock::now());

    // Delivery state
    std::vector<SessionRecord> get_unsynced_sessions(
        std::size_t limit = constants::sync::BATCH_SIZE);
    std::size_t count_unsynced();
    /**
     * Clear needs_sync for the given rows. A row upserted again since it
     * was read (its revision moved on) stays dirty.
     *
     * @return Number of rows cleared
     */
    std::size_t mark_synced(const std::vector<SessionRecord> &records);

    int schema_version();
    const SqliteDatabase &database() const { return db_; }

   private:
    SqliteDatabase db_;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_STORE_SESSION_STORE_H
