#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/store/migrations.h>
#include <carbon/tracker/store/session_store.h>
#include <carbon/tracker/utils/filesystem.h>
#include <spdlog/spdlog.h>

#include <system_error>

#include "queries/queries.h"

namespace carbon::tracker {

namespace {
void init_schema(const SqliteDatabase &db) {
    db.exec(constants::store::SQL_SCHEMA);
    int version = run_migrations(db, default_migrations());
    spdlog::debug("Schema ready at version {}", version);
}
}  // namespace

SessionStore::SessionStore(const std::string &path,
                           SqliteDatabase::Mode mode) {
    if (mode == SqliteDatabase::Mode::READ_WRITE) {
        fs::path parent = fs::path(path).parent_path();
        std::error_code ec;
        if (!parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                throw StoreError(StoreError::Type::DATABASE_ERROR,
                                 "Cannot create " + parent.string() + ": " +
                                     ec.message());
            }
        }
    }
    db_.open(path, mode);
    if (mode == SqliteDatabase::Mode::READ_WRITE) {
        init_schema(db_);
    }
}

void SessionStore::upsert_session(const SessionRecord &record) {
    queries::upsert_session(db_, record);
}

std::optional<SessionRecord> SessionStore::get_session(
    const std::string &session_id) {
    return queries::query_session(db_, session_id);
}

std::vector<std::string> SessionStore::get_all_session_ids() {
    return queries::query_session_ids(db_);
}

bool SessionStore::session_exists(const std::string &session_id) {
    return queries::query_session_exists(db_, session_id);
}

std::size_t SessionStore::delete_project_sessions(
    const std::string &project_identifier) {
    std::size_t removed =
        queries::delete_project_sessions(db_, project_identifier);
    spdlog::info("Removed {} session(s) of project {}", removed,
                 project_identifier);
    return removed;
}

AggregateStats SessionStore::get_aggregate_stats(
    const std::string &project_identifier) {
    return queries::query_aggregate_stats(db_, project_identifier);
}

std::vector<DailyStats> SessionStore::get_daily_stats(
    int days, const std::string &project_identifier) {
    return queries::query_daily_stats(db_, days, project_identifier);
}

std::vector<ProjectStats> SessionStore::get_project_stats(int days) {
    return queries::query_project_stats(db_, days);
}

std::optional<std::string> SessionStore::get_config(const std::string &key) {
    return queries::query_config(db_, key);
}

void SessionStore::set_config(const std::string &key,
                              const std::string &value) {
    queries::upsert_config(db_, key, value);
}

void SessionStore::delete_config(const std::string &key) {
    queries::delete_config(db_, key);
}

std::optional<std::string> SessionStore::get_project_config(
    const std::string &project_hash, const std::string &key) {
    return queries::query_project_config(db_, project_hash, key);
}

void SessionStore::set_project_config(const std::string &project_hash,
                                      const std::string &key,
                                      const std::string &value) {
    queries::upsert_project_config(db_, project_hash, key, value);
}

void SessionStore::delete_project_config(const std::string &project_hash,
                                         const std::string &key) {
    queries::delete_project_config(db_, project_hash, key);
}

std::optional<utils::Timestamp> SessionStore::get_installed_at() {
    auto value = get_config(constants::config_keys::INSTALLED_AT);
    if (!value) return std::nullopt;
    return utils::parse_iso8601(*value);
}

void SessionStore::set_installed_at(utils::Timestamp now) {
    queries::insert_config_if_absent(db_, constants::config_keys::INSTALLED_AT,
                                     utils::format_iso8601(now));
}

std::vector<SessionRecord> SessionStore::get_unsynced_sessions(
    std::size_t limit) {
    return queries::query_unsynced_sessions(db_, limit);
}

std::size_t SessionStore::count_unsynced() {
    return queries::query_unsynced_count(db_);
}

std::size_t SessionStore::mark_synced(
    const std::vector<SessionRecord> &records) {
    return queries::mark_sessions_synced(db_, records);
}

int SessionStore::schema_version() { return get_schema_version(db_); }

}  // namespace carbon::tracker
