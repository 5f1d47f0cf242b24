#ifndef CARBON_TRACKER_STORE_QUERIES_QUERIES_H
#define CARBON_TRACKER_STORE_QUERIES_QUERIES_H

#include <carbon/tracker/store/error.h>
#include <carbon/tracker/store/session_record.h>
#include <carbon/tracker/store/sqlite/database.h>
#include <carbon/tracker/store/sqlite/statement.h>

#include <optional>
#include <string>
#include <vector>

namespace carbon::tracker::queries {

// Column list shared by every SELECT that yields a SessionRecord
extern const char *SESSION_COLUMNS;
SessionRecord read_session_row(SqliteStmt &stmt);

void upsert_session(const SqliteDatabase &db, const SessionRecord &record);
std::optional<SessionRecord> query_session(const SqliteDatabase &db,
                                           const std::string &session_id);
std::vector<std::string> query_session_ids(const SqliteDatabase &db);
bool query_session_exists(const SqliteDatabase &db,
                          const std::string &session_id);
std::size_t delete_project_sessions(const SqliteDatabase &db,
                                    const std::string &project_identifier);

AggregateStats query_aggregate_stats(const SqliteDatabase &db,
                                     const std::string &project_identifier);
std::vector<DailyStats> query_daily_stats(
    const SqliteDatabase &db, int days, const std::string &project_identifier);
std::vector<ProjectStats> query_project_stats(const SqliteDatabase &db,
                                              int days);

std::optional<std::string> query_config(const SqliteDatabase &db,
                                        const std::string &key);
void upsert_config(const SqliteDatabase &db, const std::string &key,
                   const std::string &value);
void insert_config_if_absent(const SqliteDatabase &db, const std::string &key,
                             const std::string &value);
void delete_config(const SqliteDatabase &db, const std::string &key);

std::optional<std::string> query_project_config(
    const SqliteDatabase &db, const std::string &project_hash,
    const std::string &key);
void upsert_project_config(const SqliteDatabase &db,
                           const std::string &project_hash,
                           const std::string &key, const std::string &value);
void delete_project_config(const SqliteDatabase &db,
                           const std::string &project_hash,
                           const std::string &key);

std::vector<SessionRecord> query_unsynced_sessions(const SqliteDatabase &db,
                                                   std::size_t limit);
std::size_t query_unsynced_count(const SqliteDatabase &db);
std::size_t mark_sessions_synced(const SqliteDatabase &db,
                                 const std::vector<SessionRecord> &records);

}  // namespace carbon::tracker::queries

#endif  // CARBON_TRACKER_STORE_QUERIES_QUERIES_H
