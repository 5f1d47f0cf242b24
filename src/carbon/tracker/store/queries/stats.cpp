#include "queries.h"

namespace carbon::tracker::queries {

AggregateStats query_aggregate_stats(const SqliteDatabase &db,
                                     const std::string &project_identifier) {
    std::string sql =
        "SELECT COUNT(*), "
        "COALESCE(SUM(total_tokens), 0), "
        "COALESCE(SUM(input_tokens), 0), "
        "COALESCE(SUM(output_tokens), 0), "
        "COALESCE(SUM(cache_creation_tokens), 0), "
        "COALESCE(SUM(cache_read_tokens), 0), "
        "COALESCE(SUM(energy_wh), 0), "
        "COALESCE(SUM(co2_grams), 0) "
        "FROM sessions";
    if (!project_identifier.empty()) {
        sql += " WHERE project_identifier = ?";
    }

    SqliteStmt stmt(db, sql.c_str());
    if (!project_identifier.empty()) {
        stmt.bind_text(1, project_identifier);
    }

    AggregateStats stats;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        auto u64 = [&](int col) {
            return static_cast<std::uint64_t>(sqlite3_column_int64(stmt, col));
        };
        stats.total_sessions = u64(0);
        stats.total_tokens = u64(1);
        stats.total_input_tokens = u64(2);
        stats.total_output_tokens = u64(3);
        stats.total_cache_creation_tokens = u64(4);
        stats.total_cache_read_tokens = u64(5);
        stats.total_energy_wh = sqlite3_column_double(stmt, 6);
        stats.total_co2_grams = sqlite3_column_double(stmt, 7);
    }
    return stats;
}

std::vector<DailyStats> query_daily_stats(
    const SqliteDatabase &db, int days, const std::string &project_identifier) {
    std::string sql =
        "SELECT DATE(created_at) AS date, COUNT(*), SUM(total_tokens), "
        "SUM(energy_wh), SUM(co2_grams) "
        "FROM sessions "
        "WHERE created_at >= DATE('now', '-' || ? || ' days')";
    if (!project_identifier.empty()) {
        sql += " AND project_identifier = ?";
    }
    sql += " GROUP BY DATE(created_at) ORDER BY date";

    SqliteStmt stmt(db, sql.c_str());
    stmt.bind_int64(1, days);
    if (!project_identifier.empty()) {
        stmt.bind_text(2, project_identifier);
    }

    std::vector<DailyStats> out;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        DailyStats day;
        day.date = stmt.column_text(0);
        day.sessions = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 1));
        day.tokens = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 2));
        day.energy_wh = sqlite3_column_double(stmt, 3);
        day.co2_grams = sqlite3_column_double(stmt, 4);
        out.push_back(std::move(day));
    }
    return out;
}

std::vector<ProjectStats> query_project_stats(const SqliteDatabase &db,
                                              int days) {
    SqliteStmt stmt(db,
                    "SELECT project_identifier, COUNT(*), SUM(total_tokens), "
                    "SUM(energy_wh), SUM(co2_grams) AS co2 "
                    "FROM sessions "
                    "WHERE created_at >= DATE('now', '-' || ? || ' days') "
                    "GROUP BY project_identifier "
                    "ORDER BY co2 DESC");
    stmt.bind_int64(1, days);

    std::vector<ProjectStats> out;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ProjectStats project;
        project.project_identifier = stmt.column_text(0);
        project.sessions =
            static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 1));
        project.tokens =
            static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 2));
        project.energy_wh = sqlite3_column_double(stmt, 3);
        project.co2_grams = sqlite3_column_double(stmt, 4);
        out.push_back(std::move(project));
    }
    return out;
}

}  // namespace carbon::tracker::queries
