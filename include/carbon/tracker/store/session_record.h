#ifndef CARBON_TRACKER_STORE_SESSION_RECORD_H
#define CARBON_TRACKER_STORE_SESSION_RECORD_H

#include <carbon/tracker/utils/time.h>

#include <cstdint>
#include <string>

namespace carbon::tracker {

/** One persisted accounting row of the sessions table. */
struct SessionRecord {
    std::string session_id;
    std::string project_path;
    std::string project_identifier;
    std::uint64_t input_tokens = 0;
    std::uint64_t output_tokens = 0;
    std::uint64_t cache_creation_tokens = 0;
    std::uint64_t cache_read_tokens = 0;
    std::uint64_t total_tokens = 0;
    double energy_wh = 0.0;
    double co2_grams = 0.0;
    std::string primary_model = "unknown";
    utils::Timestamp created_at;
    utils::Timestamp updated_at;
    bool needs_sync = true;
    // Bumped by every upsert; guards mark_synced against lost updates
    std::int64_t revision = 0;
};

struct AggregateStats {
    std::uint64_t total_sessions = 0;
    std::uint64_t total_tokens = 0;
    std::uint64_t total_input_tokens = 0;
    std::uint64_t total_output_tokens = 0;
    std::uint64_t total_cache_creation_tokens = 0;
    std::uint64_t total_cache_read_tokens = 0;
    double total_energy_wh = 0.0;
    double total_co2_grams = 0.0;
};

struct DailyStats {
    std::string date;  // YYYY-MM-DD
    std::uint64_t sessions = 0;
    std::uint64_t tokens = 0;
    double energy_wh = 0.0;
    double co2_grams = 0.0;
};

struct ProjectStats {
    std::string project_identifier;
    std::uint64_t sessions = 0;
    std::uint64_t tokens = 0;
    double energy_wh = 0.0;
    double co2_grams = 0.0;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_STORE_SESSION_RECORD_H
