#ifndef CARBON_TRACKER_PARSER_USAGE_H
#define CARBON_TRACKER_PARSER_USAGE_H

#include <carbon/tracker/utils/time.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace carbon::tracker {

/** One model-generated request, as read from a usage log line. */
struct UsageRecord {
    std::string request_id;
    std::string model;
    std::uint64_t input_tokens = 0;
    std::uint64_t output_tokens = 0;
    std::uint64_t cache_creation_tokens = 0;
    std::uint64_t cache_read_tokens = 0;
    std::optional<utils::Timestamp> timestamp;

    std::uint64_t total_tokens() const {
        return input_tokens + output_tokens + cache_creation_tokens +
               cache_read_tokens;
    }
};

struct TokenTotals {
    std::uint64_t input_tokens = 0;
    std::uint64_t output_tokens = 0;
    std::uint64_t cache_creation_tokens = 0;
    std::uint64_t cache_read_tokens = 0;

    std::uint64_t total_tokens() const {
        return input_tokens + output_tokens + cache_creation_tokens +
               cache_read_tokens;
    }

    TokenTotals &operator+=(const UsageRecord &record) {
        input_tokens += record.input_tokens;
        output_tokens += record.output_tokens;
        cache_creation_tokens += record.cache_creation_tokens;
        cache_read_tokens += record.cache_read_tokens;
        return *this;
    }
};

/** Token count attributed to one exact model id. */
struct ModelTokens {
    std::string model;
    std::uint64_t tokens = 0;
};

struct SessionUsage {
    std::string session_id;
    std::string project_path;
    std::string project_identifier;
    std::vector<UsageRecord> records;
    TokenTotals totals;
    // Encounter order is kept so that ties resolve to the first model seen
    std::vector<ModelTokens> model_breakdown;
    std::string primary_model;
    std::optional<utils::Timestamp> started_at;
    std::optional<utils::Timestamp> ended_at;

    bool empty() const { return totals.total_tokens() == 0; }
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_PARSER_USAGE_H
