#ifndef CARBON_TRACKER_PARSER_LINE_VALIDATOR_H
#define CARBON_TRACKER_PARSER_LINE_VALIDATOR_H

#include <carbon/tracker/parser/usage.h>
#include <carbon/tracker/utils/json.h>

#include <string>

namespace carbon::tracker {

/**
 * Outcome of validating one usage-log line: either a usable record or a
 * skip with the reason. Never thrown.
 */
struct LineResult {
    enum class Status { VALID, SKIP };

    Status status = Status::SKIP;
    UsageRecord record;
    std::string reason;

    bool is_valid() const { return status == Status::VALID; }

    static LineResult valid(UsageRecord record) {
        LineResult result;
        result.status = Status::VALID;
        result.record = std::move(record);
        return result;
    }

    static LineResult skip(std::string reason) {
        LineResult result;
        result.status = Status::SKIP;
        result.reason = std::move(reason);
        return result;
    }
};

/**
 * Validate a single line against the usage-log schema. Only assistant turns
 * carrying a usage object are VALID. The request id falls back through
 * requestId, uuid and parentMessageId to `synthetic_id`.
 */
LineResult validate_line(json::JsonParser &parser, const std::string &line,
                         const std::string &synthetic_id);

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_PARSER_LINE_VALIDATOR_H
