#ifndef CARBON_TRACKER_PARSER_SESSION_PARSER_H
#define CARBON_TRACKER_PARSER_SESSION_PARSER_H

#include <carbon/tracker/parser/project_identifier.h>
#include <carbon/tracker/parser/usage.h>

#include <string>
#include <vector>

namespace carbon::tracker {

/** Counters for one parsed log file. */
struct ParseStats {
    std::size_t lines = 0;
    std::size_t records = 0;
    std::size_t duplicates = 0;
    std::size_t skipped = 0;
};

class SessionParser {
   public:
    SessionParser() : resolver_(nullptr) {}
    explicit SessionParser(const ProjectIdentifierResolver *resolver)
        : resolver_(resolver) {}

    /**
     * Parse a session's primary log and its subagent logs into one usage
     * summary. A missing file yields an empty summary; malformed lines are
     * skipped.
     *
     * @param transcript_path Primary `<session_id>.jsonl`
     * @param project_path Raw project path; decoded from the parent
     *                     directory name when empty
     */
    SessionUsage parse(const std::string &transcript_path,
                       const std::string &project_path = "") const;

    /**
     * Records of one file, deduplicated by request id within that file.
     * First occurrence wins.
     */
    std::vector<UsageRecord> parse_file(const std::string &path,
                                        ParseStats *stats = nullptr) const;

   private:
    const ProjectIdentifierResolver *resolver_;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_PARSER_SESSION_PARSER_H
