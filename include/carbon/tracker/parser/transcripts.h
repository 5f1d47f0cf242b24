#ifndef CARBON_TRACKER_PARSER_TRANSCRIPTS_H
#define CARBON_TRACKER_PARSER_TRANSCRIPTS_H

#include <carbon/tracker/common/settings.h>

#include <optional>
#include <string>
#include <vector>

namespace carbon::tracker {

/**
 * Locate `<session_id>.jsonl`. The encoded directory of `project_path` is
 * tried first, then every directory under the projects root.
 */
std::optional<std::string> find_transcript_path(
    const Settings &settings, const std::string &session_id,
    const std::string &project_path = "");

/** Every `*.jsonl` one level below each project directory, sorted. */
std::vector<std::string> find_all_transcripts(const Settings &settings);

/** `<dir>/<session_id>/subagents/agent-*.jsonl` for a primary log. */
std::vector<std::string> find_subagent_logs(const std::string &transcript_path);

std::string session_id_from_path(const std::string &transcript_path);

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_PARSER_TRANSCRIPTS_H
