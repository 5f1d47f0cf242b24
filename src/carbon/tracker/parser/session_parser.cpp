#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/parser/line_validator.h>
#include <carbon/tracker/parser/path_codec.h>
#include <carbon/tracker/parser/session_parser.h>
#include <carbon/tracker/parser/transcripts.h>
#include <carbon/tracker/utils/file.h>
#include <carbon/tracker/utils/filesystem.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <unordered_set>

namespace carbon::tracker {

std::vector<UsageRecord> SessionParser::parse_file(const std::string &path,
                                                   ParseStats *stats) const {
    std::vector<UsageRecord> records;
    std::ifstream in(path);
    if (!in.is_open()) {
        spdlog::debug("Usage log {} not readable", path);
        return records;
    }

    ParseStats local;
    std::unordered_set<std::string> seen;
    json::JsonParser parser;
    std::string line;
    std::size_t line_no = 0;
    const std::string synthetic_prefix =
        "synthetic-" + fs::path(path).filename().string() + "-";

    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        ++local.lines;

        LineResult result = validate_line(
            parser, line, synthetic_prefix + std::to_string(line_no));
        if (!result.is_valid()) {
            ++local.skipped;
            spdlog::trace("{}:{} skipped: {}", path, line_no, result.reason);
            continue;
        }
        if (!seen.insert(result.record.request_id).second) {
            ++local.duplicates;
            continue;
        }
        records.push_back(std::move(result.record));
    }
    local.records = records.size();

    spdlog::debug("Parsed {}: {} lines, {} records, {} duplicates, {} skipped",
                  path, local.lines, local.records, local.duplicates,
                  local.skipped);
    if (stats) *stats = local;
    return records;
}

SessionUsage SessionParser::parse(const std::string &transcript_path,
                                  const std::string &project_path) const {
    SessionUsage usage;
    usage.session_id = session_id_from_path(transcript_path);
    usage.primary_model = constants::parser::UNKNOWN_MODEL;

    if (!project_path.empty()) {
        usage.project_path = project_path;
    } else {
        usage.project_path = decode_project_dir(
            fs::path(transcript_path).parent_path().filename().string());
    }
    usage.project_identifier =
        resolver_ ? resolver_->resolve(usage.project_path) : usage.project_path;

    std::error_code ec;
    if (!fs::is_regular_file(transcript_path, ec)) {
        spdlog::debug("Transcript {} not found", transcript_path);
        return usage;
    }

    usage.records = parse_file(transcript_path);
    for (const auto &subagent : find_subagent_logs(transcript_path)) {
        auto sub_records = parse_file(subagent);
        std::move(sub_records.begin(), sub_records.end(),
                  std::back_inserter(usage.records));
    }

    for (const auto &record : usage.records) {
        usage.totals += record;

        auto it = std::find_if(
            usage.model_breakdown.begin(), usage.model_breakdown.end(),
            [&](const ModelTokens &m) { return m.model == record.model; });
        if (it == usage.model_breakdown.end()) {
            usage.model_breakdown.push_back({record.model, 0});
            it = std::prev(usage.model_breakdown.end());
        }
        it->tokens += record.total_tokens();

        if (record.timestamp) {
            if (!usage.started_at || *record.timestamp < *usage.started_at) {
                usage.started_at = record.timestamp;
            }
            if (!usage.ended_at || *record.timestamp > *usage.ended_at) {
                usage.ended_at = record.timestamp;
            }
        }
    }

    const ModelTokens *primary = nullptr;
    for (const auto &entry : usage.model_breakdown) {
        if (!primary || entry.tokens > primary->tokens) primary = &entry;
    }
    if (primary) usage.primary_model = primary->model;

    if (!usage.started_at) {
        usage.started_at =
            utils::from_time_t(utils::get_file_creation_time(transcript_path));
    }
    if (!usage.ended_at) {
        usage.ended_at = utils::from_time_t(
            utils::get_file_modification_time(transcript_path));
    }

    return usage;
}

}  // namespace carbon::tracker
