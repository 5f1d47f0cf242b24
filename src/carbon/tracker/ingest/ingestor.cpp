#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/ingest/ingestor.h>
#include <carbon/tracker/parser/project_identifier.h>
#include <carbon/tracker/parser/session_parser.h>
#include <carbon/tracker/parser/transcripts.h>
#include <spdlog/spdlog.h>

#include <unordered_set>

namespace carbon::tracker {

std::optional<SessionRecord> Ingestor::ingest(
    const std::string &transcript_path, const std::string &session_id,
    const std::string &project_path) {
    ProjectIdentifierResolver resolver(
        [this](const std::string &hash) -> std::optional<std::string> {
            return store_.get_project_config(
                hash, constants::config_keys::PROJECT_NAME);
        });
    SessionParser parser(&resolver);

    SessionUsage usage = parser.parse(transcript_path, project_path);
    if (!session_id.empty()) {
        usage.session_id = session_id;
    }
    if (usage.empty()) {
        spdlog::debug("No token usage in {}, not stored", transcript_path);
        return std::nullopt;
    }

    CarbonResult carbon = calculator_.calculate_session(usage);
    const utils::Timestamp now = utils::Clock::now();

    SessionRecord record;
    record.session_id = usage.session_id;
    record.project_path = usage.project_path;
    record.project_identifier = usage.project_identifier;
    record.input_tokens = usage.totals.input_tokens;
    record.output_tokens = usage.totals.output_tokens;
    record.cache_creation_tokens = usage.totals.cache_creation_tokens;
    record.cache_read_tokens = usage.totals.cache_read_tokens;
    record.total_tokens = usage.totals.total_tokens();
    record.energy_wh = carbon.energy_wh;
    record.co2_grams = carbon.co2_grams;
    record.primary_model = usage.primary_model;
    record.created_at = usage.started_at.value_or(now);
    record.updated_at = usage.ended_at.value_or(now);
    record.needs_sync = true;

    store_.upsert_session(record);
    spdlog::info("Saved session {}: {} tokens, {:.3f}g CO2", record.session_id,
                 record.total_tokens, record.co2_grams);
    return record;
}

std::optional<SessionRecord> Ingestor::ingest_session(
    const std::string &session_id, const std::string &project_path) {
    auto transcript = find_transcript_path(settings_, session_id, project_path);
    if (!transcript) {
        spdlog::info("No transcript found for session {}", session_id);
        return std::nullopt;
    }
    return ingest(*transcript, session_id, project_path);
}

std::size_t Ingestor::backfill() {
    auto known_ids = store_.get_all_session_ids();
    std::unordered_set<std::string> known(known_ids.begin(), known_ids.end());

    std::size_t ingested = 0;
    for (const auto &transcript : find_all_transcripts(settings_)) {
        std::string session_id = session_id_from_path(transcript);
        if (known.count(session_id)) {
            continue;
        }
        try {
            if (ingest(transcript, session_id)) {
                ++ingested;
            }
        } catch (const StoreError &e) {
            spdlog::error("Backfill of {} failed: {}", transcript, e.what());
        }
    }
    spdlog::info("Backfilled {} session(s)", ingested);
    return ingested;
}

}  // namespace carbon::tracker
