#ifndef CARBON_TRACKER_INGEST_INGESTOR_H
#define CARBON_TRACKER_INGEST_INGESTOR_H

#include <carbon/tracker/carbon/calculator.h>
#include <carbon/tracker/common/settings.h>
#include <carbon/tracker/store/session_record.h>
#include <carbon/tracker/store/session_store.h>

#include <optional>
#include <string>

namespace carbon::tracker {

/**
 * parse -> carbon -> project identifier -> upsert, for one session at a
 * time. The store handle is borrowed for the duration of a call.
 */
class Ingestor {
   public:
    Ingestor(const Settings &settings, SessionStore &store,
             CarbonCalculator calculator = CarbonCalculator())
        : settings_(settings),
          store_(store),
          calculator_(std::move(calculator)) {}

    /**
     * Ingest one transcript. Sessions without token usage are not stored.
     *
     * @param transcript_path Primary usage log of the session
     * @param session_id Overrides the id derived from the file name
     * @param project_path Raw project path, decoded from the log directory
     *                     when empty
     * @return The row written, or std::nullopt when nothing was stored
     */
    std::optional<SessionRecord> ingest(const std::string &transcript_path,
                                        const std::string &session_id = "",
                                        const std::string &project_path = "");

    /**
     * Locate the transcript of `session_id` under the projects directory
     * and ingest it.
     */
    std::optional<SessionRecord> ingest_session(
        const std::string &session_id, const std::string &project_path = "");

    /**
     * Ingest every transcript whose session is not stored yet.
     * @return Number of sessions written
     */
    std::size_t backfill();

   private:
    const Settings &settings_;
    SessionStore &store_;
    CarbonCalculator calculator_;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_INGEST_INGESTOR_H
