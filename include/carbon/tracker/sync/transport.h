#ifndef CARBON_TRACKER_SYNC_TRANSPORT_H
#define CARBON_TRACKER_SYNC_TRANSPORT_H

#include <carbon/tracker/store/session_record.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace carbon::tracker {

/** Account the records are delivered under. */
struct SyncIdentity {
    std::string user_id;
    std::string user_name;
};

/** Bearer credentials; empty for the anonymous public endpoint. */
struct RequestAuth {
    std::string access_token;
    std::string organization_id;

    bool anonymous() const { return access_token.empty(); }
};

struct TokenResponse {
    std::string access_token;
    std::chrono::seconds expires_in{0};
    // Set only when the authorization server rotated the refresh token
    std::optional<std::string> refresh_token;
};

/**
 * Request/response contract with the remote accounting service.
 *
 * Upserts report success as a bool and are all-or-nothing per call; they
 * do not throw for network or server failures. The credential calls throw
 * SyncError.
 */
class RemoteTransport {
   public:
    virtual ~RemoteTransport() = default;

    virtual bool upsert_session(const SyncIdentity &identity,
                                const SessionRecord &session,
                                const RequestAuth &auth) = 0;

    /** At most constants::sync::BATCH_SIZE sessions per call. */
    virtual bool upsert_sessions(const SyncIdentity &identity,
                                 const std::vector<SessionRecord> &sessions,
                                 const RequestAuth &auth) = 0;

    virtual TokenResponse refresh_token(const std::string &refresh_token) = 0;

    virtual std::vector<std::string> fetch_organization_ids(
        const std::string &access_token) = 0;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_SYNC_TRANSPORT_H
