#ifndef CARBON_TRACKER_SYNC_ORCHESTRATOR_H
#define CARBON_TRACKER_SYNC_ORCHESTRATOR_H

#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/common/settings.h>
#include <carbon/tracker/store/session_store.h>
#include <carbon/tracker/sync/credentials.h>
#include <carbon/tracker/sync/transport.h>

#include <chrono>
#include <optional>
#include <string>

namespace carbon::tracker {

/**
 * Identity to sync under. std::nullopt unless sync_enabled is "true" and
 * both the user id and display name are stored.
 */
std::optional<SyncIdentity> get_sync_identity(SessionStore &store);

/**
 * Drives delivery of dirty session rows. A row is dirty while needs_sync
 * is set; any upsert makes it dirty again.
 */
class SyncOrchestrator {
   public:
    SyncOrchestrator(
        SessionStore &store, RemoteTransport &transport,
        std::chrono::milliseconds batch_delay =
            constants::sync::DEFAULT_BATCH_DELAY,
        CredentialManager::ClockFn clock = utils::Clock::now);

    /**
     * Deliver one session and clear its flag on success. Transport
     * failures leave the row dirty and return false.
     *
     * @throws SyncError AUTHENTICATION_ERROR when credentials cannot be
     *         refreshed
     */
    bool sync_session(const std::string &session_id);

    /**
     * Deliver dirty rows in batches of up to 100, stopping at the first
     * failed batch. Rows of a failed batch stay dirty.
     *
     * @return Number of sessions delivered
     * @throws SyncError AUTHENTICATION_ERROR as for sync_session
     */
    std::size_t sync_unsynced();

   private:
    /** Anonymous when no tokens are stored. */
    std::optional<RequestAuth> prepare_auth();

    SessionStore &store_;
    RemoteTransport &transport_;
    std::chrono::milliseconds batch_delay_;
    CredentialManager credentials_;
};

/**
 * Background entry points: open the store, sync, close. Every failure,
 * authentication included, is logged and swallowed.
 */
void sync_session_if_enabled(const Settings &settings,
                             RemoteTransport &transport,
                             const std::string &session_id);
void batch_sync_if_enabled(const Settings &settings,
                           RemoteTransport &transport);

/**
 * Foreground entry points for user-run commands.
 *
 * @return false when sync is disabled or a delivery failed; for the batch
 *         form, also when dirty rows remain afterwards
 * @throws SyncError AUTHENTICATION_ERROR when credentials cannot be
 *         refreshed
 * @throws StoreError on database failures
 */
bool sync_session_now(const Settings &settings, RemoteTransport &transport,
                      const std::string &session_id);
bool batch_sync_now(const Settings &settings, RemoteTransport &transport);

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_SYNC_ORCHESTRATOR_H
