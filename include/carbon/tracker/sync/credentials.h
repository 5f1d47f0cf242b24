#ifndef CARBON_TRACKER_SYNC_CREDENTIALS_H
#define CARBON_TRACKER_SYNC_CREDENTIALS_H

#include <carbon/tracker/store/session_store.h>
#include <carbon/tracker/sync/transport.h>
#include <carbon/tracker/utils/time.h>

#include <functional>
#include <optional>
#include <string>

namespace carbon::tracker {

struct AuthConfig {
    std::string access_token;
    std::string refresh_token;
    utils::Timestamp access_token_expires_at;
    utils::Timestamp refresh_token_expires_at;
    std::string organization_id;
};

/** std::nullopt unless both tokens and both expiries are stored. */
std::optional<AuthConfig> load_auth_config(SessionStore &store);
void save_auth_tokens(SessionStore &store, const AuthConfig &auth);

class CredentialManager {
   public:
    using ClockFn = std::function<utils::Timestamp()>;

    CredentialManager(SessionStore &store, RemoteTransport &transport,
                      ClockFn clock = utils::Clock::now)
        : store_(store), transport_(transport), clock_(std::move(clock)) {}

    /**
     * Return a config whose access token is valid for at least the expiry
     * buffer, refreshing and persisting new tokens when needed.
     *
     * @throws SyncError AUTHENTICATION_ERROR if the refresh token expired;
     *         TRANSPORT_ERROR if the refresh call failed
     */
    AuthConfig refresh_if_needed(const AuthConfig &auth);

    /**
     * The cached organization id, or the first one returned by the remote
     * lookup, which is then cached in the store.
     */
    std::string resolve_organization_id(AuthConfig &auth);

   private:
    SessionStore &store_;
    RemoteTransport &transport_;
    ClockFn clock_;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_SYNC_CREDENTIALS_H
