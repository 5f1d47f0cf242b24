#ifndef CARBON_TRACKER_SYNC_HTTP_TRANSPORT_H
#define CARBON_TRACKER_SYNC_HTTP_TRANSPORT_H

#include <carbon/tracker/common/settings.h>
#include <carbon/tracker/sync/transport.h>

#include <string>
#include <vector>

namespace carbon::tracker {

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * GraphQL-over-HTTPS transport built on libcurl.
 *
 *   upserts          POST <api_url>/graphql/public
 *   organizations    POST <api_url>/graphql (bearer)
 *   token refresh    POST https://<auth_domain>/oauth/token
 *
 * Each call carries the configured timeout; a timeout is a failed call.
 */
class HttpTransport : public RemoteTransport {
   public:
    explicit HttpTransport(const Settings &settings);

    bool upsert_session(const SyncIdentity &identity,
                        const SessionRecord &session,
                        const RequestAuth &auth) override;
    bool upsert_sessions(const SyncIdentity &identity,
                         const std::vector<SessionRecord> &sessions,
                         const RequestAuth &auth) override;
    TokenResponse refresh_token(const std::string &refresh_token) override;
    std::vector<std::string> fetch_organization_ids(
        const std::string &access_token) override;

   private:
    /** @throws SyncError TRANSPORT_ERROR when no response was received */
    HttpResponse post_json(const std::string &url, const std::string &body,
                           const std::vector<std::string> &headers) const;

    /** false on transport failure, non-2xx status or GraphQL errors. */
    bool graphql_ok(const HttpResponse &response) const;

    std::vector<std::string> auth_headers(const RequestAuth &auth) const;

    std::string api_url_;
    std::string auth_domain_;
    std::string client_id_;
    long timeout_seconds_;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_SYNC_HTTP_TRANSPORT_H
