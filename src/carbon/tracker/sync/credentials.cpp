#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/sync/credentials.h>
#include <carbon/tracker/sync/error.h>
#include <spdlog/spdlog.h>

namespace carbon::tracker {

using namespace carbon::tracker::constants;

std::optional<AuthConfig> load_auth_config(SessionStore &store) {
    auto access = store.get_config(config_keys::ACCESS_TOKEN);
    auto refresh = store.get_config(config_keys::REFRESH_TOKEN);
    auto access_exp = store.get_config(config_keys::ACCESS_TOKEN_EXPIRES_AT);
    auto refresh_exp = store.get_config(config_keys::REFRESH_TOKEN_EXPIRES_AT);
    if (!access || !refresh || !access_exp || !refresh_exp) {
        return std::nullopt;
    }

    auto access_ts = utils::parse_iso8601(*access_exp);
    auto refresh_ts = utils::parse_iso8601(*refresh_exp);
    if (!access_ts || !refresh_ts) {
        spdlog::warn("Stored token expiry is not a valid timestamp");
        return std::nullopt;
    }

    AuthConfig auth;
    auth.access_token = *access;
    auth.refresh_token = *refresh;
    auth.access_token_expires_at = *access_ts;
    auth.refresh_token_expires_at = *refresh_ts;
    auth.organization_id =
        store.get_config(config_keys::ORGANIZATION_ID).value_or("");
    return auth;
}

void save_auth_tokens(SessionStore &store, const AuthConfig &auth) {
    store.set_config(config_keys::ACCESS_TOKEN, auth.access_token);
    store.set_config(config_keys::REFRESH_TOKEN, auth.refresh_token);
    store.set_config(config_keys::ACCESS_TOKEN_EXPIRES_AT,
                     utils::format_iso8601(auth.access_token_expires_at));
    store.set_config(config_keys::REFRESH_TOKEN_EXPIRES_AT,
                     utils::format_iso8601(auth.refresh_token_expires_at));
}

AuthConfig CredentialManager::refresh_if_needed(const AuthConfig &auth) {
    const utils::Timestamp now = clock_();
    if (now < auth.access_token_expires_at - sync::TOKEN_EXPIRY_BUFFER) {
        return auth;
    }

    if (now >= auth.refresh_token_expires_at) {
        throw SyncError(SyncError::Type::AUTHENTICATION_ERROR,
                        "Refresh token expired. Run `carbon-tracker "
                        "enable-sync` to re-authenticate.");
    }

    spdlog::info("Access token expired, refreshing");
    TokenResponse response = transport_.refresh_token(auth.refresh_token);

    AuthConfig refreshed = auth;
    const utils::Timestamp issued = clock_();
    refreshed.access_token = response.access_token;
    refreshed.access_token_expires_at = issued + response.expires_in;
    if (response.refresh_token && !response.refresh_token->empty()) {
        refreshed.refresh_token = *response.refresh_token;
        refreshed.refresh_token_expires_at =
            issued + sync::ROTATED_REFRESH_TOKEN_LIFETIME;
    }

    save_auth_tokens(store_, refreshed);
    spdlog::info("Token refreshed");
    return refreshed;
}

std::string CredentialManager::resolve_organization_id(AuthConfig &auth) {
    if (!auth.organization_id.empty()) {
        return auth.organization_id;
    }

    auto ids = transport_.fetch_organization_ids(auth.access_token);
    if (ids.empty()) {
        throw SyncError(SyncError::Type::CONFIGURATION_ERROR,
                        "No organizations found for this user");
    }
    auth.organization_id = ids.front();
    store_.set_config(config_keys::ORGANIZATION_ID, auth.organization_id);
    spdlog::debug("Cached organization id {}", auth.organization_id);
    return auth.organization_id;
}

}  // namespace carbon::tracker
