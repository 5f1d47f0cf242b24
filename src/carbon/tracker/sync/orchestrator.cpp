#include <carbon/tracker/sync/error.h>
#include <carbon/tracker/sync/orchestrator.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <thread>

namespace carbon::tracker {

using namespace carbon::tracker::constants;

std::optional<SyncIdentity> get_sync_identity(SessionStore &store) {
    if (store.get_config(config_keys::SYNC_ENABLED).value_or("") != "true") {
        return std::nullopt;
    }
    auto user_id = store.get_config(config_keys::USER_ID);
    auto user_name = store.get_config(config_keys::USER_NAME);
    if (!user_id || user_id->empty() || !user_name || user_name->empty()) {
        return std::nullopt;
    }
    return SyncIdentity{*user_id, *user_name};
}

SyncOrchestrator::SyncOrchestrator(SessionStore &store,
                                   RemoteTransport &transport,
                                   std::chrono::milliseconds batch_delay,
                                   CredentialManager::ClockFn clock)
    : store_(store),
      transport_(transport),
      batch_delay_(batch_delay),
      credentials_(store, transport, std::move(clock)) {}

std::optional<RequestAuth> SyncOrchestrator::prepare_auth() {
    auto auth = load_auth_config(store_);
    if (!auth) {
        return RequestAuth{};
    }

    try {
        AuthConfig current = credentials_.refresh_if_needed(*auth);
        std::string org_id = credentials_.resolve_organization_id(current);
        return RequestAuth{current.access_token, org_id};
    } catch (const SyncError &e) {
        if (e.type() == SyncError::Type::AUTHENTICATION_ERROR) {
            throw;
        }
        spdlog::warn("Cannot prepare credentials, will retry later: {}",
                     e.what());
        return std::nullopt;
    }
}

bool SyncOrchestrator::sync_session(const std::string &session_id) {
    auto identity = get_sync_identity(store_);
    if (!identity) {
        spdlog::debug("Sync disabled, not delivering {}", session_id);
        return false;
    }

    auto session = store_.get_session(session_id);
    if (!session) {
        spdlog::debug("Session {} not stored, nothing to sync", session_id);
        return false;
    }

    auto auth = prepare_auth();
    if (!auth) {
        return false;
    }

    if (!transport_.upsert_session(*identity, *session, *auth)) {
        spdlog::warn("Delivery of session {} failed, left for retry",
                     session_id);
        return false;
    }
    store_.mark_synced({*session});
    spdlog::info("Synced session {}", session_id);
    return true;
}

std::size_t SyncOrchestrator::sync_unsynced() {
    auto identity = get_sync_identity(store_);
    if (!identity) {
        return 0;
    }

    std::size_t total = 0;
    bool first_call = true;
    while (true) {
        auto batch = store_.get_unsynced_sessions(sync::BATCH_SIZE);
        if (batch.empty()) {
            break;
        }

        if (!first_call && batch_delay_.count() > 0) {
            std::this_thread::sleep_for(batch_delay_);
        }
        first_call = false;

        auto auth = prepare_auth();
        if (!auth) {
            break;
        }

        if (!transport_.upsert_sessions(*identity, batch, *auth)) {
            spdlog::warn("Batch of {} session(s) failed, stopping",
                         batch.size());
            break;
        }
        total += batch.size();
        if (store_.mark_synced(batch) == 0) {
            // Every row changed while in flight; they go out next run
            break;
        }
    }

    if (total > 0) {
        spdlog::info("Batch synced {} session(s)", total);
    }
    return total;
}

void sync_session_if_enabled(const Settings &settings,
                             RemoteTransport &transport,
                             const std::string &session_id) {
    try {
        SessionStore store(settings.database_path());
        SyncOrchestrator orchestrator(store, transport, settings.batch_delay());
        orchestrator.sync_session(session_id);
    } catch (const std::exception &e) {
        spdlog::error("Session sync failed: {}", e.what());
    }
}

void batch_sync_if_enabled(const Settings &settings,
                           RemoteTransport &transport) {
    try {
        SessionStore store(settings.database_path());
        SyncOrchestrator orchestrator(store, transport, settings.batch_delay());
        orchestrator.sync_unsynced();
    } catch (const std::exception &e) {
        spdlog::error("Batch sync failed: {}", e.what());
    }
}

bool sync_session_now(const Settings &settings, RemoteTransport &transport,
                      const std::string &session_id) {
    SessionStore store(settings.database_path());
    if (!get_sync_identity(store)) {
        spdlog::error("Sync is not enabled, run `carbon-tracker enable-sync`");
        return false;
    }
    SyncOrchestrator orchestrator(store, transport, settings.batch_delay());
    return orchestrator.sync_session(session_id);
}

bool batch_sync_now(const Settings &settings, RemoteTransport &transport) {
    SessionStore store(settings.database_path());
    if (!get_sync_identity(store)) {
        spdlog::error("Sync is not enabled, run `carbon-tracker enable-sync`");
        return false;
    }
    SyncOrchestrator orchestrator(store, transport, settings.batch_delay());
    orchestrator.sync_unsynced();
    std::size_t remaining = store.count_unsynced();
    if (remaining > 0) {
        spdlog::warn("{} session(s) still waiting for delivery", remaining);
        return false;
    }
    return true;
}

}  // namespace carbon::tracker
