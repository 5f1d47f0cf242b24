#include <carbon/tracker/common/constants.h>
#include <carbon/tracker/sync/error.h>
#include <carbon/tracker/sync/http_transport.h>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <yyjson.h>

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <mutex>

namespace carbon::tracker {

namespace {

const char *UPSERT_SESSION_MUTATION =
    "mutation UpsertClaudeCodeSession($input: UpsertClaudeCodeSessionInput!) "
    "{ upsertClaudeCodeSession(input: $input) { id } }";

const char *UPSERT_SESSIONS_MUTATION =
    "mutation UpsertClaudeCodeSessions($input: "
    "UpsertClaudeCodeSessionsInput!) "
    "{ upsertClaudeCodeSessions(input: $input) { id } }";

const char *MY_ORGANIZATIONS_QUERY =
    "query MyOrganizationsForPlugin { myOrganizations { id name } }";

std::size_t write_callback(char *ptr, std::size_t size, std::size_t nmemb,
                           void *userdata) {
    auto *out = static_cast<std::string *>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct MutDocDeleter {
    void operator()(yyjson_mut_doc *doc) const { yyjson_mut_doc_free(doc); }
};
struct DocDeleter {
    void operator()(yyjson_doc *doc) const { yyjson_doc_free(doc); }
};
using MutDocPtr = std::unique_ptr<yyjson_mut_doc, MutDocDeleter>;
using DocPtr = std::unique_ptr<yyjson_doc, DocDeleter>;

std::string write_doc(yyjson_mut_doc *doc) {
    char *json = yyjson_mut_write(doc, 0, nullptr);
    if (!json) {
        throw SyncError(SyncError::Type::TRANSPORT_ERROR,
                        "Failed to serialize request body");
    }
    std::string out(json);
    std::free(json);
    return out;
}

// Session fields shared by the single and batch mutations
yyjson_mut_val *session_fields(yyjson_mut_doc *doc,
                               const SessionRecord &session) {
    yyjson_mut_val *obj = yyjson_mut_obj(doc);
    const std::string &project = session.project_identifier.empty()
                                     ? session.project_path
                                     : session.project_identifier;
    yyjson_mut_obj_add_strcpy(doc, obj, "sessionId",
                              session.session_id.c_str());
    yyjson_mut_obj_add_strcpy(doc, obj, "projectPath", project.c_str());
    yyjson_mut_obj_add_real(doc, obj, "co2Grams", session.co2_grams);
    yyjson_mut_obj_add_uint(doc, obj, "totalInputTokens",
                            session.input_tokens);
    yyjson_mut_obj_add_uint(doc, obj, "totalOutputTokens",
                            session.output_tokens);
    yyjson_mut_obj_add_uint(doc, obj, "totalCacheCreationTokens",
                            session.cache_creation_tokens);
    yyjson_mut_obj_add_uint(doc, obj, "totalCacheReadTokens",
                            session.cache_read_tokens);
    yyjson_mut_obj_add_real(doc, obj, "energyWh", session.energy_wh);
    const std::string started_at = utils::format_iso8601(session.created_at);
    yyjson_mut_obj_add_strcpy(doc, obj, "startedAt", started_at.c_str());
    return obj;
}

yyjson_mut_val *graphql_root(yyjson_mut_doc *doc, const char *query,
                             yyjson_mut_val *input) {
    yyjson_mut_val *root = yyjson_mut_obj(doc);
    yyjson_mut_doc_set_root(doc, root);
    yyjson_mut_obj_add_str(doc, root, "query", query);
    yyjson_mut_val *variables = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_val(doc, variables, "input", input);
    yyjson_mut_obj_add_val(doc, root, "variables", variables);
    return root;
}

}  // namespace

HttpTransport::HttpTransport(const Settings &settings)
    : api_url_(settings.api_url()),
      auth_domain_(settings.auth_domain()),
      client_id_(settings.auth_client_id()),
      timeout_seconds_(static_cast<long>(settings.request_timeout().count())) {
    ensure_curl_initialized();
}

HttpResponse HttpTransport::post_json(
    const std::string &url, const std::string &body,
    const std::vector<std::string> &headers) const {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(
        curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw SyncError(SyncError::Type::TRANSPORT_ERROR,
                        "curl_easy_init failed");
    }

    struct curl_slist *header_list = nullptr;
    header_list = curl_slist_append(header_list,
                                    "Content-Type: application/json");
    for (const auto &header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        throw SyncError(SyncError::Type::TRANSPORT_ERROR,
                        "POST " + url + " failed: " + curl_easy_strerror(res));
    }
    return response;
}

bool HttpTransport::graphql_ok(const HttpResponse &response) const {
    if (response.status < 200 || response.status >= 300) {
        spdlog::warn("API request failed: HTTP {}", response.status);
        return false;
    }
    DocPtr doc(yyjson_read(response.body.data(), response.body.size(), 0));
    yyjson_val *root = doc ? yyjson_doc_get_root(doc.get()) : nullptr;
    if (!yyjson_is_obj(root)) {
        spdlog::warn("API returned a non-JSON body");
        return false;
    }
    yyjson_val *errors = yyjson_obj_get(root, "errors");
    if (yyjson_is_arr(errors) && yyjson_arr_size(errors) > 0) {
        yyjson_val *first = yyjson_arr_get_first(errors);
        const char *message = yyjson_get_str(yyjson_obj_get(first, "message"));
        spdlog::warn("API returned {} error(s): {}", yyjson_arr_size(errors),
                     message ? message : "unknown");
        return false;
    }
    yyjson_val *data = yyjson_obj_get(root, "data");
    return data != nullptr && !yyjson_is_null(data);
}

std::vector<std::string> HttpTransport::auth_headers(
    const RequestAuth &auth) const {
    std::vector<std::string> headers;
    if (!auth.anonymous()) {
        headers.push_back("Authorization: Bearer " + auth.access_token);
        if (!auth.organization_id.empty()) {
            headers.push_back("x-organization-id: " + auth.organization_id);
        }
    }
    return headers;
}

bool HttpTransport::upsert_session(const SyncIdentity &identity,
                                   const SessionRecord &session,
                                   const RequestAuth &auth) {
    MutDocPtr doc(yyjson_mut_doc_new(nullptr));
    yyjson_mut_val *input = session_fields(doc.get(), session);
    yyjson_mut_obj_add_strcpy(doc.get(), input, "claudeCodeUserId",
                              identity.user_id.c_str());
    yyjson_mut_obj_add_strcpy(doc.get(), input, "claudeCodeUserName",
                              identity.user_name.c_str());
    graphql_root(doc.get(), UPSERT_SESSION_MUTATION, input);

    try {
        auto response =
            post_json(api_url_ + constants::sync::PUBLIC_GRAPHQL_PATH,
                      write_doc(doc.get()), auth_headers(auth));
        return graphql_ok(response);
    } catch (const SyncError &e) {
        spdlog::warn("{}", e.what());
        return false;
    }
}

bool HttpTransport::upsert_sessions(const SyncIdentity &identity,
                                    const std::vector<SessionRecord> &sessions,
                                    const RequestAuth &auth) {
    if (sessions.empty()) return true;
    if (sessions.size() > constants::sync::BATCH_SIZE) {
        spdlog::error("Batch size {} exceeds limit of {}", sessions.size(),
                      constants::sync::BATCH_SIZE);
        return false;
    }

    MutDocPtr doc(yyjson_mut_doc_new(nullptr));
    yyjson_mut_val *input = yyjson_mut_obj(doc.get());
    yyjson_mut_obj_add_strcpy(doc.get(), input, "claudeCodeUserId",
                              identity.user_id.c_str());
    yyjson_mut_obj_add_strcpy(doc.get(), input, "claudeCodeUserName",
                              identity.user_name.c_str());
    yyjson_mut_val *list = yyjson_mut_arr(doc.get());
    for (const auto &session : sessions) {
        yyjson_mut_arr_append(list, session_fields(doc.get(), session));
    }
    yyjson_mut_obj_add_val(doc.get(), input, "sessions", list);
    graphql_root(doc.get(), UPSERT_SESSIONS_MUTATION, input);

    try {
        auto response =
            post_json(api_url_ + constants::sync::PUBLIC_GRAPHQL_PATH,
                      write_doc(doc.get()), auth_headers(auth));
        return graphql_ok(response);
    } catch (const SyncError &e) {
        spdlog::warn("{}", e.what());
        return false;
    }
}

TokenResponse HttpTransport::refresh_token(const std::string &refresh_token) {
    if (auth_domain_.empty() || client_id_.empty()) {
        throw SyncError(SyncError::Type::CONFIGURATION_ERROR,
                        "Token refresh needs CARBON_TRACKER_AUTH_DOMAIN and "
                        "CARBON_TRACKER_AUTH_CLIENT_ID");
    }

    MutDocPtr doc(yyjson_mut_doc_new(nullptr));
    yyjson_mut_val *root = yyjson_mut_obj(doc.get());
    yyjson_mut_doc_set_root(doc.get(), root);
    yyjson_mut_obj_add_str(doc.get(), root, "grant_type", "refresh_token");
    yyjson_mut_obj_add_strcpy(doc.get(), root, "client_id",
                              client_id_.c_str());
    yyjson_mut_obj_add_strcpy(doc.get(), root, "refresh_token",
                              refresh_token.c_str());

    auto response = post_json("https://" + auth_domain_ + "/oauth/token",
                              write_doc(doc.get()), {});
    if (response.status < 200 || response.status >= 300) {
        throw SyncError(SyncError::Type::TRANSPORT_ERROR,
                        "Token refresh failed (" +
                            std::to_string(response.status) +
                            "): " + response.body);
    }

    DocPtr parsed(yyjson_read(response.body.data(), response.body.size(), 0));
    yyjson_val *body = parsed ? yyjson_doc_get_root(parsed.get()) : nullptr;
    const char *access = yyjson_get_str(yyjson_obj_get(body, "access_token"));
    yyjson_val *expires_in = yyjson_obj_get(body, "expires_in");
    if (!access || !yyjson_is_num(expires_in)) {
        throw SyncError(SyncError::Type::TRANSPORT_ERROR,
                        "Token refresh response is missing access_token or "
                        "expires_in");
    }

    TokenResponse token;
    token.access_token = access;
    token.expires_in = std::chrono::seconds(
        static_cast<std::int64_t>(yyjson_get_num(expires_in)));
    if (const char *rotated =
            yyjson_get_str(yyjson_obj_get(body, "refresh_token"))) {
        token.refresh_token = std::string(rotated);
    }
    return token;
}

std::vector<std::string> HttpTransport::fetch_organization_ids(
    const std::string &access_token) {
    MutDocPtr doc(yyjson_mut_doc_new(nullptr));
    yyjson_mut_val *root = yyjson_mut_obj(doc.get());
    yyjson_mut_doc_set_root(doc.get(), root);
    yyjson_mut_obj_add_str(doc.get(), root, "query", MY_ORGANIZATIONS_QUERY);

    auto response = post_json(api_url_ + constants::sync::PRIVATE_GRAPHQL_PATH,
                              write_doc(doc.get()),
                              {"Authorization: Bearer " + access_token});
    if (!graphql_ok(response)) {
        throw SyncError(SyncError::Type::TRANSPORT_ERROR,
                        "Organization lookup failed");
    }

    DocPtr parsed(yyjson_read(response.body.data(), response.body.size(), 0));
    yyjson_val *root = parsed ? yyjson_doc_get_root(parsed.get()) : nullptr;
    yyjson_val *data = yyjson_obj_get(root, "data");
    yyjson_val *orgs = yyjson_obj_get(data, "myOrganizations");

    std::vector<std::string> ids;
    std::size_t idx, max;
    yyjson_val *org;
    yyjson_arr_foreach(orgs, idx, max, org) {
        if (const char *id = yyjson_get_str(yyjson_obj_get(org, "id"))) {
            ids.emplace_back(id);
        }
    }
    return ids;
}

}  // namespace carbon::tracker
