#ifndef CARBON_TRACKER_COMMON_SETTINGS_H
#define CARBON_TRACKER_COMMON_SETTINGS_H

#include <carbon/tracker/common/constants.h>

#include <chrono>
#include <string>

namespace carbon::tracker {

/**
 * Explicit runtime configuration handed to every component. Only
 * from_environment() reads process state; everything else is a plain value.
 */
class Settings {
   public:
    Settings()
        : api_url_(constants::sync::DEFAULT_API_URL),
          request_timeout_(constants::sync::DEFAULT_REQUEST_TIMEOUT),
          batch_delay_(constants::sync::DEFAULT_BATCH_DELAY),
          log_level_("warn") {}

    /**
     * Reads HOME (or USERPROFILE), CARBON_TRACKER_API_URL,
     * CARBON_TRACKER_AUTH_DOMAIN, CARBON_TRACKER_AUTH_CLIENT_ID and
     * CARBON_TRACKER_LOG_LEVEL.
     */
    static Settings from_environment();

    Settings(const Settings&) = default;
    Settings& operator=(const Settings&) = default;
    Settings(Settings&&) = default;
    Settings& operator=(Settings&&) = default;

    // Getter
    inline const std::string& home_dir() const { return home_dir_; }
    std::string claude_dir() const;
    std::string projects_dir() const;
    inline const std::string& api_url() const { return api_url_; }
    inline const std::string& auth_domain() const { return auth_domain_; }
    inline const std::string& auth_client_id() const {
        return auth_client_id_;
    }
    inline std::chrono::seconds request_timeout() const {
        return request_timeout_;
    }
    inline std::chrono::milliseconds batch_delay() const {
        return batch_delay_;
    }
    inline const std::string& log_level() const { return log_level_; }

    /** Empty for the default API URL, "-<hash8>" for any other endpoint. */
    std::string database_suffix() const;
    std::string database_path() const;

    // Setter
    inline Settings& set_home_dir(const std::string& home_dir) {
        home_dir_ = home_dir;
        return *this;
    }
    inline Settings& set_claude_dir(const std::string& claude_dir) {
        claude_dir_ = claude_dir;
        return *this;
    }
    inline Settings& set_projects_dir(const std::string& projects_dir) {
        projects_dir_ = projects_dir;
        return *this;
    }
    inline Settings& set_api_url(const std::string& api_url) {
        api_url_ = api_url;
        return *this;
    }
    inline Settings& set_auth_domain(const std::string& auth_domain) {
        auth_domain_ = auth_domain;
        return *this;
    }
    inline Settings& set_auth_client_id(const std::string& client_id) {
        auth_client_id_ = client_id;
        return *this;
    }
    inline Settings& set_request_timeout(std::chrono::seconds timeout) {
        request_timeout_ = timeout;
        return *this;
    }
    inline Settings& set_batch_delay(std::chrono::milliseconds delay) {
        batch_delay_ = delay;
        return *this;
    }
    inline Settings& set_log_level(const std::string& level) {
        log_level_ = level;
        return *this;
    }

   private:
    std::string home_dir_;
    std::string claude_dir_;
    std::string projects_dir_;
    std::string api_url_;
    std::string auth_domain_;
    std::string auth_client_id_;
    std::chrono::seconds request_timeout_;
    std::chrono::milliseconds batch_delay_;
    std::string log_level_;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_COMMON_SETTINGS_H
