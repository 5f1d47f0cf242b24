#include <carbon/tracker/common/settings.h>
#include <carbon/tracker/utils/filesystem.h>
#include <carbon/tracker/utils/hash.h>

#include <cstdlib>

namespace carbon::tracker {

namespace {
std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return value;
    }
    return fallback;
}
}  // namespace

Settings Settings::from_environment() {
    Settings settings;
    std::string home = env_or("HOME", env_or("USERPROFILE", ""));
    settings.set_home_dir(home)
        .set_api_url(env_or("CARBON_TRACKER_API_URL",
                            constants::sync::DEFAULT_API_URL))
        .set_auth_domain(env_or("CARBON_TRACKER_AUTH_DOMAIN", ""))
        .set_auth_client_id(env_or("CARBON_TRACKER_AUTH_CLIENT_ID", ""))
        .set_log_level(env_or("CARBON_TRACKER_LOG_LEVEL", "warn"));
    return settings;
}

std::string Settings::claude_dir() const {
    if (!claude_dir_.empty()) {
        return claude_dir_;
    }
    return (fs::path(home_dir_) / ".claude").string();
}

std::string Settings::projects_dir() const {
    if (!projects_dir_.empty()) {
        return projects_dir_;
    }
    return (fs::path(claude_dir()) / "projects").string();
}

std::string Settings::database_suffix() const {
    if (api_url_.empty() || api_url_ == constants::sync::DEFAULT_API_URL) {
        return "";
    }
    return "-" + utils::short_hash(api_url_);
}

std::string Settings::database_path() const {
    std::string name = std::string(constants::store::DATABASE_BASENAME) +
                       database_suffix() +
                       constants::store::DATABASE_EXTENSION;
    return (fs::path(claude_dir()) / name).string();
}

}  // namespace carbon::tracker
