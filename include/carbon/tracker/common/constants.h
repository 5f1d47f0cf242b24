#ifndef CARBON_TRACKER_COMMON_CONSTANTS_H
#define CARBON_TRACKER_COMMON_CONSTANTS_H

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace carbon::tracker::constants {
namespace parser {
static constexpr const char *LOG_EXTENSION = ".jsonl";
static constexpr const char *SUBAGENT_DIR = "subagents";
static constexpr const char *SUBAGENT_PREFIX = "agent-";
static constexpr const char *ASSISTANT_TYPE = "assistant";
static constexpr const char *UNKNOWN_MODEL = "unknown";
static constexpr char PATH_FILLER = '-';
// Upper bounds for the encoded-directory search
static constexpr std::size_t MAX_DECODE_SEGMENTS = 64;
static constexpr std::size_t MAX_DECODE_STATES = 4096;
}  // namespace parser

namespace energy {
static constexpr double PUE = 1.2;
static constexpr double CARBON_INTENSITY_G_PER_KWH = 300.0;
static constexpr double TTFT_SECONDS = 0.5;
static constexpr double GPU_POWER_LOW_W = 300.0;
static constexpr double GPU_POWER_HIGH_W = 700.0;
}  // namespace energy

namespace store {
static constexpr const char *DATABASE_BASENAME = "carbon-tracker";
static constexpr const char *DATABASE_EXTENSION = ".db";
static constexpr int BUSY_TIMEOUT_MS = 5000;
extern const char *SQL_SCHEMA;
}  // namespace store

namespace sync {
static constexpr std::size_t BATCH_SIZE = 100;
static constexpr std::chrono::seconds TOKEN_EXPIRY_BUFFER{60};
static constexpr std::chrono::hours ROTATED_REFRESH_TOKEN_LIFETIME{30 * 24};
static constexpr std::chrono::milliseconds DEFAULT_BATCH_DELAY{100};
static constexpr std::chrono::seconds DEFAULT_REQUEST_TIMEOUT{10};
static constexpr const char *DEFAULT_API_URL = "https://api.cnaught.com";
static constexpr const char *PUBLIC_GRAPHQL_PATH = "/graphql/public";
static constexpr const char *PRIVATE_GRAPHQL_PATH = "/graphql";
}  // namespace sync

namespace config_keys {
static constexpr const char *SYNC_ENABLED = "sync_enabled";
static constexpr const char *USER_ID = "claude_code_user_id";
static constexpr const char *USER_NAME = "claude_code_user_name";
static constexpr const char *INSTALLED_AT = "installed_at";
static constexpr const char *ORGANIZATION_ID = "organization_id";
static constexpr const char *ACCESS_TOKEN = "auth_access_token";
static constexpr const char *REFRESH_TOKEN = "auth_refresh_token";
static constexpr const char *ACCESS_TOKEN_EXPIRES_AT =
    "auth_access_token_expires_at";
static constexpr const char *REFRESH_TOKEN_EXPIRES_AT =
    "auth_refresh_token_expires_at";
static constexpr const char *PROJECT_NAME = "project_name";
}  // namespace config_keys
}  // namespace carbon::tracker::constants

#endif  // CARBON_TRACKER_COMMON_CONSTANTS_H
