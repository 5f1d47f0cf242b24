#include <carbon/tracker/common/constants.h>

namespace carbon::tracker::constants {

namespace store {
// Version-0 layout. Columns added later live in the migration list.
const char *SQL_SCHEMA = R"(
    CREATE TABLE IF NOT EXISTS sessions (
      session_id TEXT PRIMARY KEY,
      project_path TEXT NOT NULL,
      input_tokens INTEGER NOT NULL DEFAULT 0,
      output_tokens INTEGER NOT NULL DEFAULT 0,
      cache_creation_tokens INTEGER NOT NULL DEFAULT 0,
      cache_read_tokens INTEGER NOT NULL DEFAULT 0,
      total_tokens INTEGER NOT NULL DEFAULT 0,
      energy_wh REAL NOT NULL DEFAULT 0,
      co2_grams REAL NOT NULL DEFAULT 0,
      primary_model TEXT NOT NULL DEFAULT 'unknown',
      created_at TEXT NOT NULL,
      updated_at TEXT NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_sessions_created_at ON sessions(created_at);
    CREATE INDEX IF NOT EXISTS idx_sessions_project_path ON sessions(project_path);

    CREATE TABLE IF NOT EXISTS plugin_config (
      key TEXT PRIMARY KEY,
      value TEXT NOT NULL
    );
  )";
}  // namespace store

}  // namespace carbon::tracker::constants
