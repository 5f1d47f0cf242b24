#ifndef CARBON_TRACKER_STORE_MIGRATIONS_H
#define CARBON_TRACKER_STORE_MIGRATIONS_H

#include <carbon/tracker/store/sqlite/database.h>

#include <functional>
#include <string>
#include <vector>

namespace carbon::tracker {

/**
 * One forward-only schema step. `up` must be a no-op when the change is
 * already present so that re-running it is harmless.
 */
struct Migration {
    int version;
    std::string description;
    std::function<void(const SqliteDatabase &)> up;
};

const std::vector<Migration> &default_migrations();

int get_schema_version(const SqliteDatabase &db);
void set_schema_version(const SqliteDatabase &db, int version);

bool column_exists(const SqliteDatabase &db, const std::string &table,
                   const std::string &column);
bool index_exists(const SqliteDatabase &db, const std::string &index);

/**
 * Apply every migration whose version is above the stored one, in order,
 * advancing the stored version after each success. The first failure is
 * logged and stops the run; already-applied steps stay applied.
 *
 * @return Schema version after the run
 * @throws StoreError MIGRATION_ERROR if versions are not strictly increasing
 */
int run_migrations(const SqliteDatabase &db,
                   const std::vector<Migration> &migrations);

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_STORE_MIGRATIONS_H
