#ifndef CARBON_TRACKER_STORE_READONLY_H
#define CARBON_TRACKER_STORE_READONLY_H

#include <carbon/tracker/store/session_store.h>
#include <carbon/tracker/utils/filesystem.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>

namespace carbon::tracker {

/**
 * Run `fn` against a read-only store. Returns std::nullopt when the
 * database file does not exist yet or the query fails.
 */
template <typename Fn>
auto query_readonly(const std::string &db_path, Fn &&fn)
    -> std::optional<std::invoke_result_t<Fn, SessionStore &>> {
    std::error_code ec;
    if (!fs::exists(db_path, ec)) {
        return std::nullopt;
    }
    try {
        SessionStore store(db_path, SqliteDatabase::Mode::READ_ONLY);
        return fn(store);
    } catch (const std::exception &e) {
        spdlog::warn("Read-only query on {} failed: {}", db_path, e.what());
        return std::nullopt;
    }
}

/** Open read-write (initializing the schema), run `fn`, close. */
template <typename Fn>
auto with_store(const std::string &db_path, Fn &&fn)
    -> std::invoke_result_t<Fn, SessionStore &> {
    SessionStore store(db_path);
    return fn(store);
}

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_STORE_READONLY_H
