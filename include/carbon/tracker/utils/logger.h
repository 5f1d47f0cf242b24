#ifndef CARBON_TRACKER_UTILS_LOGGER_H
#define CARBON_TRACKER_UTILS_LOGGER_H

#ifdef __cplusplus
extern "C" {
#endif
/**
 * Set the global spdlog log level programmatically
 * @param level_str String representation of log level (case insensitive)
 *                  Valid values: "trace", "debug", "info", "warn"/"warning",
 *                  "err"/"error", "critical", "off"
 * @return 0 on success, -1 if level_str is null or empty
 */
int carbon_tracker_set_log_level(const char *level_str);

/**
 * Set the global spdlog log level using integer level
 * @param level 0=trace, 1=debug, 2=info, 3=warn, 4=error, 5=critical, 6=off
 * @return 0 on success, -1 if level is out of range
 */
int carbon_tracker_set_log_level_int(int level);

const char *carbon_tracker_get_log_level_string(void);
int carbon_tracker_get_log_level_int(void);

#ifdef __cplusplus
}

#include <string>

namespace carbon::tracker::logger {
/**
 * Set the log level for the tracker
 * @param level_str String representation of log level
 * @return 0 on success, -1 on failure
 */
int set_log_level(const std::string &level_str);
int set_log_level_int(int level);
std::string get_log_level_string();
int get_log_level_int();

/**
 * Install a stderr logger as the spdlog default so that log output never
 * mixes with data written to stdout.
 */
void init_stderr_logger(const std::string &level_str);
}  // namespace carbon::tracker::logger
#endif

#endif  // CARBON_TRACKER_UTILS_LOGGER_H
