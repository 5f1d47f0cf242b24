#ifndef CARBON_TRACKER_UTILS_FILE_H
#define CARBON_TRACKER_UTILS_FILE_H

#include <ctime>
#include <string>

namespace carbon::tracker::utils {

/**
 * Get the modification time of a file
 * @param file_path Path to the file
 * @return Modification time as time_t, or 0 if file doesn't exist or error
 * occurred
 */
time_t get_file_modification_time(const std::string &file_path);

/**
 * Get the creation (birth) time of a file. Platforms without a birth time
 * report the inode change time instead.
 * @return Creation time as time_t, or 0 on error
 */
time_t get_file_creation_time(const std::string &file_path);

/**
 * Read a whole file into a string.
 * @return false if the file cannot be opened
 */
bool read_file(const std::string &file_path, std::string &out);

}  // namespace carbon::tracker::utils

#endif  // CARBON_TRACKER_UTILS_FILE_H
