#ifndef CARBON_TRACKER_UTILS_FILESYSTEM_H
#define CARBON_TRACKER_UTILS_FILESYSTEM_H

// C++17 is required, so std::filesystem is always available
#include <filesystem>
namespace fs = std::filesystem;

#endif  // CARBON_TRACKER_UTILS_FILESYSTEM_H
