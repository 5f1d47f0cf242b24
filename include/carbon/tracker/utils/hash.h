#ifndef CARBON_TRACKER_UTILS_HASH_H
#define CARBON_TRACKER_UTILS_HASH_H

#include <string>

namespace carbon::tracker::utils {

std::string sha256_hex(const std::string &input);

/**
 * First 8 hex characters of SHA-256. Used for project hashes and the
 * per-environment database suffix.
 */
std::string short_hash(const std::string &input);

/**
 * Deterministic account id derived from "hostname:username", formatted as
 * a UUID (8-4-4-4-12). Re-creating the database on the same machine yields
 * the same id.
 */
std::string generate_machine_user_id();

}  // namespace carbon::tracker::utils

#endif  // CARBON_TRACKER_UTILS_HASH_H
