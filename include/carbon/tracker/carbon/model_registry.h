#ifndef CARBON_TRACKER_CARBON_MODEL_REGISTRY_H
#define CARBON_TRACKER_CARBON_MODEL_REGISTRY_H

#include <string>

namespace carbon::tracker {

enum class ModelFamily { OPUS, SONNET, HAIKU, UNKNOWN };

const char *to_string(ModelFamily family);

/**
 * Per-model energy profile.
 *  - wh_per_1000_tokens: flat-rate coefficient
 *  - tokens_per_second: output throughput for the inference-time model
 *  - power_fraction: position between the low and high GPU power bound
 */
struct ModelProfile {
    std::string display_name;
    ModelFamily family;
    double wh_per_1000_tokens;
    double tokens_per_second;
    double power_fraction;
};

/**
 * Exact id lookup first, then case-insensitive substring match on the
 * family keyword. Anything else gets the mid-tier UNKNOWN profile.
 */
ModelProfile get_model_profile(const std::string &model_id);

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_CARBON_MODEL_REGISTRY_H
