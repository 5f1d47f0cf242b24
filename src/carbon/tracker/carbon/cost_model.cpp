#include <carbon/tracker/carbon/cost_model.h>
#include <carbon/tracker/common/constants.h>

#include <algorithm>
#include <stdexcept>

namespace carbon::tracker {

using namespace carbon::tracker::constants::energy;

double FlatRateCostModel::request_energy_wh(const ModelProfile &profile,
                                            std::uint64_t total_tokens,
                                            std::uint64_t) const {
    return (static_cast<double>(total_tokens) / 1000.0) *
           profile.wh_per_1000_tokens * PUE;
}

double InferenceTimeCostModel::gpu_power_watts(const ModelProfile &profile) {
    double fraction = std::clamp(profile.power_fraction, 0.0, 1.0);
    return GPU_POWER_LOW_W + (GPU_POWER_HIGH_W - GPU_POWER_LOW_W) * fraction;
}

double InferenceTimeCostModel::request_energy_wh(
    const ModelProfile &profile, std::uint64_t,
    std::uint64_t output_tokens) const {
    double seconds = TTFT_SECONDS;
    if (profile.tokens_per_second > 0) {
        seconds += static_cast<double>(output_tokens) /
                   profile.tokens_per_second;
    }
    return (seconds / 3600.0) * gpu_power_watts(profile) * PUE;
}

std::shared_ptr<const CostModel> make_cost_model(const std::string &name) {
    if (name.empty() || name == "flat") {
        return std::make_shared<FlatRateCostModel>();
    }
    if (name == "inference-time") {
        return std::make_shared<InferenceTimeCostModel>();
    }
    throw std::invalid_argument("Unknown cost model: " + name);
}

}  // namespace carbon::tracker
