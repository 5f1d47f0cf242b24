#ifndef CARBON_TRACKER_CARBON_COST_MODEL_H
#define CARBON_TRACKER_CARBON_COST_MODEL_H

#include <carbon/tracker/carbon/model_registry.h>

#include <cstdint>
#include <memory>
#include <string>

namespace carbon::tracker {

/**
 * Energy estimate for one request. Implementations must be stateless so a
 * single instance can be shared between calculators.
 */
class CostModel {
   public:
    virtual ~CostModel() = default;

    virtual std::string name() const = 0;

    /**
     * @param profile Profile of the model that served the request
     * @param total_tokens Sum of all four token counts
     * @param output_tokens Generated tokens
     * @return Energy in Wh, PUE included
     */
    virtual double request_energy_wh(const ModelProfile &profile,
                                     std::uint64_t total_tokens,
                                     std::uint64_t output_tokens) const = 0;
};

/** tokens / 1000 * Wh-per-1000 * PUE */
class FlatRateCostModel : public CostModel {
   public:
    std::string name() const override { return "flat"; }
    double request_energy_wh(const ModelProfile &profile,
                             std::uint64_t total_tokens,
                             std::uint64_t output_tokens) const override;
};

/**
 * (TTFT + output / TPS) seconds at an interpolated GPU power, times PUE.
 * The TTFT term is paid once per request.
 */
class InferenceTimeCostModel : public CostModel {
   public:
    std::string name() const override { return "inference-time"; }
    double request_energy_wh(const ModelProfile &profile,
                             std::uint64_t total_tokens,
                             std::uint64_t output_tokens) const override;

    static double gpu_power_watts(const ModelProfile &profile);
};

std::shared_ptr<const CostModel> make_cost_model(const std::string &name);

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_CARBON_COST_MODEL_H
