#ifndef CARBON_TRACKER_CARBON_CALCULATOR_H
#define CARBON_TRACKER_CARBON_CALCULATOR_H

#include <carbon/tracker/carbon/cost_model.h>
#include <carbon/tracker/carbon/model_registry.h>
#include <carbon/tracker/parser/usage.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace carbon::tracker {

struct FamilyImpact {
    ModelFamily family;
    double energy_wh = 0.0;
    double co2_grams = 0.0;
};

struct CarbonResult {
    double energy_wh = 0.0;
    double co2_grams = 0.0;
    // One entry per model family, in first-seen order
    std::vector<FamilyImpact> breakdown;

    double energy_kwh() const { return energy_wh / 1000.0; }
    double co2_kg() const { return co2_grams / 1000.0; }

    const FamilyImpact *find(ModelFamily family) const;
};

/** Wh -> kWh times the fixed grid carbon intensity. */
double co2_from_energy(double energy_wh);

class CarbonCalculator {
   public:
    /** Uses the flat-rate model. */
    CarbonCalculator();
    explicit CarbonCalculator(std::shared_ptr<const CostModel> cost_model);

    /**
     * Sum over every retained request, grouped by model family. Two model
     * ids of the same family share one breakdown entry.
     */
    CarbonResult calculate_session(const SessionUsage &session) const;

    CarbonResult calculate_record_carbon(const UsageRecord &record) const;

    CarbonResult calculate_carbon_from_tokens(
        std::uint64_t input_tokens, std::uint64_t output_tokens,
        std::uint64_t cache_creation_tokens = 0,
        std::uint64_t cache_read_tokens = 0,
        const std::string &model = "unknown") const;

    const CostModel &cost_model() const { return *cost_model_; }

   private:
    void accumulate(CarbonResult &result, const std::string &model,
                    std::uint64_t total_tokens,
                    std::uint64_t output_tokens) const;

    std::shared_ptr<const CostModel> cost_model_;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_CARBON_CALCULATOR_H
