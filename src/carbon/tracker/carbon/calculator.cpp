#include <carbon/tracker/carbon/calculator.h>
#include <carbon/tracker/common/constants.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace carbon::tracker {

const FamilyImpact *CarbonResult::find(ModelFamily family) const {
    auto it = std::find_if(
        breakdown.begin(), breakdown.end(),
        [family](const FamilyImpact &f) { return f.family == family; });
    return it == breakdown.end() ? nullptr : &*it;
}

double co2_from_energy(double energy_wh) {
    return (energy_wh / 1000.0) *
           constants::energy::CARBON_INTENSITY_G_PER_KWH;
}

CarbonCalculator::CarbonCalculator()
    : cost_model_(std::make_shared<FlatRateCostModel>()) {}

CarbonCalculator::CarbonCalculator(
    std::shared_ptr<const CostModel> cost_model)
    : cost_model_(std::move(cost_model)) {
    if (!cost_model_) {
        throw std::invalid_argument("CarbonCalculator requires a cost model");
    }
}

void CarbonCalculator::accumulate(CarbonResult &result,
                                  const std::string &model,
                                  std::uint64_t total_tokens,
                                  std::uint64_t output_tokens) const {
    ModelProfile profile = get_model_profile(model);
    double energy =
        cost_model_->request_energy_wh(profile, total_tokens, output_tokens);
    double co2 = co2_from_energy(energy);

    result.energy_wh += energy;
    result.co2_grams += co2;

    auto it = std::find_if(result.breakdown.begin(), result.breakdown.end(),
                           [&](const FamilyImpact &f) {
                               return f.family == profile.family;
                           });
    if (it == result.breakdown.end()) {
        result.breakdown.push_back({profile.family, 0.0, 0.0});
        it = std::prev(result.breakdown.end());
    }
    it->energy_wh += energy;
    it->co2_grams += co2;
}

CarbonResult CarbonCalculator::calculate_session(
    const SessionUsage &session) const {
    CarbonResult result;
    for (const auto &record : session.records) {
        accumulate(result, record.model, record.total_tokens(),
                   record.output_tokens);
    }
    return result;
}

CarbonResult CarbonCalculator::calculate_record_carbon(
    const UsageRecord &record) const {
    CarbonResult result;
    accumulate(result, record.model, record.total_tokens(),
               record.output_tokens);
    return result;
}

CarbonResult CarbonCalculator::calculate_carbon_from_tokens(
    std::uint64_t input_tokens, std::uint64_t output_tokens,
    std::uint64_t cache_creation_tokens, std::uint64_t cache_read_tokens,
    const std::string &model) const {
    CarbonResult result;
    accumulate(result, model,
               input_tokens + output_tokens + cache_creation_tokens +
                   cache_read_tokens,
               output_tokens);
    return result;
}

}  // namespace carbon::tracker
