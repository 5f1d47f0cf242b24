#include <carbon/tracker/carbon/model_registry.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace carbon::tracker {

namespace {

// Throughput and power position by family
constexpr double OPUS_TPS = 40.0;
constexpr double SONNET_TPS = 70.0;
constexpr double HAIKU_TPS = 150.0;
constexpr double OPUS_POWER = 0.9;
constexpr double SONNET_POWER = 0.6;
constexpr double HAIKU_POWER = 0.3;

const std::unordered_map<std::string, ModelProfile> &known_models() {
    static const std::unordered_map<std::string, ModelProfile> models = {
        {"claude-opus-4-5-20251101",
         {"Claude Opus 4.5", ModelFamily::OPUS, 0.030, OPUS_TPS, OPUS_POWER}},
        {"claude-opus-4-20250514",
         {"Claude Opus 4", ModelFamily::OPUS, 0.028, OPUS_TPS, OPUS_POWER}},
        {"claude-3-opus-20240229",
         {"Claude 3 Opus", ModelFamily::OPUS, 0.025, OPUS_TPS, OPUS_POWER}},
        {"claude-sonnet-4-20250514",
         {"Claude Sonnet 4", ModelFamily::SONNET, 0.015, SONNET_TPS,
          SONNET_POWER}},
        {"claude-3-5-sonnet-20241022",
         {"Claude 3.5 Sonnet", ModelFamily::SONNET, 0.014, SONNET_TPS,
          SONNET_POWER}},
        {"claude-3-5-sonnet-20240620",
         {"Claude 3.5 Sonnet", ModelFamily::SONNET, 0.014, SONNET_TPS,
          SONNET_POWER}},
        {"claude-3-sonnet-20240229",
         {"Claude 3 Sonnet", ModelFamily::SONNET, 0.012, SONNET_TPS,
          SONNET_POWER}},
        {"claude-3-5-haiku-20241022",
         {"Claude 3.5 Haiku", ModelFamily::HAIKU, 0.006, HAIKU_TPS,
          HAIKU_POWER}},
        {"claude-3-haiku-20240307",
         {"Claude 3 Haiku", ModelFamily::HAIKU, 0.005, HAIKU_TPS,
          HAIKU_POWER}},
    };
    return models;
}

}  // namespace

const char *to_string(ModelFamily family) {
    switch (family) {
        case ModelFamily::OPUS:
            return "opus";
        case ModelFamily::SONNET:
            return "sonnet";
        case ModelFamily::HAIKU:
            return "haiku";
        case ModelFamily::UNKNOWN:
        default:
            return "unknown";
    }
}

ModelProfile get_model_profile(const std::string &model_id) {
    const auto &models = known_models();
    auto it = models.find(model_id);
    if (it != models.end()) {
        return it->second;
    }

    std::string lower = model_id;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower.find("opus") != std::string::npos) {
        return {"Unknown Model", ModelFamily::OPUS, 0.028, OPUS_TPS,
                OPUS_POWER};
    }
    if (lower.find("sonnet") != std::string::npos) {
        return {"Unknown Model", ModelFamily::SONNET, 0.015, SONNET_TPS,
                SONNET_POWER};
    }
    if (lower.find("haiku") != std::string::npos) {
        return {"Unknown Model", ModelFamily::HAIKU, 0.005, HAIKU_TPS,
                HAIKU_POWER};
    }
    return {"Unknown Model", ModelFamily::UNKNOWN, 0.015, SONNET_TPS,
            SONNET_POWER};
}

}  // namespace carbon::tracker
