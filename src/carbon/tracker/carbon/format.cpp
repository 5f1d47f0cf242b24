#include <carbon/tracker/carbon/format.h>
#include <fmt/format.h>

namespace carbon::tracker {

namespace {
// grams of CO2 per unit
constexpr double CAR_G_PER_KM = 120.0;
constexpr double PHONE_CHARGE_G = 8.0;
constexpr double LED_HOUR_G = 3.0;
constexpr double COFFEE_CUP_G = 21.0;
constexpr double WEB_SEARCH_G = 0.2;
}  // namespace

std::string format_co2(double grams) {
    if (grams < 0.01) {
        return "< 0.01g";
    }
    if (grams < 1000.0) {
        return fmt::format("{:.2f}g", grams);
    }
    return fmt::format("{:.3f}kg", grams / 1000.0);
}

std::string format_energy(double wh) {
    if (wh < 0.001) {
        return "< 0.001 Wh";
    }
    if (wh < 1.0) {
        return fmt::format("{:.3f} Wh", wh);
    }
    if (wh < 1000.0) {
        return fmt::format("{:.2f} Wh", wh);
    }
    return fmt::format("{:.3f} kWh", wh / 1000.0);
}

CarbonEquivalents calculate_equivalents(double co2_grams) {
    return {co2_grams / CAR_G_PER_KM, co2_grams / PHONE_CHARGE_G,
            co2_grams / LED_HOUR_G, co2_grams / COFFEE_CUP_G,
            co2_grams / WEB_SEARCH_G};
}

}  // namespace carbon::tracker
