#ifndef CARBON_TRACKER_CARBON_FORMAT_H
#define CARBON_TRACKER_CARBON_FORMAT_H

#include <string>

namespace carbon::tracker {

/** "< 0.01g", "5.68g", "1.000kg" */
std::string format_co2(double grams);

/** "< 0.001 Wh", "0.123 Wh", "12.34 Wh", "1.500 kWh" */
std::string format_energy(double wh);

struct CarbonEquivalents {
    double km_driven;
    double phone_charges;
    double led_light_hours;
    double cups_of_coffee;
    double web_searches;
};

CarbonEquivalents calculate_equivalents(double co2_grams);

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_CARBON_FORMAT_H
