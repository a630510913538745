#include "crystal_wear.h"

#include <algorithm>

namespace application {

namespace {

std::optional<double> lookup(const registers::ValueMap& values, const std::string& name) {
    const auto* value = registers::findValue(values, name);
    if (!value) {
        return std::nullopt;
    }
    return registers::numericValue(*value);
}

} // namespace

double crystalWearPercent(const registers::ValueMap& values, const std::string& channel) {
    const auto current = lookup(values, channel + "_Frequency_0p01Hz");
    const auto minimum = lookup(values, channel + "_MinFreq_Hz");
    const auto maximum = lookup(values, channel + "_MaxFreq_Hz");
    if (!current || !minimum || !maximum || *maximum <= *minimum) {
        return 0.0;
    }
    const double usage = (*maximum - *current) / (*maximum - *minimum);
    return std::clamp(usage, 0.0, 1.0) * 100.0;
}

} // namespace application
