#pragma once

#include <string>

#include "layers/registers/DecodedValue.h"

namespace application {

// How far a sensor crystal has drifted from its maximum towards its minimum
// frequency, in percent (0..100). Reads <channel>_Frequency_0p01Hz,
// <channel>_MinFreq_Hz and <channel>_MaxFreq_Hz; returns 0 when any is
// missing or not a number, or when the range is empty.
double crystalWearPercent(const registers::ValueMap& values, const std::string& channel);

} // namespace application
