#pragma once

#include <optional>
#include <vector>

#include "model/findings.hpp"
#include "signal/waveform.hpp"

namespace comtrade_analyzer::detect {

inline constexpr double kDefaultFrequencyToleranceHz = 1.0;

// Compares the declared line frequency with the expected one. A declared
// frequency of zero is always reported.
std::optional<model::FrequencyError> check_frequency(double declared_frequency, double expected_frequency,
                                                     double tolerance = kDefaultFrequencyToleranceHz);

// Estimates the frequency once per cycle from sign changes of the samples
// (crossing i to crossing i + 2) and reports the cycles deviating from
// nominal_frequency by more than threshold. Each deviation is stamped with
// the time of the cycle's first crossing.
//
// Throws core::AnalysisError(INVALID_REFERENCE) for a non-positive nominal
// frequency or a negative threshold.
std::vector<model::FrequencyDeviation> estimate_frequency_deviations(
    const signal::AnalogWaveform& waveform, double nominal_frequency,
    double threshold = kDefaultFrequencyToleranceHz);

}  // namespace comtrade_analyzer::detect
