#include "detect/frequency.hpp"

#include <cmath>
#include <cstdio>
#include <string>

#include "core/error.hpp"

namespace comtrade_analyzer::detect {

namespace {

int sign_of(const double value) noexcept {
  if (value > 0.0) {
    return 1;
  }
  if (value < 0.0) {
    return -1;
  }
  return 0;
}

}  // namespace

std::optional<model::FrequencyError> check_frequency(const double declared_frequency,
                                                     const double expected_frequency, const double tolerance) {
  if (declared_frequency != 0.0 && std::fabs(declared_frequency - expected_frequency) <= tolerance) {
    return std::nullopt;
  }

  char message[128]{};
  std::snprintf(message, sizeof(message), "Unexpected frequency detected (%g Hz, expected %g +/- %g Hz).",
                declared_frequency, expected_frequency, tolerance);
  return model::FrequencyError{declared_frequency, expected_frequency, tolerance, message};
}

std::vector<model::FrequencyDeviation> estimate_frequency_deviations(const signal::AnalogWaveform& waveform,
                                                                     const double nominal_frequency,
                                                                     const double threshold) {
  if (nominal_frequency <= 0.0) {
    throw core::AnalysisError(core::error_code::INVALID_REFERENCE, "nominal frequency must be greater than 0");
  }
  if (threshold < 0.0) {
    throw core::AnalysisError(core::error_code::INVALID_REFERENCE,
                              "frequency threshold must be greater than or equal to 0");
  }
  if (waveform.time.size() != waveform.samples.size()) {
    throw core::AnalysisError(core::error_code::INSUFFICIENT_DATA,
                              "channel '" + waveform.channel_id + "' does not match its time base");
  }

  // Index i marks a sign change between samples i and i + 1.
  std::vector<std::size_t> crossings;
  for (std::size_t i = 0; i + 1 < waveform.samples.size(); ++i) {
    if (sign_of(waveform.samples[i]) != sign_of(waveform.samples[i + 1])) {
      crossings.push_back(i);
    }
  }

  std::vector<model::FrequencyDeviation> deviations;
  for (std::size_t i = 0; i + 2 < crossings.size(); ++i) {
    const double period = waveform.time[crossings[i + 2]] - waveform.time[crossings[i]];
    if (period <= 0.0) {
      continue;
    }
    const double frequency = 1.0 / period;
    if (std::fabs(frequency - nominal_frequency) > threshold) {
      deviations.push_back(model::FrequencyDeviation{waveform.time[crossings[i]], frequency});
    }
  }

  return deviations;
}

}  // namespace comtrade_analyzer::detect
