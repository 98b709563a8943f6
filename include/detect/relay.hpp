#pragma once

#include <optional>

#include "model/findings.hpp"
#include "signal/waveform.hpp"

namespace comtrade_analyzer::detect {

struct DelayBounds {
  double min_s;
  double max_s;
};

// Locates the first asserted trip sample strictly after reference_time and
// classifies the delay. Any asserted sample at or before reference_time marks
// the operation premature; the later trip, if present, is still reported.
// Without bounds every trip found after the reference is on time.
//
// Throws core::AnalysisError(INVALID_REFERENCE) when reference_time lies
// outside the recorded time span or the bounds are inverted or negative.
model::TripInfo check_relay_operation(const signal::DigitalWaveform& trip, double reference_time,
                                      std::optional<DelayBounds> expected_delay = std::nullopt);

}  // namespace comtrade_analyzer::detect
