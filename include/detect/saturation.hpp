#pragma once

#include <cstddef>
#include <vector>

#include "model/findings.hpp"
#include "signal/waveform.hpp"

namespace comtrade_analyzer::detect {

struct SaturationOptions {
  std::size_t window_size{5};
  double flatness_threshold{0.05};
  double high_current_threshold{0.0};
};

// Best-effort CT saturation signature match, not a certified diagnostic.
//
// For every full window the mean absolute sample-to-sample difference is
// divided by the window's peak magnitude. An undistorted sinusoid keeps this
// ratio roughly constant; a clipped or held waveform drives it toward zero.
// A window is flagged when the ratio is below flatness_threshold while the
// peak exceeds high_current_threshold, so quiescent low-current stretches are
// never reported. Adjacent flagged windows merge into one event stamped with
// right-edge times; severity is the largest 1 - ratio / flatness_threshold
// seen in the event.
//
// Throws core::AnalysisError with INVALID_WINDOW when window_size < 2 and
// INVALID_REFERENCE for a non-positive flatness or negative current
// threshold. A channel shorter than the window yields no events.
std::vector<model::SaturationEvent> detect_saturation(const signal::AnalogWaveform& current,
                                                      const SaturationOptions& options);

}  // namespace comtrade_analyzer::detect
