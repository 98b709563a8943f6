#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "model/findings.hpp"
#include "signal/rms.hpp"
#include "signal/waveform.hpp"

namespace comtrade_analyzer::detect {

struct VoltageEventOptions {
  double nominal_voltage;
  double ratio;
  std::size_t window_size{50};
};

inline constexpr double kDefaultSagRatio = 0.8;
inline constexpr double kDefaultSwellRatio = 1.1;

// Sags are runs of RMS strictly below nominal * ratio, swells runs strictly
// above it. Event times are RMS right-edge times. No minimum duration is
// imposed; a single RMS value past the threshold is an event.
//
// An empty channel, or one shorter than the window, yields no events.
// Throws core::AnalysisError with INVALID_REFERENCE for a non-positive
// nominal voltage or ratio and INVALID_WINDOW for a zero window.
std::vector<model::VoltageEvent> detect_sags(const signal::AnalogWaveform& waveform, const VoltageEventOptions& options);
std::vector<model::VoltageEvent> detect_swells(const signal::AnalogWaveform& waveform,
                                               const VoltageEventOptions& options);

// Same detection over an RMS series already computed for `channel_id`, so
// sags and swells of one channel share a single RMS pass. The series must
// come from options.window_size; only the threshold fields are checked here.
std::vector<model::VoltageEvent> detect_sags(const std::string& channel_id, const signal::RmsSeries& series,
                                             const VoltageEventOptions& options);
std::vector<model::VoltageEvent> detect_swells(const std::string& channel_id, const signal::RmsSeries& series,
                                               const VoltageEventOptions& options);

}  // namespace comtrade_analyzer::detect
