#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "signal/waveform.hpp"

namespace comtrade_analyzer::signal {

struct RmsSeries {
  std::vector<double> time;
  std::vector<double> magnitude;
};

// Sliding-window RMS over every full window ("valid" convolution). Returns
// samples.size() - window_size + 1 values; value i covers samples
// [i, i + window_size). Throws core::AnalysisError(INVALID_WINDOW) when
// window_size is zero or larger than the sample count.
std::vector<double> compute_rms(std::span<const double> samples, std::size_t window_size);

// Same as compute_rms, with each value stamped at the window's right edge,
// time[i + window_size - 1].
RmsSeries rms_series(std::span<const double> samples, std::span<const double> time, std::size_t window_size);

inline RmsSeries rms_series(const AnalogWaveform& waveform, const std::size_t window_size) {
  return rms_series(waveform.samples, waveform.time, window_size);
}

}  // namespace comtrade_analyzer::signal
