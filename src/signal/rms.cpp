#include "signal/rms.hpp"

#include <cmath>
#include <string>

#include "core/error.hpp"
#include "core/math.hpp"

namespace comtrade_analyzer::signal {

std::vector<double> compute_rms(const std::span<const double> samples, const std::size_t window_size) {
  if (window_size == 0) {
    throw core::AnalysisError(core::error_code::INVALID_WINDOW, "RMS window size must be greater than 0");
  }
  if (window_size > samples.size()) {
    throw core::AnalysisError(core::error_code::INVALID_WINDOW,
                              "RMS window size " + std::to_string(window_size) + " exceeds " +
                                  std::to_string(samples.size()) + " available samples");
  }

  const std::size_t count = samples.size() - window_size + 1;
  std::vector<double> rms(count);
  const double inv_window = 1.0 / static_cast<double>(window_size);

  // Every window is summed independently, no running accumulator.
  for (std::size_t i = 0; i < count; ++i) {
    double sum_squares = 0.0;
    for (std::size_t j = i; j < i + window_size; ++j) {
      sum_squares += core::square(samples[j]);
    }
    rms[i] = std::sqrt(sum_squares * inv_window);
  }

  return rms;
}

RmsSeries rms_series(const std::span<const double> samples, const std::span<const double> time,
                     const std::size_t window_size) {
  if (time.size() != samples.size()) {
    throw core::AnalysisError(core::error_code::INSUFFICIENT_DATA,
                              "time base has " + std::to_string(time.size()) + " entries for " +
                                  std::to_string(samples.size()) + " samples");
  }

  RmsSeries series{};
  series.magnitude = compute_rms(samples, window_size);
  series.time.assign(time.begin() + static_cast<std::ptrdiff_t>(window_size - 1), time.end());
  return series;
}

}  // namespace comtrade_analyzer::signal
