#include "detect/saturation.hpp"

#include <cmath>
#include <string>

#include "core/error.hpp"
#include "core/math.hpp"
#include "signal/run_tracker.hpp"

namespace comtrade_analyzer::detect {

namespace {

struct WindowShape {
  double peak;
  double variability;
};

WindowShape measure_window(const std::span<const double> samples, const std::size_t first,
                           const std::size_t window_size) {
  double peak = std::fabs(samples[first]);
  double abs_diff_sum = 0.0;
  for (std::size_t j = first + 1; j < first + window_size; ++j) {
    const double magnitude = std::fabs(samples[j]);
    if (magnitude > peak) {
      peak = magnitude;
    }
    abs_diff_sum += std::fabs(samples[j] - samples[j - 1]);
  }

  if (peak <= 0.0) {
    return WindowShape{0.0, 0.0};
  }
  const double mean_abs_diff = abs_diff_sum / static_cast<double>(window_size - 1);
  return WindowShape{peak, mean_abs_diff / peak};
}

}  // namespace

std::vector<model::SaturationEvent> detect_saturation(const signal::AnalogWaveform& current,
                                                      const SaturationOptions& options) {
  if (options.window_size < 2) {
    throw core::AnalysisError(core::error_code::INVALID_WINDOW, "saturation window size must be at least 2");
  }
  if (options.flatness_threshold <= 0.0) {
    throw core::AnalysisError(core::error_code::INVALID_REFERENCE, "flatness threshold must be greater than 0");
  }
  if (options.high_current_threshold < 0.0) {
    throw core::AnalysisError(core::error_code::INVALID_REFERENCE,
                              "high-current threshold must be greater than or equal to 0");
  }

  if (current.time.size() != current.samples.size()) {
    throw core::AnalysisError(core::error_code::INSUFFICIENT_DATA,
                              "channel '" + current.channel_id + "' does not match its time base");
  }

  std::vector<model::SaturationEvent> events;
  if (current.samples.size() < options.window_size) {
    return events;
  }

  const std::size_t window_count = current.samples.size() - options.window_size + 1;
  std::vector<WindowShape> shapes(window_count);
  for (std::size_t i = 0; i < window_count; ++i) {
    shapes[i] = measure_window(current.samples, i, options.window_size);
  }

  const auto runs = signal::find_runs(
      window_count, signal::run_extreme::MAXIMUM,
      [&](const std::size_t i) {
        return shapes[i].peak > options.high_current_threshold &&
               shapes[i].variability < options.flatness_threshold;
      },
      [&](const std::size_t i) { return core::clamp01(1.0 - (shapes[i].variability / options.flatness_threshold)); });

  const std::size_t edge = options.window_size - 1;
  events.reserve(runs.size());
  for (const auto& run : runs) {
    events.push_back(model::SaturationEvent{current.channel_id, current.time[run.first + edge],
                                            current.time[run.last + edge], run.extreme});
  }
  return events;
}

}  // namespace comtrade_analyzer::detect
