#include "detect/voltage_events.hpp"

#include "core/error.hpp"
#include "signal/run_tracker.hpp"

namespace comtrade_analyzer::detect {

namespace {

void validate_threshold(const VoltageEventOptions& options) {
  if (options.nominal_voltage <= 0.0) {
    throw core::AnalysisError(core::error_code::INVALID_REFERENCE, "nominal voltage must be greater than 0");
  }
  if (options.ratio <= 0.0) {
    throw core::AnalysisError(core::error_code::INVALID_REFERENCE, "threshold ratio must be greater than 0");
  }
}

void validate(const VoltageEventOptions& options) {
  validate_threshold(options);
  if (options.window_size == 0) {
    throw core::AnalysisError(core::error_code::INVALID_WINDOW, "RMS window size must be greater than 0");
  }
}

std::vector<model::VoltageEvent> detect_voltage_events(const std::string& channel_id,
                                                       const signal::RmsSeries& series,
                                                       const VoltageEventOptions& options,
                                                       const model::voltage_event_kind kind) {
  validate_threshold(options);
  if (series.time.size() != series.magnitude.size()) {
    throw core::AnalysisError(core::error_code::INSUFFICIENT_DATA,
                              "RMS series time and magnitude lengths differ for channel '" + channel_id + "'");
  }

  const double threshold = options.nominal_voltage * options.ratio;
  const bool sag = kind == model::voltage_event_kind::SAG;

  const auto runs = signal::find_runs(
      series.magnitude.size(), sag ? signal::run_extreme::MINIMUM : signal::run_extreme::MAXIMUM,
      [&](const std::size_t i) {
        return sag ? series.magnitude[i] < threshold : series.magnitude[i] > threshold;
      },
      [&](const std::size_t i) { return series.magnitude[i]; });

  std::vector<model::VoltageEvent> events;
  events.reserve(runs.size());
  for (const auto& run : runs) {
    events.push_back(
        model::VoltageEvent{kind, channel_id, series.time[run.first], series.time[run.last], run.extreme});
  }
  return events;
}

std::vector<model::VoltageEvent> detect_voltage_events(const signal::AnalogWaveform& waveform,
                                                       const VoltageEventOptions& options,
                                                       const model::voltage_event_kind kind) {
  validate(options);
  if (waveform.samples.size() < options.window_size) {
    return {};
  }
  return detect_voltage_events(waveform.channel_id, signal::rms_series(waveform, options.window_size), options,
                               kind);
}

}  // namespace

std::vector<model::VoltageEvent> detect_sags(const signal::AnalogWaveform& waveform,
                                             const VoltageEventOptions& options) {
  return detect_voltage_events(waveform, options, model::voltage_event_kind::SAG);
}

std::vector<model::VoltageEvent> detect_swells(const signal::AnalogWaveform& waveform,
                                               const VoltageEventOptions& options) {
  return detect_voltage_events(waveform, options, model::voltage_event_kind::SWELL);
}

std::vector<model::VoltageEvent> detect_sags(const std::string& channel_id, const signal::RmsSeries& series,
                                             const VoltageEventOptions& options) {
  return detect_voltage_events(channel_id, series, options, model::voltage_event_kind::SAG);
}

std::vector<model::VoltageEvent> detect_swells(const std::string& channel_id, const signal::RmsSeries& series,
                                               const VoltageEventOptions& options) {
  return detect_voltage_events(channel_id, series, options, model::voltage_event_kind::SWELL);
}

}  // namespace comtrade_analyzer::detect
