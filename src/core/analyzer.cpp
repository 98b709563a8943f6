#include "core/analyzer.hpp"

#include <iostream>
#include <string>
#include <utility>

#include "detect/frequency.hpp"
#include "detect/relay.hpp"
#include "detect/saturation.hpp"
#include "detect/voltage_events.hpp"
#include "signal/rms.hpp"
#include "signal/waveform.hpp"

namespace comtrade_analyzer::core {
namespace {

detect::VoltageEventOptions sag_options(const AnalyzerConfig& config, const double nominal_voltage) {
  return detect::VoltageEventOptions{nominal_voltage, config.sag_ratio, config.rms_window_size};
}

detect::VoltageEventOptions swell_options(const AnalyzerConfig& config, const double nominal_voltage) {
  return detect::VoltageEventOptions{nominal_voltage, config.swell_ratio, config.rms_window_size};
}

detect::SaturationOptions saturation_options(const AnalyzerConfig& config) {
  return detect::SaturationOptions{config.saturation.window_size, config.saturation.flatness_threshold,
                                   config.saturation.high_current_threshold};
}

std::optional<detect::DelayBounds> delay_bounds(const AnalyzerConfig& config) {
  if (!config.relay.bounds_enabled) {
    return std::nullopt;
  }
  return detect::DelayBounds{config.relay.min_delay_s, config.relay.max_delay_s};
}

// Throws INSUFFICIENT_DATA when a requested channel is shorter than the
// detector window it feeds.
void require_samples(const std::string& channel_id, const std::size_t sample_count, const std::size_t window_size,
                     const char* window_name) {
  if (sample_count < window_size) {
    throw AnalysisError(error_code::INSUFFICIENT_DATA,
                        "channel '" + channel_id + "' has " + std::to_string(sample_count) + " samples, fewer than the " +
                            window_name + " of " + std::to_string(window_size));
  }
}

template <typename Stage>
void run_stage(FaultReport& report, const char* stage, const std::string& channel_id, Stage&& body) {
  try {
    body();
  } catch (const AnalysisError& ex) {
    std::cerr << "[analyzer] " << stage << " on '" << channel_id << "' skipped: " << ex.what() << '\n';
    report.errors.push_back(StageError{stage, channel_id, ex.code(), ex.what()});
  }
}

}  // namespace

FaultAnalyzer::FaultAnalyzer(AnalyzerConfig config) : config_(std::move(config)) {}

FaultReport FaultAnalyzer::analyze(const model::Recording& recording, const FaultRequest& request) const {
  FaultReport report{};

  run_stage(report, "voltage", request.voltage_channel, [&] {
    const auto voltage = signal::analog_waveform(recording, request.voltage_channel);
    require_samples(voltage.channel_id, voltage.samples.size(), config_.rms_window_size, "RMS window");
    const signal::RmsSeries rms = signal::rms_series(voltage, config_.rms_window_size);
    report.sags = detect::detect_sags(voltage.channel_id, rms, sag_options(config_, request.nominal_voltage));
    report.swells = detect::detect_swells(voltage.channel_id, rms, swell_options(config_, request.nominal_voltage));
    report.frequency_deviations = detect::estimate_frequency_deviations(
        voltage, config_.expected_frequency_hz, config_.frequency_tolerance_hz);
  });

  run_stage(report, "relay", request.trip_channel, [&] {
    const auto trip = signal::digital_waveform(recording, request.trip_channel);
    if (report.sags.empty()) {
      return;
    }
    report.trip = detect::check_relay_operation(trip, report.sags.front().start_time, delay_bounds(config_));
  });

  run_stage(report, "saturation", request.current_channel, [&] {
    const auto current = signal::analog_waveform(recording, request.current_channel);
    require_samples(current.channel_id, current.samples.size(), config_.saturation.window_size,
                    "saturation window");
    report.saturation = detect::detect_saturation(current, saturation_options(config_));
  });

  return report;
}

std::vector<GridSearchEntry> FaultAnalyzer::grid_search(const model::Recording& recording,
                                                        const double nominal_voltage) const {
  std::vector<GridSearchEntry> entries;
  const auto& analog = recording.analog_channels();

  // Each channel is analyzed once; pairs reuse the results.
  std::vector<std::vector<model::VoltageEvent>> sags(analog.size());
  std::vector<std::optional<std::vector<model::SaturationEvent>>> saturation(analog.size());
  for (std::size_t v = 0; v < analog.size(); ++v) {
    sags[v] = detect::detect_sags(signal::AnalogWaveform{analog[v].id, analog[v].samples, recording.time()},
                                  sag_options(config_, nominal_voltage));
  }

  for (std::size_t v = 0; v < analog.size(); ++v) {
    if (sags[v].empty()) {
      continue;
    }

    const model::VoltageEvent& sag = sags[v].front();
    std::vector<model::TripInfo> trips;
    for (const auto& digital : recording.digital_channels()) {
      model::TripInfo trip = detect::check_relay_operation(
          signal::DigitalWaveform{digital.id, digital.samples, recording.time()}, sag.start_time,
          delay_bounds(config_));
      if (trip.trip_time.has_value()) {
        trips.push_back(std::move(trip));
      }
    }

    for (std::size_t c = 0; c < analog.size(); ++c) {
      if (c == v) {
        continue;
      }
      if (!saturation[c].has_value()) {
        saturation[c] = detect::detect_saturation(
            signal::AnalogWaveform{analog[c].id, analog[c].samples, recording.time()}, saturation_options(config_));
      }
      entries.push_back(GridSearchEntry{analog[v].id, analog[c].id, sag, *saturation[c], trips});
    }
  }

  return entries;
}

}  // namespace comtrade_analyzer::core
