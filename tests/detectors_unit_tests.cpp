#include <cmath>
#include <cstdint>
#include <iostream>
#include <numbers>
#include <optional>
#include <vector>

#include "core/error.hpp"
#include "detect/frequency.hpp"
#include "detect/relay.hpp"
#include "detect/saturation.hpp"
#include "detect/voltage_events.hpp"
#include "signal/rms.hpp"
#include "signal/run_tracker.hpp"
#include "signal/waveform.hpp"

using comtrade_analyzer::core::AnalysisError;
using comtrade_analyzer::core::error_code;
using comtrade_analyzer::detect::DelayBounds;
using comtrade_analyzer::detect::SaturationOptions;
using comtrade_analyzer::detect::VoltageEventOptions;
using comtrade_analyzer::detect::check_frequency;
using comtrade_analyzer::detect::check_relay_operation;
using comtrade_analyzer::detect::detect_sags;
using comtrade_analyzer::detect::detect_saturation;
using comtrade_analyzer::detect::detect_swells;
using comtrade_analyzer::detect::estimate_frequency_deviations;
using comtrade_analyzer::model::trip_classification;
using comtrade_analyzer::signal::AnalogWaveform;
using comtrade_analyzer::signal::DigitalWaveform;
using comtrade_analyzer::signal::RunTracker;
using comtrade_analyzer::signal::compute_rms;
using comtrade_analyzer::signal::rms_series;
using comtrade_analyzer::signal::run_extreme;
using comtrade_analyzer::signal::run_state;

namespace {

bool almost_equal(double a, double b, double epsilon = 1e-9) {
  return std::fabs(a - b) <= epsilon;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::vector<double> make_time(std::size_t count, double rate_hz) {
  std::vector<double> time(count);
  for (std::size_t i = 0; i < count; ++i) {
    time[i] = static_cast<double>(i) / rate_hz;
  }
  return time;
}

std::vector<double> make_sine(const std::vector<double>& time, double amplitude, double frequency_hz,
                              double phase = 0.0) {
  std::vector<double> samples(time.size());
  for (std::size_t i = 0; i < time.size(); ++i) {
    samples[i] = amplitude * std::sin((2.0 * std::numbers::pi * frequency_hz * time[i]) + phase);
  }
  return samples;
}

template <typename Fn>
std::optional<error_code> error_code_of(Fn&& fn) {
  try {
    fn();
  } catch (const AnalysisError& ex) {
    return ex.code();
  }
  return std::nullopt;
}

int test_rms_output_length() {
  const std::vector<double> samples(100, 1.0);
  for (const std::size_t window : {std::size_t{1}, std::size_t{10}, std::size_t{100}}) {
    if (compute_rms(samples, window).size() != samples.size() - window + 1) {
      return fail("test_rms_output_length", "unexpected RMS series length");
    }
  }
  return 0;
}

int test_rms_full_cycle_matches_sine_rms() {
  // 16 samples per cycle, so every 16-sample window spans exactly one period.
  const auto time = make_time(960, 960.0);
  const auto samples = make_sine(time, 10.0, 60.0);
  const auto rms = compute_rms(samples, 16);
  for (const double value : rms) {
    if (!almost_equal(value, 10.0 / std::numbers::sqrt2, 1e-9)) {
      return fail("test_rms_full_cycle_matches_sine_rms", "RMS of a full cycle should equal A / sqrt(2)");
    }
  }
  return 0;
}

int test_rms_rejects_invalid_window() {
  const std::vector<double> empty{};
  const std::vector<double> three{1.0, 2.0, 3.0};

  if (error_code_of([&] { (void)compute_rms(empty, 5); }) != error_code::INVALID_WINDOW) {
    return fail("test_rms_rejects_invalid_window", "empty input with window 5 should be INVALID_WINDOW");
  }
  if (error_code_of([&] { (void)compute_rms(three, 0); }) != error_code::INVALID_WINDOW) {
    return fail("test_rms_rejects_invalid_window", "window 0 should be INVALID_WINDOW");
  }
  if (error_code_of([&] { (void)compute_rms(three, 4); }) != error_code::INVALID_WINDOW) {
    return fail("test_rms_rejects_invalid_window", "window larger than input should be INVALID_WINDOW");
  }
  return 0;
}

int test_rms_series_uses_right_edge_time() {
  const auto time = make_time(10, 100.0);
  const std::vector<double> samples(10, 2.0);
  const auto series = rms_series(samples, time, 4);
  if (series.time.size() != 7 || series.magnitude.size() != 7) {
    return fail("test_rms_series_uses_right_edge_time", "series length mismatch");
  }
  if (!almost_equal(series.time.front(), time[3]) || !almost_equal(series.time.back(), time[9])) {
    return fail("test_rms_series_uses_right_edge_time", "series should be stamped at window right edges");
  }
  if (!almost_equal(series.magnitude.front(), 2.0)) {
    return fail("test_rms_series_uses_right_edge_time", "RMS of a constant should be the constant");
  }
  return 0;
}

int test_run_tracker_transitions() {
  RunTracker tracker(run_extreme::MINIMUM);
  const bool active[] = {false, true, true, false, true};
  const double magnitude[] = {0.0, 5.0, 3.0, 0.0, 7.0};

  for (std::size_t i = 0; i < 5; ++i) {
    tracker.sample(i, active[i], magnitude[i]);
  }
  if (tracker.state() != run_state::INSIDE_RUN) {
    return fail("test_run_tracker_transitions", "tracker should be inside the trailing run");
  }
  tracker.finish();
  if (tracker.state() != run_state::OUTSIDE_RUN) {
    return fail("test_run_tracker_transitions", "finish() should close the open run");
  }

  const auto& runs = tracker.runs();
  if (runs.size() != 2) {
    return fail("test_run_tracker_transitions", "expected two runs");
  }
  if (runs[0].first != 1 || runs[0].last != 2 || !almost_equal(runs[0].extreme, 3.0)) {
    return fail("test_run_tracker_transitions", "first run bounds or minimum mismatch");
  }
  if (runs[1].first != 4 || runs[1].last != 4 || !almost_equal(runs[1].extreme, 7.0)) {
    return fail("test_run_tracker_transitions", "trailing run bounds mismatch");
  }
  return 0;
}

int test_sags_none_when_above_threshold() {
  const auto time = make_time(1000, 1000.0);
  const std::vector<double> samples(1000, 120.0);
  const AnalogWaveform waveform{"VA", samples, time};

  if (!detect_sags(waveform, VoltageEventOptions{120.0, 0.8, 1}).empty()) {
    return fail("test_sags_none_when_above_threshold", "steady nominal voltage should have no sags");
  }
  return 0;
}

int test_sag_on_stepped_magnitude() {
  const auto time = make_time(1000, 1000.0);
  std::vector<double> samples(1000, 120.0);
  for (std::size_t i = 400; i < 600; ++i) {
    samples[i] = 80.0;
  }
  const AnalogWaveform waveform{"VA", samples, time};

  const auto sags = detect_sags(waveform, VoltageEventOptions{120.0, 0.8, 1});
  if (sags.size() != 1) {
    return fail("test_sag_on_stepped_magnitude", "expected exactly one sag");
  }
  if (!almost_equal(sags[0].start_time, 0.400) || !almost_equal(sags[0].end_time, 0.599)) {
    return fail("test_sag_on_stepped_magnitude", "sag bounds mismatch");
  }
  if (!almost_equal(sags[0].magnitude, 80.0) || sags[0].channel_id != "VA") {
    return fail("test_sag_on_stepped_magnitude", "sag minimum or channel mismatch");
  }
  return 0;
}

int test_sag_on_sine_within_one_window() {
  const auto time = make_time(1000, 1000.0);
  auto samples = make_sine(time, 120.0 * std::numbers::sqrt2, 60.0);
  for (std::size_t i = 400; i < 600; ++i) {
    samples[i] *= 80.0 / 120.0;
  }
  const AnalogWaveform waveform{"VA", samples, time};
  const std::size_t window = 16;
  const double window_duration = static_cast<double>(window) / 1000.0;

  const auto sags = detect_sags(waveform, VoltageEventOptions{120.0, 0.8, window});
  if (sags.size() != 1) {
    return fail("test_sag_on_sine_within_one_window", "expected exactly one sag");
  }
  if (!almost_equal(sags[0].start_time, 0.400, window_duration) ||
      !almost_equal(sags[0].end_time, 0.599, window_duration)) {
    return fail("test_sag_on_sine_within_one_window", "sag bounds should be within one window of the step");
  }
  if (!almost_equal(sags[0].magnitude, 80.0, 3.0)) {
    return fail("test_sag_on_sine_within_one_window", "sag minimum should be close to 80");
  }
  if (!detect_swells(waveform, VoltageEventOptions{120.0, 1.1, window}).empty()) {
    return fail("test_sag_on_sine_within_one_window", "sag recording should not report swells");
  }
  return 0;
}

int test_sag_running_to_end_of_recording() {
  const auto time = make_time(1000, 1000.0);
  std::vector<double> samples(1000, 120.0);
  for (std::size_t i = 500; i < samples.size(); ++i) {
    samples[i] = 50.0;
  }
  const AnalogWaveform waveform{"VA", samples, time};

  const auto sags = detect_sags(waveform, VoltageEventOptions{120.0, 0.8, 1});
  if (sags.size() != 1) {
    return fail("test_sag_running_to_end_of_recording", "expected exactly one sag");
  }
  if (!almost_equal(sags[0].start_time, 0.500) || !almost_equal(sags[0].end_time, time.back())) {
    return fail("test_sag_running_to_end_of_recording", "open sag should close at the last sample");
  }
  return 0;
}

int test_sag_spanning_entire_series() {
  const auto time = make_time(10, 1000.0);
  const std::vector<double> samples(10, 50.0);
  const AnalogWaveform waveform{"VA", samples, time};
  const std::size_t window = 3;

  const auto sags = detect_sags(waveform, VoltageEventOptions{120.0, 0.8, window});
  if (sags.size() != 1) {
    return fail("test_sag_spanning_entire_series", "all-below series should be one sag");
  }
  if (!almost_equal(sags[0].start_time, time[window - 1]) || !almost_equal(sags[0].end_time, time.back())) {
    return fail("test_sag_spanning_entire_series", "sag should span the first to the last RMS value");
  }
  if (!almost_equal(sags[0].magnitude, 50.0)) {
    return fail("test_sag_spanning_entire_series", "sag minimum mismatch");
  }
  return 0;
}

int test_voltage_events_from_shared_series() {
  const auto time = make_time(1000, 1000.0);
  auto samples = make_sine(time, 120.0 * std::numbers::sqrt2, 60.0);
  for (std::size_t i = 300; i < 400; ++i) {
    samples[i] *= 0.5;
  }
  for (std::size_t i = 700; i < 760; ++i) {
    samples[i] *= 1.3;
  }
  const AnalogWaveform waveform{"VA", samples, time};
  const VoltageEventOptions sag_options{120.0, 0.8, 16};
  const VoltageEventOptions swell_options{120.0, 1.1, 16};

  const auto series = rms_series(waveform, 16);
  const auto sags = detect_sags("VA", series, sag_options);
  const auto swells = detect_swells("VA", series, swell_options);
  const auto direct_sags = detect_sags(waveform, sag_options);
  const auto direct_swells = detect_swells(waveform, swell_options);

  if (sags.size() != 1 || swells.size() != 1 || direct_sags.size() != 1 || direct_swells.size() != 1) {
    return fail("test_voltage_events_from_shared_series", "expected one sag and one swell");
  }
  if (!almost_equal(sags[0].start_time, direct_sags[0].start_time) ||
      !almost_equal(sags[0].end_time, direct_sags[0].end_time) ||
      !almost_equal(sags[0].magnitude, direct_sags[0].magnitude)) {
    return fail("test_voltage_events_from_shared_series", "sag from a shared series should match");
  }
  if (!almost_equal(swells[0].start_time, direct_swells[0].start_time) ||
      !almost_equal(swells[0].magnitude, direct_swells[0].magnitude) || swells[0].channel_id != "VA") {
    return fail("test_voltage_events_from_shared_series", "swell from a shared series should match");
  }
  if (error_code_of([&] { (void)detect_sags("VA", series, VoltageEventOptions{0.0, 0.8, 16}); }) !=
      error_code::INVALID_REFERENCE) {
    return fail("test_voltage_events_from_shared_series", "zero nominal voltage should be INVALID_REFERENCE");
  }
  return 0;
}

int test_swell_detection() {
  const auto time = make_time(1000, 1000.0);
  std::vector<double> samples(1000, 120.0);
  for (std::size_t i = 100; i < 150; ++i) {
    samples[i] = 140.0;
  }
  const AnalogWaveform waveform{"VB", samples, time};

  const auto swells = detect_swells(waveform, VoltageEventOptions{120.0, 1.1, 1});
  if (swells.size() != 1) {
    return fail("test_swell_detection", "expected exactly one swell");
  }
  if (!almost_equal(swells[0].start_time, 0.100) || !almost_equal(swells[0].end_time, 0.149) ||
      !almost_equal(swells[0].magnitude, 140.0)) {
    return fail("test_swell_detection", "swell bounds or maximum mismatch");
  }
  if (!detect_sags(waveform, VoltageEventOptions{120.0, 0.8, 1}).empty()) {
    return fail("test_swell_detection", "swell recording should not report sags");
  }
  return 0;
}

int test_voltage_events_validate_options() {
  const auto time = make_time(100, 1000.0);
  const std::vector<double> samples(100, 120.0);
  const AnalogWaveform waveform{"VA", samples, time};

  if (error_code_of([&] { (void)detect_sags(waveform, VoltageEventOptions{0.0, 0.8, 10}); }) !=
      error_code::INVALID_REFERENCE) {
    return fail("test_voltage_events_validate_options", "zero nominal voltage should be INVALID_REFERENCE");
  }
  if (error_code_of([&] { (void)detect_swells(waveform, VoltageEventOptions{-5.0, 1.1, 10}); }) !=
      error_code::INVALID_REFERENCE) {
    return fail("test_voltage_events_validate_options", "negative nominal voltage should be INVALID_REFERENCE");
  }
  if (error_code_of([&] { (void)detect_sags(waveform, VoltageEventOptions{120.0, 0.8, 0}); }) !=
      error_code::INVALID_WINDOW) {
    return fail("test_voltage_events_validate_options", "zero window should be INVALID_WINDOW");
  }

  const std::vector<double> no_samples{};
  const std::vector<double> no_time{};
  if (!detect_sags(AnalogWaveform{"VA", no_samples, no_time}, VoltageEventOptions{120.0, 0.8, 10}).empty()) {
    return fail("test_voltage_events_validate_options", "empty channel should yield no sags");
  }
  if (!detect_sags(waveform, VoltageEventOptions{120.0, 0.8, 200}).empty()) {
    return fail("test_voltage_events_validate_options", "channel shorter than the window should yield no sags");
  }
  return 0;
}

int test_relay_missing_trip() {
  const auto time = make_time(1000, 1000.0);
  const std::vector<std::uint8_t> samples(1000, 0);
  const auto trip = check_relay_operation(DigitalWaveform{"TRIP", samples, time}, 0.400);

  if (trip.classification != trip_classification::MISSING || trip.trip_time.has_value() || trip.delay.has_value()) {
    return fail("test_relay_missing_trip", "channel that never asserts should be MISSING");
  }
  return 0;
}

int test_relay_on_time_trip() {
  const auto time = make_time(1000, 1000.0);
  std::vector<std::uint8_t> samples(1000, 0);
  for (std::size_t i = 420; i < samples.size(); ++i) {
    samples[i] = 1;
  }

  const auto trip =
      check_relay_operation(DigitalWaveform{"TRIP", samples, time}, 0.400, DelayBounds{0.0, 0.1});
  if (trip.classification != trip_classification::ON_TIME) {
    return fail("test_relay_on_time_trip", "20 ms delay within [0, 100] ms should be ON_TIME");
  }
  if (!trip.trip_time.has_value() || !almost_equal(*trip.trip_time, 0.420)) {
    return fail("test_relay_on_time_trip", "trip time mismatch");
  }
  if (!trip.delay.has_value() || !almost_equal(*trip.delay, 0.020)) {
    return fail("test_relay_on_time_trip", "delay mismatch");
  }
  if (trip.premature_trip_time.has_value() || !almost_equal(trip.reference_time, 0.400)) {
    return fail("test_relay_on_time_trip", "on-time trip should carry the reference and no premature time");
  }
  return 0;
}

int test_relay_late_trip() {
  const auto time = make_time(1000, 1000.0);
  std::vector<std::uint8_t> samples(1000, 0);
  for (std::size_t i = 420; i < samples.size(); ++i) {
    samples[i] = 1;
  }
  const DigitalWaveform waveform{"TRIP", samples, time};

  if (check_relay_operation(waveform, 0.400, DelayBounds{0.0, 0.01}).classification != trip_classification::LATE) {
    return fail("test_relay_late_trip", "20 ms delay above a 10 ms bound should be LATE");
  }
  if (check_relay_operation(waveform, 0.400, DelayBounds{0.05, 0.1}).classification !=
      trip_classification::PREMATURE) {
    return fail("test_relay_late_trip", "delay below the lower bound should be PREMATURE");
  }
  if (check_relay_operation(waveform, 0.400).classification != trip_classification::ON_TIME) {
    return fail("test_relay_late_trip", "without bounds a trip after the reference is ON_TIME");
  }
  return 0;
}

int test_relay_premature_trip() {
  const auto time = make_time(1000, 1000.0);
  std::vector<std::uint8_t> samples(1000, 0);
  samples[0] = 1;

  const auto trip = check_relay_operation(DigitalWaveform{"TRIP", samples, time}, 0.400);
  if (trip.classification != trip_classification::PREMATURE) {
    return fail("test_relay_premature_trip", "assertion before the reference should be PREMATURE");
  }
  if (!trip.premature_trip_time.has_value() || !almost_equal(*trip.premature_trip_time, 0.0)) {
    return fail("test_relay_premature_trip", "premature trip time mismatch");
  }

  for (std::size_t i = 420; i < samples.size(); ++i) {
    samples[i] = 1;
  }
  const auto with_later =
      check_relay_operation(DigitalWaveform{"TRIP", samples, time}, 0.400, DelayBounds{0.0, 0.1});
  if (with_later.classification != trip_classification::PREMATURE) {
    return fail("test_relay_premature_trip", "premature assertion takes precedence over a later trip");
  }
  if (!with_later.trip_time.has_value() || !almost_equal(*with_later.trip_time, 0.420)) {
    return fail("test_relay_premature_trip", "later trip should still be reported");
  }
  return 0;
}

int test_relay_trip_at_reference_is_premature() {
  const auto time = make_time(1000, 1000.0);
  std::vector<std::uint8_t> samples(1000, 0);
  samples[400] = 1;

  const auto trip = check_relay_operation(DigitalWaveform{"TRIP", samples, time}, time[400]);
  if (trip.classification != trip_classification::PREMATURE) {
    return fail("test_relay_trip_at_reference_is_premature", "assertion at the reference should be PREMATURE");
  }
  if (!trip.premature_trip_time.has_value() || !almost_equal(*trip.premature_trip_time, time[400])) {
    return fail("test_relay_trip_at_reference_is_premature", "premature trip time should be the reference");
  }
  if (trip.trip_time.has_value() || trip.delay.has_value()) {
    return fail("test_relay_trip_at_reference_is_premature", "no trip follows the reference");
  }
  return 0;
}

int test_relay_rejects_reference_outside_recording() {
  const auto time = make_time(1000, 1000.0);
  const std::vector<std::uint8_t> samples(1000, 0);
  const DigitalWaveform waveform{"TRIP", samples, time};

  if (error_code_of([&] { (void)check_relay_operation(waveform, 5.0); }) != error_code::INVALID_REFERENCE) {
    return fail("test_relay_rejects_reference_outside_recording", "reference past the end should be rejected");
  }
  if (error_code_of([&] { (void)check_relay_operation(waveform, -0.1); }) != error_code::INVALID_REFERENCE) {
    return fail("test_relay_rejects_reference_outside_recording", "reference before the start should be rejected");
  }
  if (error_code_of([&] { (void)check_relay_operation(waveform, 0.4, DelayBounds{0.2, 0.1}); }) !=
      error_code::INVALID_REFERENCE) {
    return fail("test_relay_rejects_reference_outside_recording", "inverted bounds should be rejected");
  }
  return 0;
}

int test_saturation_clean_sine_not_flagged() {
  const auto time = make_time(1000, 1000.0);
  const auto samples = make_sine(time, 1000.0, 60.0);

  if (!detect_saturation(AnalogWaveform{"IA", samples, time}, SaturationOptions{}).empty()) {
    return fail("test_saturation_clean_sine_not_flagged", "undistorted sine should not be flagged");
  }
  return 0;
}

int test_saturation_clipped_region_flagged() {
  const auto time = make_time(1000, 1000.0);
  auto samples = make_sine(time, 1000.0, 60.0);
  for (std::size_t i = 300; i < 500; ++i) {
    samples[i] = std::fmax(-500.0, std::fmin(500.0, samples[i]));
  }

  const auto events = detect_saturation(AnalogWaveform{"IA", samples, time}, SaturationOptions{5, 0.05, 400.0});
  if (events.size() < 2) {
    return fail("test_saturation_clipped_region_flagged", "each clipped half-cycle should be flagged");
  }
  for (const auto& event : events) {
    if (event.start_time < 0.300 || event.end_time >= 0.500) {
      return fail("test_saturation_clipped_region_flagged", "event outside the clipped region");
    }
    if (event.severity <= 0.0 || event.severity > 1.0 || event.channel_id != "IA") {
      return fail("test_saturation_clipped_region_flagged", "severity or channel mismatch");
    }
  }
  return 0;
}

int test_saturation_held_value_single_event() {
  const auto time = make_time(1000, 1000.0);
  auto samples = make_sine(time, 1000.0, 60.0);
  for (std::size_t i = 600; i < 660; ++i) {
    samples[i] = 900.0;
  }

  const auto events = detect_saturation(AnalogWaveform{"IA", samples, time}, SaturationOptions{5, 0.05, 400.0});
  if (events.size() != 1) {
    return fail("test_saturation_held_value_single_event", "expected exactly one event");
  }
  if (!almost_equal(events[0].start_time, 0.604) || !almost_equal(events[0].end_time, 0.659)) {
    return fail("test_saturation_held_value_single_event", "event bounds mismatch");
  }
  if (!almost_equal(events[0].severity, 1.0)) {
    return fail("test_saturation_held_value_single_event", "fully flat window should have severity 1");
  }
  return 0;
}

int test_saturation_ignores_low_current() {
  const auto time = make_time(1000, 1000.0);
  auto samples = make_sine(time, 100.0, 60.0);
  for (std::size_t i = 300; i < 500; ++i) {
    samples[i] = std::fmax(-50.0, std::fmin(50.0, samples[i]));
  }

  if (!detect_saturation(AnalogWaveform{"IA", samples, time}, SaturationOptions{5, 0.05, 400.0}).empty()) {
    return fail("test_saturation_ignores_low_current", "flat stretches below the current threshold are ignored");
  }

  const std::vector<double> quiet(1000, 0.0);
  if (!detect_saturation(AnalogWaveform{"IA", quiet, time}, SaturationOptions{}).empty()) {
    return fail("test_saturation_ignores_low_current", "an all-zero channel should not be flagged");
  }
  return 0;
}

int test_saturation_validates_options() {
  const auto time = make_time(100, 1000.0);
  const std::vector<double> samples(100, 1.0);
  const AnalogWaveform waveform{"IA", samples, time};

  if (error_code_of([&] { (void)detect_saturation(waveform, SaturationOptions{1, 0.05, 0.0}); }) !=
      error_code::INVALID_WINDOW) {
    return fail("test_saturation_validates_options", "window below 2 should be INVALID_WINDOW");
  }
  if (error_code_of([&] { (void)detect_saturation(waveform, SaturationOptions{5, 0.0, 0.0}); }) !=
      error_code::INVALID_REFERENCE) {
    return fail("test_saturation_validates_options", "zero flatness threshold should be INVALID_REFERENCE");
  }
  if (!detect_saturation(waveform, SaturationOptions{200, 0.05, 0.0}).empty()) {
    return fail("test_saturation_validates_options", "channel shorter than the window should yield no events");
  }
  return 0;
}

int test_check_frequency() {
  if (check_frequency(60.0, 60.0).has_value() || check_frequency(60.5, 60.0, 1.0).has_value()) {
    return fail("test_check_frequency", "frequency within tolerance should pass");
  }
  const auto mismatch = check_frequency(50.0, 60.0);
  if (!mismatch.has_value() || !almost_equal(mismatch->declared_frequency, 50.0) || mismatch->message.empty()) {
    return fail("test_check_frequency", "50 Hz against 60 Hz should be reported");
  }
  if (!check_frequency(0.0, 0.0, 5.0).has_value()) {
    return fail("test_check_frequency", "declared frequency of zero is always reported");
  }
  return 0;
}

int test_frequency_deviation_estimate() {
  const auto time = make_time(960, 960.0);
  const auto samples = make_sine(time, 100.0, 60.0, 0.1);
  const AnalogWaveform waveform{"VA", samples, time};

  if (!estimate_frequency_deviations(waveform, 60.0, 1.0).empty()) {
    return fail("test_frequency_deviation_estimate", "60 Hz sine should not deviate from 60 Hz");
  }

  const auto deviations = estimate_frequency_deviations(waveform, 50.0, 1.0);
  if (deviations.size() < 100) {
    return fail("test_frequency_deviation_estimate", "every cycle should deviate from 50 Hz");
  }
  for (const auto& deviation : deviations) {
    if (!almost_equal(deviation.frequency, 60.0, 1e-6)) {
      return fail("test_frequency_deviation_estimate", "estimated frequency should be 60 Hz");
    }
  }

  if (error_code_of([&] { (void)estimate_frequency_deviations(waveform, 0.0, 1.0); }) !=
      error_code::INVALID_REFERENCE) {
    return fail("test_frequency_deviation_estimate", "zero nominal frequency should be INVALID_REFERENCE");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_rms_output_length(); rc != 0) {
    return rc;
  }
  if (int rc = test_rms_full_cycle_matches_sine_rms(); rc != 0) {
    return rc;
  }
  if (int rc = test_rms_rejects_invalid_window(); rc != 0) {
    return rc;
  }
  if (int rc = test_rms_series_uses_right_edge_time(); rc != 0) {
    return rc;
  }
  if (int rc = test_run_tracker_transitions(); rc != 0) {
    return rc;
  }
  if (int rc = test_sags_none_when_above_threshold(); rc != 0) {
    return rc;
  }
  if (int rc = test_sag_on_stepped_magnitude(); rc != 0) {
    return rc;
  }
  if (int rc = test_sag_on_sine_within_one_window(); rc != 0) {
    return rc;
  }
  if (int rc = test_sag_running_to_end_of_recording(); rc != 0) {
    return rc;
  }
  if (int rc = test_sag_spanning_entire_series(); rc != 0) {
    return rc;
  }
  if (int rc = test_voltage_events_from_shared_series(); rc != 0) {
    return rc;
  }
  if (int rc = test_swell_detection(); rc != 0) {
    return rc;
  }
  if (int rc = test_voltage_events_validate_options(); rc != 0) {
    return rc;
  }
  if (int rc = test_relay_missing_trip(); rc != 0) {
    return rc;
  }
  if (int rc = test_relay_on_time_trip(); rc != 0) {
    return rc;
  }
  if (int rc = test_relay_late_trip(); rc != 0) {
    return rc;
  }
  if (int rc = test_relay_premature_trip(); rc != 0) {
    return rc;
  }
  if (int rc = test_relay_trip_at_reference_is_premature(); rc != 0) {
    return rc;
  }
  if (int rc = test_relay_rejects_reference_outside_recording(); rc != 0) {
    return rc;
  }
  if (int rc = test_saturation_clean_sine_not_flagged(); rc != 0) {
    return rc;
  }
  if (int rc = test_saturation_clipped_region_flagged(); rc != 0) {
    return rc;
  }
  if (int rc = test_saturation_held_value_single_event(); rc != 0) {
    return rc;
  }
  if (int rc = test_saturation_ignores_low_current(); rc != 0) {
    return rc;
  }
  if (int rc = test_saturation_validates_options(); rc != 0) {
    return rc;
  }
  if (int rc = test_check_frequency(); rc != 0) {
    return rc;
  }
  if (int rc = test_frequency_deviation_estimate(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] detectors unit tests\n";
  return 0;
}
