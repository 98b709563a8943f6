#include "detect/relay.hpp"

#include <string>

#include "core/error.hpp"

namespace comtrade_analyzer::detect {

namespace {

void validate(const signal::DigitalWaveform& trip, const double reference_time,
              const std::optional<DelayBounds>& expected_delay) {
  if (trip.time.empty() || trip.samples.size() != trip.time.size()) {
    throw core::AnalysisError(core::error_code::INVALID_REFERENCE,
                              "trip channel '" + trip.channel_id + "' has no usable time base");
  }
  if (reference_time < trip.time.front() || reference_time > trip.time.back()) {
    throw core::AnalysisError(core::error_code::INVALID_REFERENCE,
                              "reference time " + std::to_string(reference_time) + "s is outside the recording [" +
                                  std::to_string(trip.time.front()) + "s, " + std::to_string(trip.time.back()) +
                                  "s]");
  }
  if (expected_delay.has_value() &&
      (expected_delay->min_s < 0.0 || expected_delay->max_s < expected_delay->min_s)) {
    throw core::AnalysisError(core::error_code::INVALID_REFERENCE, "expected delay bounds must satisfy 0 <= min <= max");
  }
}

model::trip_classification classify(const double delay, const std::optional<DelayBounds>& expected_delay) {
  if (!expected_delay.has_value()) {
    return model::trip_classification::ON_TIME;
  }
  if (delay > expected_delay->max_s) {
    return model::trip_classification::LATE;
  }
  if (delay < expected_delay->min_s) {
    return model::trip_classification::PREMATURE;
  }
  return model::trip_classification::ON_TIME;
}

}  // namespace

model::TripInfo check_relay_operation(const signal::DigitalWaveform& trip, const double reference_time,
                                      const std::optional<DelayBounds> expected_delay) {
  validate(trip, reference_time, expected_delay);

  model::TripInfo info{};
  info.channel_id = trip.channel_id;
  info.reference_time = reference_time;

  for (std::size_t i = 0; i < trip.samples.size(); ++i) {
    if (trip.samples[i] != 1) {
      continue;
    }
    if (trip.time[i] <= reference_time) {
      if (!info.premature_trip_time.has_value()) {
        info.premature_trip_time = trip.time[i];
      }
      continue;
    }
    info.trip_time = trip.time[i];
    info.delay = trip.time[i] - reference_time;
    break;
  }

  if (info.premature_trip_time.has_value()) {
    info.classification = model::trip_classification::PREMATURE;
  } else if (!info.trip_time.has_value()) {
    info.classification = model::trip_classification::MISSING;
  } else {
    info.classification = classify(*info.delay, expected_delay);
  }

  return info;
}

}  // namespace comtrade_analyzer::detect
