#include "model/findings.hpp"

#include <cstdio>

namespace comtrade_analyzer::model {

namespace {
template <typename... Args>
std::string format(const char* pattern, Args... args) {
  char buffer[512]{};
  const int written = std::snprintf(buffer, sizeof(buffer), pattern, args...);
  if (written <= 0) {
    return {};
  }
  return std::string(buffer);
}
}  // namespace

const char* to_string(const voltage_event_kind kind) noexcept {
  switch (kind) {
    case voltage_event_kind::SAG:
      return "sag";
    case voltage_event_kind::SWELL:
      return "swell";
  }
  return "unknown";
}

const char* to_string(const trip_classification classification) noexcept {
  switch (classification) {
    case trip_classification::ON_TIME:
      return "on_time";
    case trip_classification::LATE:
      return "late";
    case trip_classification::PREMATURE:
      return "premature";
    case trip_classification::MISSING:
      return "missing";
  }
  return "unknown";
}

const char* to_string(const issue_severity severity) noexcept {
  return severity == issue_severity::ERROR ? "Error" : "Warning";
}

std::string label(const VoltageEvent& event) {
  const char* magnitude_name = event.kind == voltage_event_kind::SAG ? "min" : "max";
  return format("Voltage %s on '%s' from %.4fs to %.4fs (%s RMS %.2f)", to_string(event.kind),
                event.channel_id.c_str(), event.start_time, event.end_time, magnitude_name, event.magnitude);
}

std::string label(const TripInfo& trip) {
  if (!trip.trip_time.has_value()) {
    if (trip.premature_trip_time.has_value()) {
      return format("Relay trip on '%s' is premature: asserted at %.4fs, at or before the fault at %.4fs",
                    trip.channel_id.c_str(), *trip.premature_trip_time, trip.reference_time);
    }
    return format("No trip signal on '%s' after the fault at %.4fs", trip.channel_id.c_str(), trip.reference_time);
  }

  std::string text = format("Relay trip on '%s' at %.4fs (Delay: %.2fms, %s)", trip.channel_id.c_str(),
                            *trip.trip_time, *trip.delay * 1000.0, to_string(trip.classification));
  if (trip.premature_trip_time.has_value()) {
    text += format("; already asserted at %.4fs", *trip.premature_trip_time);
  }
  return text;
}

std::string label(const SaturationEvent& event) {
  return format("Potential CT saturation on '%s' from %.4fs to %.4fs (severity %.2f)", event.channel_id.c_str(),
                event.start_time, event.end_time, event.severity);
}

std::string label(const FrequencyDeviation& deviation) {
  return format("Frequency %.3f Hz at %.4fs", deviation.frequency, deviation.time);
}

std::string label(const ConformanceIssue& issue) {
  return std::string(to_string(issue.severity)) + ": " + issue.message;
}

}  // namespace comtrade_analyzer::model
