#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace comtrade_analyzer::model {

enum class voltage_event_kind : std::uint8_t {
  SAG = 0,
  SWELL = 1,
};

// magnitude is the run minimum for a sag and the run maximum for a swell.
struct VoltageEvent {
  voltage_event_kind kind;
  std::string channel_id;
  double start_time;
  double end_time;
  double magnitude;
};

enum class trip_classification : std::uint8_t {
  ON_TIME = 0,
  LATE = 1,
  PREMATURE = 2,
  MISSING = 3,
};

struct TripInfo {
  std::string channel_id;
  double reference_time{0.0};
  std::optional<double> trip_time{};
  std::optional<double> delay{};
  // First asserted sample at or before the reference time, if any.
  std::optional<double> premature_trip_time{};
  trip_classification classification{trip_classification::MISSING};
};

struct SaturationEvent {
  std::string channel_id;
  double start_time;
  double end_time;
  double severity;
};

struct FrequencyError {
  double declared_frequency;
  double expected_frequency;
  double tolerance;
  std::string message;
};

struct FrequencyDeviation {
  double time;
  double frequency;
};

enum class issue_severity : std::uint8_t {
  WARNING = 0,
  ERROR = 1,
};

struct ConformanceIssue {
  issue_severity severity;
  std::string check;
  std::string message;
};

const char* to_string(voltage_event_kind kind) noexcept;
const char* to_string(trip_classification classification) noexcept;
const char* to_string(issue_severity severity) noexcept;

std::string label(const VoltageEvent& event);
std::string label(const TripInfo& trip);
std::string label(const SaturationEvent& event);
std::string label(const FrequencyDeviation& deviation);
std::string label(const ConformanceIssue& issue);

}  // namespace comtrade_analyzer::model
