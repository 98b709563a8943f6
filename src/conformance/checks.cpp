#include "conformance/checks.hpp"

#include <string>
#include <utility>

#include "io/comtrade_loader.hpp"

namespace comtrade_analyzer::conformance {

std::vector<model::ConformanceIssue> check_channel_counts(const model::RecordingMetadata& metadata) {
  std::vector<model::ConformanceIssue> issues;
  const std::size_t expected_total = metadata.declared_analog_channels + metadata.declared_digital_channels;
  if (metadata.declared_total_channels != expected_total) {
    issues.push_back(model::ConformanceIssue{
        model::issue_severity::ERROR, "channel_counts",
        "Mismatched channel counts. Total in CFG: " + std::to_string(metadata.declared_total_channels) +
            ", Sum of analog and status: " + std::to_string(expected_total)});
  }
  return issues;
}

std::vector<model::ConformanceIssue> check_file_type(const model::RecordingMetadata& metadata) {
  std::vector<model::ConformanceIssue> issues;
  if (!io::is_known_file_type(metadata.file_type)) {
    issues.push_back(model::ConformanceIssue{
        model::issue_severity::ERROR, "file_type",
        "Invalid file type '" + metadata.file_type + "'. Valid types are: ASCII, BINARY, BINARY32, FLOAT32"});
  }
  return issues;
}

std::vector<model::ConformanceIssue> check_missing_information(const model::RecordingMetadata& metadata,
                                                               const double expected_frequency,
                                                               const double tolerance) {
  std::vector<model::ConformanceIssue> issues;
  if (const auto error = detect::check_frequency(metadata.frequency_hz, expected_frequency, tolerance)) {
    issues.push_back(model::ConformanceIssue{model::issue_severity::WARNING, "frequency", error->message});
  }
  if (metadata.station_name.empty()) {
    issues.push_back(model::ConformanceIssue{model::issue_severity::WARNING, "station_name", "Station name is empty."});
  }
  return issues;
}

std::vector<model::ConformanceIssue> check_sample_counts(const model::Recording& recording) {
  std::vector<model::ConformanceIssue> issues;
  const model::RecordingMetadata& metadata = recording.metadata();

  if (recording.sample_count() == 0) {
    issues.push_back(model::ConformanceIssue{model::issue_severity::ERROR, "samples", "Data file holds no samples."});
  } else if (!metadata.sample_rates.empty() && metadata.sample_rates.back().end_sample != recording.sample_count()) {
    issues.push_back(model::ConformanceIssue{
        model::issue_severity::WARNING, "samples",
        "Last sampling rate ends at sample " + std::to_string(metadata.sample_rates.back().end_sample) +
            ", data holds " + std::to_string(recording.sample_count())});
  }

  const auto& time = recording.time();
  for (std::size_t i = 1; i < time.size(); ++i) {
    if (time[i] <= time[i - 1]) {
      issues.push_back(model::ConformanceIssue{
          model::issue_severity::ERROR, "time_base",
          "Time base is not increasing at sample " + std::to_string(i + 1)});
      break;
    }
  }

  return issues;
}

std::vector<model::ConformanceIssue> check_config(const model::RecordingMetadata& metadata,
                                                  const double expected_frequency, const double tolerance) {
  std::vector<model::ConformanceIssue> issues = check_channel_counts(metadata);
  for (auto& issue : check_file_type(metadata)) {
    issues.push_back(std::move(issue));
  }
  for (auto& issue : check_missing_information(metadata, expected_frequency, tolerance)) {
    issues.push_back(std::move(issue));
  }
  return issues;
}

}  // namespace comtrade_analyzer::conformance
