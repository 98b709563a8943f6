#include "sinks/text_report.hpp"

#include <algorithm>

namespace comtrade_analyzer::sinks {

void TextReportSink::publish_info(const io::ComtradeConfig& config) const {
  const model::RecordingMetadata& metadata = config.metadata;
  std::fprintf(out_, "COMTRADE File Information:\n");
  std::fprintf(out_, "  Station: %s\n", metadata.station_name.c_str());
  std::fprintf(out_, "  Recorder ID: %s\n", metadata.recorder_id.c_str());
  std::fprintf(out_, "  Revision: %d\n", metadata.revision_year);
  std::fprintf(out_, "  Start Time: %s\n", metadata.start_timestamp.c_str());
  std::fprintf(out_, "  Trigger Time: %s\n", metadata.trigger_timestamp.c_str());
  std::fprintf(out_, "  File Type: %s\n", metadata.file_type.c_str());
  std::fprintf(out_, "  Frequency: %g Hz\n", metadata.frequency_hz);
  for (const auto& rate : metadata.sample_rates) {
    std::fprintf(out_, "  Sampling Rate: %g Hz up to sample %llu\n", rate.rate_hz,
                 static_cast<unsigned long long>(rate.end_sample));
  }

  std::fprintf(out_, "\nAnalog Channels:\n");
  for (std::size_t i = 0; i < config.analog.size(); ++i) {
    std::fprintf(out_, "  %zu: %s (%s)\n", i + 1, config.analog[i].id.c_str(), config.analog[i].unit.c_str());
  }
  std::fprintf(out_, "\nDigital Channels:\n");
  for (std::size_t i = 0; i < config.digital.size(); ++i) {
    std::fprintf(out_, "  %zu: %s\n", i + 1, config.digital[i].id.c_str());
  }
}

void TextReportSink::publish_conformance(const std::vector<model::ConformanceIssue>& issues) const {
  if (issues.empty()) {
    std::fprintf(out_, "No conformance issues found.\n");
    return;
  }
  for (const auto& issue : issues) {
    std::fprintf(out_, "%s\n", model::label(issue).c_str());
  }
}

void TextReportSink::publish_faults(const core::FaultReport& report) const {
  for (const auto& error : report.errors) {
    std::fprintf(out_, "Error in %s analysis of '%s': %s (%s)\n", error.stage.c_str(), error.channel_id.c_str(),
                 error.message.c_str(), core::to_string(error.code));
  }

  const auto stage_failed = [&report](const char* stage) {
    return std::any_of(report.errors.begin(), report.errors.end(),
                       [stage](const core::StageError& error) { return error.stage == stage; });
  };

  if (report.sags.empty() && !stage_failed("voltage")) {
    std::fprintf(out_, "No voltage sags detected.\n");
  }
  for (const auto& sag : report.sags) {
    std::fprintf(out_, "%s\n", model::label(sag).c_str());
  }
  for (const auto& swell : report.swells) {
    std::fprintf(out_, "%s\n", model::label(swell).c_str());
  }

  if (report.trip.has_value()) {
    std::fprintf(out_, "%s\n", model::label(*report.trip).c_str());
  }

  if (report.saturation.empty() && !stage_failed("saturation")) {
    std::fprintf(out_, "No CT saturation detected.\n");
  }
  for (const auto& event : report.saturation) {
    std::fprintf(out_, "%s\n", model::label(event).c_str());
  }

  for (const auto& deviation : report.frequency_deviations) {
    std::fprintf(out_, "%s\n", model::label(deviation).c_str());
  }
}

void TextReportSink::publish_grid_search(const std::vector<core::GridSearchEntry>& entries) const {
  for (const auto& entry : entries) {
    std::fprintf(out_, "\n--- Analysis for V:%s, C:%s ---\n", entry.voltage_channel.c_str(),
                 entry.current_channel.c_str());
    std::fprintf(out_, "  %s\n", model::label(entry.sag).c_str());
    for (const auto& event : entry.saturation) {
      std::fprintf(out_, "  %s\n", model::label(event).c_str());
    }
    for (const auto& trip : entry.trips) {
      std::fprintf(out_, "  %s\n", model::label(trip).c_str());
    }
  }
  std::fprintf(out_, "\nGrid search complete.\n");
}

}  // namespace comtrade_analyzer::sinks
