#include "sinks/json_report.hpp"

#include <string>

namespace comtrade_analyzer::sinks {

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return *value;
}

template <typename T>
nlohmann::json array_json(const std::vector<T>& items) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& item : items) {
    out.push_back(to_json(item));
  }
  return out;
}

nlohmann::json frequency_json(const model::FrequencyDeviation& deviation) {
  return nlohmann::json{{"time", deviation.time}, {"frequency_hz", deviation.frequency}};
}

}  // namespace

nlohmann::json to_json(const model::VoltageEvent& event) {
  return nlohmann::json{{"kind", model::to_string(event.kind)},
                        {"channel_id", event.channel_id},
                        {"start_time", event.start_time},
                        {"end_time", event.end_time},
                        {event.kind == model::voltage_event_kind::SAG ? "min_rms" : "max_rms", event.magnitude},
                        {"label", model::label(event)}};
}

nlohmann::json to_json(const model::TripInfo& trip) {
  return nlohmann::json{{"channel_id", trip.channel_id},
                        {"reference_time", trip.reference_time},
                        {"trip_time", optional_json(trip.trip_time)},
                        {"delay_s", optional_json(trip.delay)},
                        {"premature_trip_time", optional_json(trip.premature_trip_time)},
                        {"classification", model::to_string(trip.classification)},
                        {"label", model::label(trip)}};
}

nlohmann::json to_json(const model::SaturationEvent& event) {
  return nlohmann::json{{"channel_id", event.channel_id},
                        {"start_time", event.start_time},
                        {"end_time", event.end_time},
                        {"severity", event.severity},
                        {"label", model::label(event)}};
}

nlohmann::json to_json(const model::ConformanceIssue& issue) {
  return nlohmann::json{{"severity", issue.severity == model::issue_severity::ERROR ? "error" : "warning"},
                        {"check", issue.check},
                        {"message", issue.message}};
}

nlohmann::json info_json(const io::ComtradeConfig& config) {
  const model::RecordingMetadata& metadata = config.metadata;
  nlohmann::json analog = nlohmann::json::array();
  for (const auto& channel : config.analog) {
    analog.push_back({{"id", channel.id}, {"phase", channel.phase}, {"unit", channel.unit}});
  }
  nlohmann::json digital = nlohmann::json::array();
  for (const auto& channel : config.digital) {
    digital.push_back({{"id", channel.id}, {"normal_state", channel.normal_state}});
  }
  nlohmann::json rates = nlohmann::json::array();
  for (const auto& rate : metadata.sample_rates) {
    rates.push_back({{"rate_hz", rate.rate_hz}, {"end_sample", rate.end_sample}});
  }

  return nlohmann::json{{"station", metadata.station_name},
                        {"recorder_id", metadata.recorder_id},
                        {"revision_year", metadata.revision_year},
                        {"start_time", metadata.start_timestamp},
                        {"trigger_time", metadata.trigger_timestamp},
                        {"file_type", metadata.file_type},
                        {"frequency_hz", metadata.frequency_hz},
                        {"sample_rates", rates},
                        {"analog_channels", analog},
                        {"digital_channels", digital}};
}

nlohmann::json conformance_json(const std::vector<model::ConformanceIssue>& issues) {
  return nlohmann::json{{"conformance", array_json(issues)}};
}

nlohmann::json fault_report_json(const core::FaultReport& report) {
  nlohmann::json errors = nlohmann::json::array();
  for (const auto& error : report.errors) {
    errors.push_back({{"stage", error.stage},
                      {"channel_id", error.channel_id},
                      {"code", core::to_string(error.code)},
                      {"message", error.message}});
  }

  nlohmann::json deviations = nlohmann::json::array();
  for (const auto& deviation : report.frequency_deviations) {
    deviations.push_back(frequency_json(deviation));
  }

  return nlohmann::json{{"sags", array_json(report.sags)},
                        {"swells", array_json(report.swells)},
                        {"trip", report.trip.has_value() ? to_json(*report.trip) : nlohmann::json(nullptr)},
                        {"saturation", array_json(report.saturation)},
                        {"frequency_deviations", deviations},
                        {"errors", errors}};
}

nlohmann::json grid_search_json(const std::vector<core::GridSearchEntry>& entries) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& entry : entries) {
    out.push_back({{"voltage_channel", entry.voltage_channel},
                   {"current_channel", entry.current_channel},
                   {"sag", to_json(entry.sag)},
                   {"saturation", array_json(entry.saturation)},
                   {"trips", array_json(entry.trips)}});
  }
  return nlohmann::json{{"grid_search", out}};
}

void JsonReportSink::publish(const nlohmann::json& document) const {
  const std::string text = document.dump(indent_);
  std::fprintf(out_, "%s\n", text.c_str());
}

}  // namespace comtrade_analyzer::sinks
