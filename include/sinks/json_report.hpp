#pragma once

#include <cstdio>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/analyzer.hpp"
#include "io/comtrade_loader.hpp"
#include "model/findings.hpp"

namespace comtrade_analyzer::sinks {

nlohmann::json to_json(const model::VoltageEvent& event);
nlohmann::json to_json(const model::TripInfo& trip);
nlohmann::json to_json(const model::SaturationEvent& event);
nlohmann::json to_json(const model::ConformanceIssue& issue);

nlohmann::json info_json(const io::ComtradeConfig& config);
nlohmann::json conformance_json(const std::vector<model::ConformanceIssue>& issues);
nlohmann::json fault_report_json(const core::FaultReport& report);
nlohmann::json grid_search_json(const std::vector<core::GridSearchEntry>& entries);

class JsonReportSink {
 public:
  explicit JsonReportSink(std::FILE* out = stdout, int indent = 2) noexcept : out_(out), indent_(indent) {}

  void publish(const nlohmann::json& document) const;

 private:
  std::FILE* out_;
  int indent_;
};

}  // namespace comtrade_analyzer::sinks
