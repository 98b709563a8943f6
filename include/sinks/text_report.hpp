#pragma once

#include <cstdio>
#include <vector>

#include "core/analyzer.hpp"
#include "io/comtrade_loader.hpp"
#include "model/findings.hpp"

namespace comtrade_analyzer::sinks {

class TextReportSink {
 public:
  explicit TextReportSink(std::FILE* out = stdout) noexcept : out_(out) {}

  void publish_info(const io::ComtradeConfig& config) const;
  void publish_conformance(const std::vector<model::ConformanceIssue>& issues) const;
  void publish_faults(const core::FaultReport& report) const;
  void publish_grid_search(const std::vector<core::GridSearchEntry>& entries) const;

 private:
  std::FILE* out_;
};

}  // namespace comtrade_analyzer::sinks
