#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/error.hpp"
#include "model/findings.hpp"
#include "model/recording.hpp"

namespace comtrade_analyzer::core {

struct FaultRequest {
  std::string voltage_channel;
  std::string current_channel;
  std::string trip_channel;
  double nominal_voltage{0.0};
};

// A detector that could not run. The remaining detectors still report.
struct StageError {
  std::string stage;
  std::string channel_id;
  error_code code;
  std::string message;
};

struct FaultReport {
  std::vector<model::VoltageEvent> sags{};
  std::vector<model::VoltageEvent> swells{};
  std::optional<model::TripInfo> trip{};
  std::vector<model::SaturationEvent> saturation{};
  std::vector<model::FrequencyDeviation> frequency_deviations{};
  std::vector<StageError> errors{};
};

struct GridSearchEntry {
  std::string voltage_channel;
  std::string current_channel;
  model::VoltageEvent sag;
  std::vector<model::SaturationEvent> saturation{};
  std::vector<model::TripInfo> trips{};
};

class FaultAnalyzer {
 public:
  explicit FaultAnalyzer(AnalyzerConfig config = {});

  // Sags, swells and frequency deviations on the voltage channel, the relay
  // check on the trip channel against the first sag's start, and saturation
  // on the current channel.
  [[nodiscard]] FaultReport analyze(const model::Recording& recording, const FaultRequest& request) const;

  // Every ordered pair of distinct analog channels whose first member sags,
  // with saturation on the second member and every digital channel that
  // trips after the sag starts.
  [[nodiscard]] std::vector<GridSearchEntry> grid_search(const model::Recording& recording,
                                                         double nominal_voltage) const;

  [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

 private:
  AnalyzerConfig config_;
};

}  // namespace comtrade_analyzer::core
