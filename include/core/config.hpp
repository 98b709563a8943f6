#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace comtrade_analyzer::core {

enum class output_format : std::uint8_t {
  TEXT = 0,
  JSON = 1,
};

struct RelayConfig {
  double min_delay_s{0.0};
  double max_delay_s{0.1};
  bool bounds_enabled{true};
};

struct SaturationConfig {
  std::size_t window_size{5};
  double flatness_threshold{0.05};
  double high_current_threshold{0.0};
};

struct AnalyzerConfig {
  std::size_t rms_window_size{50};
  double sag_ratio{0.8};
  double swell_ratio{1.1};
  SaturationConfig saturation{};
  RelayConfig relay{};
  double expected_frequency_hz{60.0};
  double frequency_tolerance_hz{1.0};
  output_format report_format{output_format::TEXT};
};

AnalyzerConfig load_analyzer_config(const std::string& path);

// Throws std::runtime_error naming the first out-of-range field. Run again
// after command-line overrides are applied.
void validate_analyzer_config(const AnalyzerConfig& config);

}  // namespace comtrade_analyzer::core
