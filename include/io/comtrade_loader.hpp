#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "model/recording.hpp"

namespace comtrade_analyzer::io {

struct AnalogChannelConfig {
  std::size_t index;
  std::string id;
  std::string phase;
  std::string circuit;
  std::string unit;
  double multiplier;
  double offset;
  double skew;
  double min_value;
  double max_value;
  double primary;
  double secondary;
  char primary_secondary;
};

struct DigitalChannelConfig {
  std::size_t index;
  std::string id;
  std::string phase;
  std::string circuit;
  int normal_state;
};

struct ComtradeConfig {
  model::RecordingMetadata metadata{};
  std::vector<AnalogChannelConfig> analog{};
  std::vector<DigitalChannelConfig> digital{};
};

// True for the data file types of IEEE C37.111: ASCII, BINARY, BINARY32 and
// FLOAT32 (case-insensitive).
bool is_known_file_type(const std::string& file_type);

// Parses a .cfg body (revisions 1991, 1999 and 2013). Throws
// std::runtime_error naming the offending line.
ComtradeConfig parse_comtrade_config(std::istream& input);

// Reads the data records described by config. Throws std::runtime_error for
// unknown file types, malformed records or truncated binary records.
model::Recording parse_comtrade_data(const ComtradeConfig& config, std::istream& input);

// Accepts a .cfg path (data read from the sibling .dat) or a combined .cff.
ComtradeConfig load_comtrade_config(const std::string& path);
model::Recording load_comtrade(const std::string& path);

std::string dat_path_for(const std::string& cfg_path);

}  // namespace comtrade_analyzer::io
