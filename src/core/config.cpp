#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace comtrade_analyzer::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

double parse_positive(const std::string& key, const std::string& value) {
  const double parsed = std::stod(value);
  if (parsed <= 0.0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return parsed;
}

double parse_non_negative(const std::string& key, const std::string& value) {
  const double parsed = std::stod(value);
  if (parsed < 0.0) {
    throw std::runtime_error(key + " must be greater than or equal to 0");
  }
  return parsed;
}

std::size_t parse_window(const std::string& key, const std::string& value, const long long minimum) {
  const auto parsed = std::stoll(value);
  if (parsed < minimum) {
    throw std::runtime_error(key + " must be at least " + std::to_string(minimum));
  }
  return static_cast<std::size_t>(parsed);
}

void apply_key_value(AnalyzerConfig& config, const std::string& key, const std::string& value) {
  if (key == "rms.window_size") {
    config.rms_window_size = parse_window(key, value, 1);
    return;
  }

  if (key == "sag.ratio") {
    config.sag_ratio = parse_positive(key, value);
    if (config.sag_ratio >= 1.0) {
      throw std::runtime_error("sag.ratio must be less than 1");
    }
    return;
  }

  if (key == "swell.ratio") {
    config.swell_ratio = parse_positive(key, value);
    if (config.swell_ratio <= 1.0) {
      throw std::runtime_error("swell.ratio must be greater than 1");
    }
    return;
  }

  if (key == "saturation.window_size") {
    config.saturation.window_size = parse_window(key, value, 2);
    return;
  }

  if (key == "saturation.flatness_threshold") {
    config.saturation.flatness_threshold = parse_positive(key, value);
    return;
  }

  if (key == "saturation.high_current_threshold") {
    config.saturation.high_current_threshold = parse_non_negative(key, value);
    return;
  }

  if (key == "relay.min_delay_s") {
    config.relay.min_delay_s = parse_non_negative(key, value);
    return;
  }

  if (key == "relay.max_delay_s") {
    config.relay.max_delay_s = parse_non_negative(key, value);
    return;
  }

  if (key == "relay.bounds_enabled") {
    config.relay.bounds_enabled = parse_bool(value);
    return;
  }

  if (key == "frequency.expected_hz") {
    config.expected_frequency_hz = parse_positive(key, value);
    return;
  }

  if (key == "frequency.tolerance_hz") {
    config.frequency_tolerance_hz = parse_non_negative(key, value);
    return;
  }

  if (key == "report.format") {
    const std::string format = to_lower(value);
    if (format == "text") {
      config.report_format = output_format::TEXT;
    } else if (format == "json") {
      config.report_format = output_format::JSON;
    } else {
      throw std::runtime_error("report.format must be text or json");
    }
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

}  // namespace

AnalyzerConfig load_analyzer_config(const std::string& path) {
  AnalyzerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_analyzer_config(config);
  return config;
}

void validate_analyzer_config(const AnalyzerConfig& config) {
  if (config.rms_window_size < 1) {
    throw std::runtime_error("rms.window_size must be at least 1");
  }
  if (!(config.sag_ratio > 0.0 && config.sag_ratio < 1.0)) {
    throw std::runtime_error("sag.ratio must lie between 0 and 1");
  }
  if (!(config.swell_ratio > 1.0) || !std::isfinite(config.swell_ratio)) {
    throw std::runtime_error("swell.ratio must be greater than 1");
  }
  if (config.saturation.window_size < 2) {
    throw std::runtime_error("saturation.window_size must be at least 2");
  }
  if (!(config.saturation.flatness_threshold > 0.0) || !std::isfinite(config.saturation.flatness_threshold)) {
    throw std::runtime_error("saturation.flatness_threshold must be greater than 0");
  }
  if (!(config.saturation.high_current_threshold >= 0.0)) {
    throw std::runtime_error("saturation.high_current_threshold must be greater than or equal to 0");
  }
  if (!(config.relay.min_delay_s >= 0.0) || !(config.relay.max_delay_s >= config.relay.min_delay_s)) {
    throw std::runtime_error("relay.min_delay_s must not exceed relay.max_delay_s");
  }
  if (!(config.expected_frequency_hz > 0.0) || !std::isfinite(config.expected_frequency_hz)) {
    throw std::runtime_error("expected frequency must be greater than 0 Hz");
  }
  if (!(config.frequency_tolerance_hz >= 0.0)) {
    throw std::runtime_error("frequency.tolerance_hz must be greater than or equal to 0");
  }
}

}  // namespace comtrade_analyzer::core
