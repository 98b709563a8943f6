#include <cstdio>
#include <exception>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "conformance/checks.hpp"
#include "core/analyzer.hpp"
#include "core/config.hpp"
#include "io/comtrade_loader.hpp"
#include "sinks/json_report.hpp"
#include "sinks/text_report.hpp"

namespace {

using comtrade_analyzer::core::AnalyzerConfig;
using comtrade_analyzer::core::output_format;

struct CliOptions {
  std::string command;
  std::string cfg_file;
  std::optional<std::string> config_path;
  std::optional<double> expected_frequency;
  std::string voltage_channel;
  std::string current_channel;
  std::string trip_channel;
  std::optional<double> nominal_voltage;
  bool json{false};
};

constexpr const char* kUsage =
    "usage: comtrade-analyzer <command> <cfg_file> [options]\n"
    "\n"
    "commands:\n"
    "  info                 display header information and channel identifiers\n"
    "  conformance          check the recording for conformance errors [--freq HZ]\n"
    "  faults               analyze fault patterns [--freq HZ]\n"
    "                       --voltage-ch ID --current-ch ID --trip-ch ID --nominal-v V\n"
    "  faults-grid-search   run fault analysis on all channel combinations --nominal-v V\n"
    "\n"
    "options:\n"
    "  --config PATH        analyzer thresholds (YAML subset)\n"
    "  --json               print the report as JSON\n";

double parse_number(const std::string& flag, const std::string& value) {
  std::size_t consumed = 0;
  const double parsed = std::stod(value, &consumed);
  if (consumed != value.size()) {
    throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
  }
  return parsed;
}

CliOptions parse_cli(const int argc, char** argv) {
  if (argc < 3) {
    throw std::invalid_argument("missing command or cfg_file");
  }

  CliOptions options{};
  options.command = argv[1];
  options.cfg_file = argv[2];

  for (int i = 3; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--json") {
      options.json = true;
      continue;
    }
    if (i + 1 >= argc) {
      throw std::invalid_argument(flag + " requires a value");
    }
    const std::string value = argv[++i];

    if (flag == "--config") {
      options.config_path = value;
    } else if (flag == "--freq") {
      options.expected_frequency = parse_number(flag, value);
      if (!(*options.expected_frequency > 0.0)) {
        throw std::invalid_argument("--freq must be greater than 0, got '" + value + "'");
      }
    } else if (flag == "--voltage-ch") {
      options.voltage_channel = value;
    } else if (flag == "--current-ch") {
      options.current_channel = value;
    } else if (flag == "--trip-ch") {
      options.trip_channel = value;
    } else if (flag == "--nominal-v") {
      options.nominal_voltage = parse_number(flag, value);
    } else {
      throw std::invalid_argument("unknown option " + flag);
    }
  }

  const bool faults = options.command == "faults";
  if (options.expected_frequency.has_value() && !faults && options.command != "conformance") {
    throw std::invalid_argument("--freq applies to conformance and faults only");
  }
  if (faults && (options.voltage_channel.empty() || options.current_channel.empty() ||
                 options.trip_channel.empty())) {
    throw std::invalid_argument("faults requires --voltage-ch, --current-ch and --trip-ch");
  }
  if ((faults || options.command == "faults-grid-search") && !options.nominal_voltage.has_value()) {
    throw std::invalid_argument(options.command + " requires --nominal-v");
  }
  return options;
}

std::string format_config_settings(const AnalyzerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[analyzer] loaded config from " << config_path << " | rms_window=" << config.rms_window_size
         << " | sag_ratio=" << config.sag_ratio << " | swell_ratio=" << config.swell_ratio
         << " | saturation_window=" << config.saturation.window_size
         << " | flatness_threshold=" << config.saturation.flatness_threshold
         << " | high_current_threshold=" << config.saturation.high_current_threshold << " | relay_bounds=";
  if (config.relay.bounds_enabled) {
    output << '[' << config.relay.min_delay_s << "s, " << config.relay.max_delay_s << "s]";
  } else {
    output << "off";
  }
  output << " | expected_frequency_hz=" << config.expected_frequency_hz
         << " | report_format=" << (config.report_format == output_format::JSON ? "json" : "text");
  return output.str();
}

int run(const CliOptions& options, const AnalyzerConfig& config) {
  namespace ca = comtrade_analyzer;

  const bool json = options.json || config.report_format == output_format::JSON;
  const ca::sinks::TextReportSink text_sink{};
  const ca::sinks::JsonReportSink json_sink{};

  if (options.command == "info") {
    const auto cfg = ca::io::load_comtrade_config(options.cfg_file);
    if (json) {
      json_sink.publish(ca::sinks::info_json(cfg));
    } else {
      text_sink.publish_info(cfg);
    }
    return 0;
  }

  if (options.command == "conformance") {
    std::cerr << "[analyzer] running conformance checks on " << options.cfg_file << '\n';
    const auto cfg = ca::io::load_comtrade_config(options.cfg_file);
    auto issues = ca::conformance::check_config(cfg.metadata, config.expected_frequency_hz,
                                                config.frequency_tolerance_hz);
    if (ca::io::is_known_file_type(cfg.metadata.file_type)) {
      const auto recording = ca::io::load_comtrade(options.cfg_file);
      for (auto& issue : ca::conformance::check_sample_counts(recording)) {
        issues.push_back(std::move(issue));
      }
    }
    if (json) {
      json_sink.publish(ca::sinks::conformance_json(issues));
    } else {
      text_sink.publish_conformance(issues);
    }
    return 0;
  }

  if (options.command == "faults") {
    std::cerr << "[analyzer] running fault analysis on " << options.cfg_file << '\n';
    const auto recording = ca::io::load_comtrade(options.cfg_file);
    const ca::core::FaultAnalyzer analyzer{config};
    const ca::core::FaultRequest request{options.voltage_channel, options.current_channel, options.trip_channel,
                                         *options.nominal_voltage};
    const auto report = analyzer.analyze(recording, request);
    if (json) {
      json_sink.publish(ca::sinks::fault_report_json(report));
    } else {
      text_sink.publish_faults(report);
    }
    return report.errors.empty() ? 0 : 2;
  }

  if (options.command == "faults-grid-search") {
    std::cerr << "[analyzer] running fault analysis grid search on " << options.cfg_file << '\n';
    const auto recording = ca::io::load_comtrade(options.cfg_file);
    const ca::core::FaultAnalyzer analyzer{config};
    const auto entries = analyzer.grid_search(recording, *options.nominal_voltage);
    if (json) {
      json_sink.publish(ca::sinks::grid_search_json(entries));
    } else {
      text_sink.publish_grid_search(entries);
    }
    return 0;
  }

  std::cerr << "unknown command: " << options.command << '\n' << kUsage;
  return 1;
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions options{};
  try {
    options = parse_cli(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << "argument error: " << ex.what() << "\n\n" << kUsage;
    return 1;
  }

  AnalyzerConfig config{};
  if (options.config_path.has_value()) {
    try {
      config = comtrade_analyzer::core::load_analyzer_config(*options.config_path);
    } catch (const std::exception& ex) {
      std::cerr << "config error: " << ex.what() << '\n';
      return 1;
    }
    std::cerr << format_config_settings(config, *options.config_path) << '\n';
  }

  if (options.expected_frequency.has_value()) {
    config.expected_frequency_hz = *options.expected_frequency;
  }
  try {
    comtrade_analyzer::core::validate_analyzer_config(config);
  } catch (const std::exception& ex) {
    std::cerr << "argument error: " << ex.what() << "\n\n" << kUsage;
    return 1;
  }

  try {
    return run(options, config);
  } catch (const std::exception& ex) {
    std::cerr << "analysis error: " << ex.what() << '\n';
    return 1;
  }
}
