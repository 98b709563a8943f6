#include "io/comtrade_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace comtrade_analyzer::io {
namespace {

constexpr std::string_view kCffMarker = "--- file type:";
constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

enum class data_format : std::uint8_t {
  ASCII = 0,
  BINARY = 1,
  BINARY32 = 2,
  FLOAT32 = 3,
};

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_upper(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return out;
}

bool ends_with_ci(const std::string& value, const std::string& suffix) {
  if (value.size() < suffix.size()) {
    return false;
  }
  return to_upper(value.substr(value.size() - suffix.size())) == to_upper(suffix);
}

std::vector<std::string> split_fields(const std::string& line) {
  std::vector<std::string> fields;
  std::string field;
  std::istringstream stream(line);
  while (std::getline(stream, field, ',')) {
    fields.push_back(trim(field));
  }
  if (!line.empty() && line.back() == ',') {
    fields.emplace_back();
  }
  return fields;
}

std::runtime_error parse_error(const char* file, const std::size_t line, const std::string& message) {
  return std::runtime_error(std::string(file) + " line " + std::to_string(line) + ": " + message);
}

bool try_parse_double(const std::string& field, double& value) {
  if (field.empty()) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const double parsed = std::strtod(field.c_str(), &end);
  if (errno != 0 || end == field.c_str() || *end != '\0' || !std::isfinite(parsed)) {
    return false;
  }
  value = parsed;
  return true;
}

class LineReader {
 public:
  explicit LineReader(std::istream& input) : input_(input) {}

  bool next(std::string& line) {
    if (!std::getline(input_, line)) {
      return false;
    }
    ++line_number_;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    return true;
  }

  std::string require(const char* what) {
    std::string line;
    if (!next(line)) {
      throw parse_error("cfg", line_number_ + 1, std::string("missing ") + what);
    }
    return line;
  }

  [[nodiscard]] std::size_t line_number() const noexcept { return line_number_; }

 private:
  std::istream& input_;
  std::size_t line_number_{0};
};

double require_double(const std::string& field, const char* what, const std::size_t line) {
  double value = 0.0;
  if (!try_parse_double(field, value)) {
    throw parse_error("cfg", line, std::string("invalid ") + what + " '" + field + "'");
  }
  return value;
}

double optional_double(const std::vector<std::string>& fields, const std::size_t index, const double fallback,
                       const char* what, const std::size_t line) {
  if (index >= fields.size() || fields[index].empty()) {
    return fallback;
  }
  return require_double(fields[index], what, line);
}

std::size_t require_count(std::string field, const char* what, const std::size_t line) {
  if (!field.empty() && std::isalpha(static_cast<unsigned char>(field.back())) != 0) {
    field.pop_back();
  }
  const double value = require_double(trim(field), what, line);
  if (value < 0.0 || value != std::floor(value)) {
    throw parse_error("cfg", line, std::string(what) + " must be a non-negative integer");
  }
  return static_cast<std::size_t>(value);
}

AnalogChannelConfig parse_analog_line(const std::string& line, const std::size_t line_number) {
  const auto fields = split_fields(line);
  if (fields.size() < 10) {
    throw parse_error("cfg", line_number,
                      "analog channel needs at least 10 fields, found " + std::to_string(fields.size()));
  }

  AnalogChannelConfig channel{};
  channel.index = require_count(fields[0], "analog channel index", line_number);
  channel.id = fields[1];
  channel.phase = fields[2];
  channel.circuit = fields[3];
  channel.unit = fields[4];
  channel.multiplier = require_double(fields[5], "analog multiplier", line_number);
  channel.offset = require_double(fields[6], "analog offset", line_number);
  channel.skew = optional_double(fields, 7, 0.0, "analog skew", line_number);
  channel.min_value = require_double(fields[8], "analog min", line_number);
  channel.max_value = require_double(fields[9], "analog max", line_number);
  channel.primary = optional_double(fields, 10, 1.0, "primary ratio", line_number);
  channel.secondary = optional_double(fields, 11, 1.0, "secondary ratio", line_number);
  channel.primary_secondary = fields.size() > 12 && !fields[12].empty()
                                  ? static_cast<char>(std::toupper(static_cast<unsigned char>(fields[12].front())))
                                  : 'P';
  return channel;
}

DigitalChannelConfig parse_digital_line(const std::string& line, const std::size_t line_number) {
  const auto fields = split_fields(line);
  DigitalChannelConfig channel{};
  if (fields.size() >= 5) {
    channel.index = require_count(fields[0], "digital channel index", line_number);
    channel.id = fields[1];
    channel.phase = fields[2];
    channel.circuit = fields[3];
    channel.normal_state = static_cast<int>(optional_double(fields, 4, 0.0, "normal state", line_number));
    return channel;
  }

  // 1991 layout: Dn,ch_id,y
  if (fields.size() >= 2) {
    channel.index = require_count(fields[0], "digital channel index", line_number);
    channel.id = fields[1];
    channel.normal_state = static_cast<int>(optional_double(fields, 2, 0.0, "normal state", line_number));
    return channel;
  }

  throw parse_error("cfg", line_number, "digital channel needs at least 2 fields");
}

data_format format_of(const std::string& file_type) {
  const std::string upper = to_upper(trim(file_type));
  if (upper == "ASCII") {
    return data_format::ASCII;
  }
  if (upper == "BINARY") {
    return data_format::BINARY;
  }
  if (upper == "BINARY32") {
    return data_format::BINARY32;
  }
  if (upper == "FLOAT32") {
    return data_format::FLOAT32;
  }
  throw std::runtime_error("unsupported data file type '" + file_type + "'");
}

struct RawRecords {
  std::vector<double> timestamps{};
  std::vector<std::vector<double>> analog{};
  std::vector<std::vector<std::uint8_t>> digital{};
};

RawRecords make_raw_records(const ComtradeConfig& config) {
  RawRecords raw{};
  raw.analog.resize(config.analog.size());
  raw.digital.resize(config.digital.size());
  return raw;
}

void read_ascii_records(const ComtradeConfig& config, std::istream& input, RawRecords& raw) {
  const std::size_t expected_fields = 2 + config.analog.size() + config.digital.size();

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    // 0x1A is the legacy end-of-file marker some recorders append.
    if (trim(line).empty() || line.front() == '\x1a') {
      continue;
    }

    const auto fields = split_fields(line);
    if (fields.size() < expected_fields) {
      throw parse_error("dat", line_number,
                        "expected " + std::to_string(expected_fields) + " fields, found " +
                            std::to_string(fields.size()));
    }

    double timestamp = kMissing;
    if (!fields[1].empty() && !try_parse_double(fields[1], timestamp)) {
      throw parse_error("dat", line_number, "invalid timestamp '" + fields[1] + "'");
    }
    raw.timestamps.push_back(timestamp);

    for (std::size_t a = 0; a < config.analog.size(); ++a) {
      double value = 0.0;
      if (!try_parse_double(fields[2 + a], value)) {
        throw parse_error("dat", line_number,
                          "invalid value '" + fields[2 + a] + "' for analog channel '" + config.analog[a].id + "'");
      }
      raw.analog[a].push_back(value);
    }

    const std::size_t digital_begin = 2 + config.analog.size();
    for (std::size_t d = 0; d < config.digital.size(); ++d) {
      const std::string& field = fields[digital_begin + d];
      if (field != "0" && field != "1") {
        throw parse_error("dat", line_number,
                          "invalid status '" + field + "' for digital channel '" + config.digital[d].id + "'");
      }
      raw.digital[d].push_back(static_cast<std::uint8_t>(field == "1" ? 1U : 0U));
    }
  }
}

std::uint16_t read_u16(const unsigned char* data) noexcept {
  return static_cast<std::uint16_t>(data[0] | (data[1] << 8U));
}

std::uint32_t read_u32(const unsigned char* data) noexcept {
  return static_cast<std::uint32_t>(data[0]) | (static_cast<std::uint32_t>(data[1]) << 8U) |
         (static_cast<std::uint32_t>(data[2]) << 16U) | (static_cast<std::uint32_t>(data[3]) << 24U);
}

double read_analog(const unsigned char* data, const data_format format) noexcept {
  switch (format) {
    case data_format::BINARY:
      return static_cast<double>(static_cast<std::int16_t>(read_u16(data)));
    case data_format::BINARY32:
      return static_cast<double>(static_cast<std::int32_t>(read_u32(data)));
    case data_format::FLOAT32: {
      const std::uint32_t bits = read_u32(data);
      float value = 0.0F;
      std::memcpy(&value, &bits, sizeof(value));
      return static_cast<double>(value);
    }
    case data_format::ASCII:
      break;
  }
  return kMissing;
}

void read_binary_records(const ComtradeConfig& config, std::istream& input, const data_format format,
                         RawRecords& raw) {
  const std::size_t analog_width = format == data_format::BINARY ? 2U : 4U;
  const std::size_t status_words = (config.digital.size() + 15U) / 16U;
  const std::size_t record_size = 8U + (analog_width * config.analog.size()) + (2U * status_words);

  const std::vector<char> bytes{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
  if (bytes.size() % record_size != 0U) {
    throw std::runtime_error("binary data holds " + std::to_string(bytes.size()) +
                             " bytes, not a multiple of the " + std::to_string(record_size) + "-byte record size");
  }

  const auto* data = reinterpret_cast<const unsigned char*>(bytes.data());
  const std::size_t records = bytes.size() / record_size;
  raw.timestamps.reserve(records);

  for (std::size_t r = 0; r < records; ++r) {
    const unsigned char* record = data + (r * record_size);
    const std::uint32_t timestamp = read_u32(record + 4);
    raw.timestamps.push_back(timestamp == 0xFFFFFFFFU ? kMissing : static_cast<double>(timestamp));

    const unsigned char* analog = record + 8;
    for (std::size_t a = 0; a < config.analog.size(); ++a) {
      const double value = read_analog(analog + (a * analog_width), format);
      if (!std::isfinite(value)) {
        throw std::runtime_error("dat record " + std::to_string(r + 1) + ": non-finite value for analog channel '" +
                                 config.analog[a].id + "'");
      }
      raw.analog[a].push_back(value);
    }

    const unsigned char* status = analog + (analog_width * config.analog.size());
    for (std::size_t d = 0; d < config.digital.size(); ++d) {
      const std::uint16_t word = read_u16(status + (2U * (d / 16U)));
      raw.digital[d].push_back(static_cast<std::uint8_t>((word >> (d % 16U)) & 1U));
    }
  }
}

std::vector<double> build_time_base(const model::RecordingMetadata& metadata, const std::vector<double>& timestamps) {
  std::vector<double> time(timestamps.size());
  if (time.empty()) {
    return time;
  }

  const bool use_rates =
      !metadata.sample_rates.empty() &&
      std::all_of(metadata.sample_rates.begin(), metadata.sample_rates.end(),
                  [](const model::SampleRate& rate) { return rate.rate_hz > 0.0; });

  if (use_rates) {
    std::size_t segment = 0;
    time[0] = 0.0;
    for (std::size_t i = 1; i < time.size(); ++i) {
      const std::uint64_t sample_number = i + 1;
      while (segment + 1 < metadata.sample_rates.size() && sample_number > metadata.sample_rates[segment].end_sample) {
        ++segment;
      }
      time[i] = time[i - 1] + (1.0 / metadata.sample_rates[segment].rate_hz);
    }
    return time;
  }

  for (std::size_t i = 0; i < time.size(); ++i) {
    if (std::isnan(timestamps[i])) {
      throw std::runtime_error("sample " + std::to_string(i + 1) +
                               " has no timestamp and the configuration declares no sampling rate");
    }
    time[i] = timestamps[i] * metadata.time_multiplier * 1e-6;
  }
  return time;
}

struct CffSections {
  std::string cfg{};
  std::string dat{};
  bool has_cfg{false};
  bool has_dat{false};
};

std::size_t find_marker(const std::string& content, const std::size_t from) {
  std::size_t pos = content.find(kCffMarker, from);
  while (pos != std::string::npos && pos != 0 && content[pos - 1] != '\n') {
    pos = content.find(kCffMarker, pos + 1);
  }
  return pos;
}

CffSections split_cff(const std::string& content) {
  CffSections sections{};

  std::size_t marker = find_marker(content, 0);
  while (marker != std::string::npos) {
    const std::size_t header_end = content.find('\n', marker);
    if (header_end == std::string::npos) {
      break;
    }

    std::string header = trim(content.substr(marker + kCffMarker.size(), header_end - marker - kCffMarker.size()));
    while (!header.empty() && header.back() == '-') {
      header.pop_back();
    }
    header = trim(header);
    const std::string upper = to_upper(header);
    const std::size_t body_begin = header_end + 1;

    if (upper.rfind("DAT BINARY", 0) == 0) {
      const auto colon = header.find(':');
      if (colon == std::string::npos) {
        throw std::runtime_error("cff binary data section has no byte count");
      }
      const auto size = static_cast<std::size_t>(std::stoull(header.substr(colon + 1)));
      if (body_begin + size > content.size()) {
        throw std::runtime_error("cff binary data section is truncated");
      }
      sections.dat = content.substr(body_begin, size);
      sections.has_dat = true;
      marker = find_marker(content, body_begin + size);
      continue;
    }

    const std::size_t next = find_marker(content, body_begin);
    const std::size_t body_end = next == std::string::npos ? content.size() : next;
    if (upper == "CFG") {
      sections.cfg = content.substr(body_begin, body_end - body_begin);
      sections.has_cfg = true;
    } else if (upper == "DAT ASCII") {
      sections.dat = content.substr(body_begin, body_end - body_begin);
      sections.has_dat = true;
    }
    marker = next;
  }

  if (!sections.has_cfg) {
    throw std::runtime_error("cff file has no CFG section");
  }
  return sections;
}

std::string read_file(const std::string& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open file: " + path);
  }
  return std::string{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
}

}  // namespace

bool is_known_file_type(const std::string& file_type) {
  const std::string upper = to_upper(trim(file_type));
  return upper == "ASCII" || upper == "BINARY" || upper == "BINARY32" || upper == "FLOAT32";
}

ComtradeConfig parse_comtrade_config(std::istream& input) {
  ComtradeConfig config{};
  model::RecordingMetadata& metadata = config.metadata;
  LineReader reader(input);

  {
    const auto fields = split_fields(reader.require("station line"));
    metadata.station_name = fields.empty() ? std::string{} : fields[0];
    metadata.recorder_id = fields.size() > 1 ? fields[1] : std::string{};
    if (fields.size() > 2 && !fields[2].empty()) {
      metadata.revision_year = static_cast<int>(require_double(fields[2], "revision year", reader.line_number()));
    }
  }

  {
    const auto fields = split_fields(reader.require("channel count line"));
    if (fields.size() < 3) {
      throw parse_error("cfg", reader.line_number(), "channel count line needs TT,##A,##D");
    }
    metadata.declared_total_channels = require_count(fields[0], "total channel count", reader.line_number());
    metadata.declared_analog_channels = require_count(fields[1], "analog channel count", reader.line_number());
    metadata.declared_digital_channels = require_count(fields[2], "digital channel count", reader.line_number());
  }

  config.analog.reserve(metadata.declared_analog_channels);
  for (std::size_t i = 0; i < metadata.declared_analog_channels; ++i) {
    const std::string line = reader.require("analog channel line");
    config.analog.push_back(parse_analog_line(line, reader.line_number()));
  }

  config.digital.reserve(metadata.declared_digital_channels);
  for (std::size_t i = 0; i < metadata.declared_digital_channels; ++i) {
    const std::string line = reader.require("digital channel line");
    config.digital.push_back(parse_digital_line(line, reader.line_number()));
  }

  metadata.frequency_hz = require_double(trim(reader.require("line frequency")), "line frequency", reader.line_number());

  const std::size_t rate_count = require_count(trim(reader.require("sampling rate count")), "sampling rate count",
                                               reader.line_number());
  // A zero count is still followed by one "0,endsamp" line.
  const std::size_t rate_lines = rate_count == 0 ? 1 : rate_count;
  for (std::size_t i = 0; i < rate_lines; ++i) {
    const auto fields = split_fields(reader.require("sampling rate line"));
    if (fields.size() < 2) {
      throw parse_error("cfg", reader.line_number(), "sampling rate line needs samp,endsamp");
    }
    const double rate = require_double(fields[0], "sampling rate", reader.line_number());
    const std::size_t end_sample = require_count(fields[1], "end sample", reader.line_number());
    if (rate_count != 0) {
      metadata.sample_rates.push_back(model::SampleRate{rate, end_sample});
    }
  }

  metadata.start_timestamp = trim(reader.require("start timestamp"));
  metadata.trigger_timestamp = trim(reader.require("trigger timestamp"));
  metadata.file_type = trim(reader.require("file type"));

  std::string line;
  if (reader.next(line) && !trim(line).empty()) {
    metadata.time_multiplier = require_double(trim(line), "time multiplier", reader.line_number());
  }

  return config;
}

model::Recording parse_comtrade_data(const ComtradeConfig& config, std::istream& input) {
  const data_format format = format_of(config.metadata.file_type);

  RawRecords raw = make_raw_records(config);
  if (format == data_format::ASCII) {
    read_ascii_records(config, input, raw);
  } else {
    read_binary_records(config, input, format, raw);
  }

  std::vector<model::AnalogChannel> analog;
  analog.reserve(config.analog.size());
  for (std::size_t a = 0; a < config.analog.size(); ++a) {
    const AnalogChannelConfig& channel = config.analog[a];
    std::vector<double> samples = std::move(raw.analog[a]);
    for (double& sample : samples) {
      sample = (channel.multiplier * sample) + channel.offset;
    }
    analog.push_back(model::AnalogChannel{channel.id, channel.phase, channel.unit, std::move(samples)});
  }

  std::vector<model::DigitalChannel> digital;
  digital.reserve(config.digital.size());
  for (std::size_t d = 0; d < config.digital.size(); ++d) {
    digital.push_back(model::DigitalChannel{config.digital[d].id, std::move(raw.digital[d])});
  }

  std::vector<double> time = build_time_base(config.metadata, raw.timestamps);
  return model::Recording(config.metadata, std::move(time), std::move(analog), std::move(digital));
}

ComtradeConfig load_comtrade_config(const std::string& path) {
  if (ends_with_ci(path, ".cff")) {
    std::istringstream cfg(split_cff(read_file(path)).cfg);
    return parse_comtrade_config(cfg);
  }

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }
  return parse_comtrade_config(input);
}

model::Recording load_comtrade(const std::string& path) {
  ComtradeConfig config{};
  std::unique_ptr<std::istream> data;

  if (ends_with_ci(path, ".cff")) {
    CffSections sections = split_cff(read_file(path));
    if (!sections.has_dat) {
      throw std::runtime_error("cff file has no DAT section: " + path);
    }
    std::istringstream cfg(sections.cfg);
    config = parse_comtrade_config(cfg);
    data = std::make_unique<std::istringstream>(std::move(sections.dat), std::ios::in | std::ios::binary);
  } else {
    config = load_comtrade_config(path);
    const std::string dat_path = dat_path_for(path);
    auto file = std::make_unique<std::ifstream>(dat_path, std::ios::binary);
    if (!file->is_open()) {
      throw std::runtime_error("unable to open data file: " + dat_path);
    }
    data = std::move(file);
  }

  model::Recording recording = parse_comtrade_data(config, *data);

  if (!config.metadata.sample_rates.empty()) {
    const std::uint64_t declared = config.metadata.sample_rates.back().end_sample;
    if (declared != recording.sample_count()) {
      std::cerr << "[loader] " << path << ": configuration declares " << declared << " samples, data holds "
                << recording.sample_count() << '\n';
    }
  }

  return recording;
}

std::string dat_path_for(const std::string& cfg_path) {
  if (cfg_path.size() >= 4 && ends_with_ci(cfg_path, ".cfg")) {
    const std::string stem = cfg_path.substr(0, cfg_path.size() - 4);
    const bool upper = cfg_path.substr(cfg_path.size() - 3) == "CFG";
    return stem + (upper ? ".DAT" : ".dat");
  }
  return cfg_path + ".dat";
}

}  // namespace comtrade_analyzer::io
