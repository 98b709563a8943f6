#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace comtrade_analyzer::model {

struct AnalogChannel {
  std::string id;
  std::string phase;
  std::string unit;
  std::vector<double> samples;
};

struct DigitalChannel {
  std::string id;
  std::vector<std::uint8_t> samples;
};

struct SampleRate {
  double rate_hz;
  std::uint64_t end_sample;
};

// Header fields of the .cfg file, kept as declared even when they disagree
// with the data body.
struct RecordingMetadata {
  std::string station_name{};
  std::string recorder_id{};
  int revision_year{1991};
  std::size_t declared_total_channels{0};
  std::size_t declared_analog_channels{0};
  std::size_t declared_digital_channels{0};
  double frequency_hz{0.0};
  std::vector<SampleRate> sample_rates{};
  std::string start_timestamp{};
  std::string trigger_timestamp{};
  std::string file_type{};
  double time_multiplier{1.0};
};

// Immutable view of a loaded recording. Every channel carries exactly one
// sample per time base entry.
class Recording {
 public:
  Recording(RecordingMetadata metadata, std::vector<double> time, std::vector<AnalogChannel> analog,
            std::vector<DigitalChannel> digital);

  [[nodiscard]] const RecordingMetadata& metadata() const noexcept { return metadata_; }
  [[nodiscard]] const std::vector<double>& time() const noexcept { return time_; }
  [[nodiscard]] const std::vector<AnalogChannel>& analog_channels() const noexcept { return analog_; }
  [[nodiscard]] const std::vector<DigitalChannel>& digital_channels() const noexcept { return digital_; }
  [[nodiscard]] std::size_t sample_count() const noexcept { return time_.size(); }

  // Lookup is case-insensitive and ignores surrounding whitespace.
  [[nodiscard]] const AnalogChannel* find_analog(const std::string& id) const;
  [[nodiscard]] const DigitalChannel* find_digital(const std::string& id) const;

  [[nodiscard]] std::vector<std::string> analog_ids() const;
  [[nodiscard]] std::vector<std::string> digital_ids() const;

 private:
  RecordingMetadata metadata_;
  std::vector<double> time_;
  std::vector<AnalogChannel> analog_;
  std::vector<DigitalChannel> digital_;
  std::unordered_map<std::string, std::size_t> analog_index_{};
  std::unordered_map<std::string, std::size_t> digital_index_{};
};

std::string normalize_channel_id(const std::string& id);

}  // namespace comtrade_analyzer::model
