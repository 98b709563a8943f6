#include "model/recording.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace comtrade_analyzer::model {

std::string normalize_channel_id(const std::string& id) {
  const auto begin = std::find_if_not(id.begin(), id.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(id.rbegin(), id.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  std::string out;
  if (begin >= end) {
    return out;
  }
  out.reserve(static_cast<std::size_t>(end - begin));
  for (auto it = begin; it != end; ++it) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*it))));
  }
  return out;
}

Recording::Recording(RecordingMetadata metadata, std::vector<double> time, std::vector<AnalogChannel> analog,
                     std::vector<DigitalChannel> digital)
    : metadata_(std::move(metadata)), time_(std::move(time)), analog_(std::move(analog)), digital_(std::move(digital)) {
  for (std::size_t i = 0; i < analog_.size(); ++i) {
    if (analog_[i].samples.size() != time_.size()) {
      throw std::invalid_argument("analog channel '" + analog_[i].id + "' has " +
                                  std::to_string(analog_[i].samples.size()) + " samples, time base has " +
                                  std::to_string(time_.size()));
    }
    // First declaration wins on duplicate identifiers.
    analog_index_.emplace(normalize_channel_id(analog_[i].id), i);
  }

  for (std::size_t i = 0; i < digital_.size(); ++i) {
    if (digital_[i].samples.size() != time_.size()) {
      throw std::invalid_argument("digital channel '" + digital_[i].id + "' has " +
                                  std::to_string(digital_[i].samples.size()) + " samples, time base has " +
                                  std::to_string(time_.size()));
    }
    digital_index_.emplace(normalize_channel_id(digital_[i].id), i);
  }
}

const AnalogChannel* Recording::find_analog(const std::string& id) const {
  const auto it = analog_index_.find(normalize_channel_id(id));
  if (it == analog_index_.end()) {
    return nullptr;
  }
  return &analog_[it->second];
}

const DigitalChannel* Recording::find_digital(const std::string& id) const {
  const auto it = digital_index_.find(normalize_channel_id(id));
  if (it == digital_index_.end()) {
    return nullptr;
  }
  return &digital_[it->second];
}

std::vector<std::string> Recording::analog_ids() const {
  std::vector<std::string> ids;
  ids.reserve(analog_.size());
  for (const auto& channel : analog_) {
    ids.push_back(channel.id);
  }
  return ids;
}

std::vector<std::string> Recording::digital_ids() const {
  std::vector<std::string> ids;
  ids.reserve(digital_.size());
  for (const auto& channel : digital_) {
    ids.push_back(channel.id);
  }
  return ids;
}

}  // namespace comtrade_analyzer::model
