#include "signal/waveform.hpp"

#include "core/error.hpp"

namespace comtrade_analyzer::signal {

AnalogWaveform analog_waveform(const model::Recording& recording, const std::string& channel_id) {
  const model::AnalogChannel* channel = recording.find_analog(channel_id);
  if (channel == nullptr) {
    throw core::AnalysisError(core::error_code::CHANNEL_NOT_FOUND,
                              "analog channel '" + channel_id + "' not found");
  }
  return AnalogWaveform{channel->id, channel->samples, recording.time()};
}

DigitalWaveform digital_waveform(const model::Recording& recording, const std::string& channel_id) {
  const model::DigitalChannel* channel = recording.find_digital(channel_id);
  if (channel == nullptr) {
    throw core::AnalysisError(core::error_code::CHANNEL_NOT_FOUND,
                              "digital channel '" + channel_id + "' not found");
  }
  return DigitalWaveform{channel->id, channel->samples, recording.time()};
}

}  // namespace comtrade_analyzer::signal
