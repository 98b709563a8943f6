#pragma once

#include <cstdint>
#include <span>
#include <string>

#include "model/recording.hpp"

namespace comtrade_analyzer::signal {

// Non-owning view of one channel plus the shared time base. Valid while the
// recording it was taken from is alive.
template <typename T>
struct Waveform {
  std::string channel_id;
  std::span<const T> samples;
  std::span<const double> time;
};

using AnalogWaveform = Waveform<double>;
using DigitalWaveform = Waveform<std::uint8_t>;

// Both throw core::AnalysisError(CHANNEL_NOT_FOUND) for unknown identifiers.
AnalogWaveform analog_waveform(const model::Recording& recording, const std::string& channel_id);
DigitalWaveform digital_waveform(const model::Recording& recording, const std::string& channel_id);

}  // namespace comtrade_analyzer::signal
