#include "core/error.hpp"

namespace comtrade_analyzer::core {

const char* to_string(const error_code code) noexcept {
  switch (code) {
    case error_code::CHANNEL_NOT_FOUND:
      return "ChannelNotFound";
    case error_code::INVALID_WINDOW:
      return "InvalidWindow";
    case error_code::INVALID_REFERENCE:
      return "InvalidReference";
    case error_code::INSUFFICIENT_DATA:
      return "InsufficientData";
  }
  return "Unknown";
}

AnalysisError::AnalysisError(const error_code code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

}  // namespace comtrade_analyzer::core
