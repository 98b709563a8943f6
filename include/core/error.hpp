#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace comtrade_analyzer::core {

enum class error_code : std::uint8_t {
  CHANNEL_NOT_FOUND = 0,
  INVALID_WINDOW = 1,
  INVALID_REFERENCE = 2,
  INSUFFICIENT_DATA = 3,
};

const char* to_string(error_code code) noexcept;

// Raised when an analysis request is malformed. "No pattern found" is never
// an error; detectors return an empty result for it.
class AnalysisError : public std::runtime_error {
 public:
  AnalysisError(error_code code, const std::string& message);

  [[nodiscard]] error_code code() const noexcept { return code_; }

 private:
  error_code code_;
};

}  // namespace comtrade_analyzer::core
