#pragma once

#include <algorithm>

namespace comtrade_analyzer::core {

inline constexpr double clamp01(const double value) noexcept {
  return std::clamp(value, 0.0, 1.0);
}

inline constexpr double square(const double value) noexcept { return value * value; }

}  // namespace comtrade_analyzer::core
