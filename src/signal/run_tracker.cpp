#include "signal/run_tracker.hpp"

#include <utility>

namespace comtrade_analyzer::signal {

RunTracker::RunTracker(const run_extreme extreme) noexcept : extreme_kind_(extreme) {}

void RunTracker::sample(const std::size_t index, const bool active, const double magnitude) {
  switch (state_) {
    case run_state::OUTSIDE_RUN:
      if (active) {
        current_ = Run{index, index, magnitude};
        state_ = run_state::INSIDE_RUN;
      }
      break;

    case run_state::INSIDE_RUN:
      if (!active) {
        close();
        break;
      }
      current_.last = index;
      if (extreme_kind_ == run_extreme::MINIMUM ? magnitude < current_.extreme : magnitude > current_.extreme) {
        current_.extreme = magnitude;
      }
      break;
  }
}

void RunTracker::finish() {
  if (state_ == run_state::INSIDE_RUN) {
    close();
  }
}

std::vector<Run> RunTracker::take_runs() noexcept {
  std::vector<Run> out = std::move(runs_);
  runs_.clear();
  return out;
}

void RunTracker::close() {
  runs_.push_back(current_);
  state_ = run_state::OUTSIDE_RUN;
}

}  // namespace comtrade_analyzer::signal
