#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace comtrade_analyzer::signal {

enum class run_state : std::uint8_t {
  OUTSIDE_RUN = 0,
  INSIDE_RUN = 1,
};

enum class run_extreme : std::uint8_t {
  MINIMUM = 0,
  MAXIMUM = 1,
};

// A maximal stretch of consecutive active samples. first/last are inclusive
// indices into the sequence fed to the tracker.
struct Run {
  std::size_t first;
  std::size_t last;
  double extreme;
};

// Two-state machine that turns a per-sample predicate into runs. A run opens
// on the first active sample after an inactive one (or at the first sample),
// follows the running minimum or maximum of the magnitudes it sees, and
// closes at its last active sample. finish() closes a run left open at the
// end of the sequence.
class RunTracker {
 public:
  explicit RunTracker(run_extreme extreme) noexcept;

  void sample(std::size_t index, bool active, double magnitude);
  void finish();

  [[nodiscard]] run_state state() const noexcept { return state_; }
  [[nodiscard]] const std::vector<Run>& runs() const noexcept { return runs_; }
  std::vector<Run> take_runs() noexcept;

 private:
  void close();

  run_extreme extreme_kind_;
  run_state state_{run_state::OUTSIDE_RUN};
  Run current_{};
  std::vector<Run> runs_{};
};

// Feeds indices [0, count) through a RunTracker.
template <typename ActiveFn, typename MagnitudeFn>
std::vector<Run> find_runs(const std::size_t count, const run_extreme extreme, ActiveFn&& active,
                           MagnitudeFn&& magnitude) {
  RunTracker tracker(extreme);
  for (std::size_t i = 0; i < count; ++i) {
    const bool is_active = active(i);
    tracker.sample(i, is_active, is_active ? magnitude(i) : 0.0);
  }
  tracker.finish();
  return tracker.take_runs();
}

}  // namespace comtrade_analyzer::signal
