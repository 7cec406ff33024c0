#pragma once

// This component provides the time source used by `NormalizationStage` to
// measure how long each event spends in the stage.
//
// `Clock` is a `std::function` so that tests can substitute a deterministic
// sequence of time points for the monotonic clock.

#include <chrono>
#include <functional>

namespace slokit {
namespace normalizer {

using Duration = std::chrono::steady_clock::duration;
using TimePoint = std::chrono::steady_clock::time_point;

// Return `duration` as floating point seconds.
inline double to_seconds(Duration duration) {
  return std::chrono::duration<double>(duration).count();
}

using Clock = std::function<TimePoint()>;

extern const Clock default_clock;

}  // namespace normalizer
}  // namespace slokit
