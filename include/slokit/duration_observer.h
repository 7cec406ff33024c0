#pragma once

// This component provides an interface, `DurationObserver`, that receives one
// processing-time measurement per event handled by a `NormalizationStage`, and
// two implementations:
//
// - `NullDurationObserver` discards every measurement. It is what a stage uses
//   when no observer is supplied.
// - `DurationHistogram` keeps a bounded sample of measurements that an
//   exporter can periodically collect with `capture_and_reset_values`.
//
// Measurements are in seconds.

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace slokit {
namespace normalizer {

class DurationObserver {
 public:
  virtual ~DurationObserver() = default;

  virtual void observe(double seconds) = 0;
};

class NullDurationObserver : public DurationObserver {
 public:
  void observe(double) override {}
};

class DurationHistogram : public DurationObserver {
  std::string name_;
  std::vector<std::string> tags_;
  std::size_t max_size_;

  std::mutex mutex_;
  std::vector<double> values_;
  std::uint64_t count_ = 0;
  double sum_ = 0;
  std::minstd_rand replacement_;

 public:
  static constexpr std::size_t default_max_size = 1000;

  DurationHistogram(std::string name, std::vector<std::string> tags,
                    std::size_t max_size = default_max_size);

  // Record `seconds`. Once `max_size` samples are held, a new sample
  // replaces a randomly chosen one.
  void observe(double seconds) override;

  const std::string& name() const { return name_; }
  const std::vector<std::string>& tags() const { return tags_; }

  // Number of measurements observed since the last reset. Unlike the sample,
  // this is not bounded by `max_size`.
  std::uint64_t count();
  // Sum of measurements observed since the last reset.
  double sum();

  // Return the held samples and clear them, along with the count and sum.
  std::vector<double> capture_and_reset_values();
};

}  // namespace normalizer
}  // namespace slokit
