#include <slokit/duration_observer.h>

namespace slokit {
namespace normalizer {

DurationHistogram::DurationHistogram(std::string name,
                                     std::vector<std::string> tags,
                                     std::size_t max_size)
    : name_(std::move(name)),
      tags_(std::move(tags)),
      max_size_(max_size == 0 ? 1 : max_size) {
  values_.reserve(max_size_);
}

void DurationHistogram::observe(double seconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++count_;
  sum_ += seconds;
  if (values_.size() < max_size_) {
    values_.push_back(seconds);
    return;
  }
  values_[replacement_() % max_size_] = seconds;
}

std::uint64_t DurationHistogram::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_;
}

double DurationHistogram::sum() {
  std::lock_guard<std::mutex> lock(mutex_);
  return sum_;
}

std::vector<double> DurationHistogram::capture_and_reset_values() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<double> result;
  result.swap(values_);
  values_.reserve(max_size_);
  count_ = 0;
  sum_ = 0;
  return result;
}

}  // namespace normalizer
}  // namespace slokit
