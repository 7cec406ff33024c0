#pragma once

// This component provides a class template, `Channel<T>`, a closable FIFO used
// to pass events between pipeline stages running on different threads.
//
// A channel has a capacity. When the capacity is zero the channel is
// unbounded and `push` never blocks; otherwise `push` blocks while the channel
// is full. `pop` blocks while the channel is empty and open.
//
// `close` is how a producer signals that no more items will be pushed. After
// `close`:
//
// - `push` returns `false` immediately and discards its argument.
// - `pop` continues to return the items already queued, and then returns
//   `std::nullopt` once the channel is drained.
//
// `close` may be called more than once; calls after the first have no effect.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace slokit {
namespace normalizer {

template <typename T>
class Channel {
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  std::size_t capacity_;
  bool closed_ = false;

  bool full() const { return capacity_ != 0 && items_.size() >= capacity_; }

 public:
  explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {}

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  // Append `item`, waiting for room if the channel is bounded and full.
  // Return `false` if the channel is closed, in which case `item` is
  // discarded.
  bool push(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]() { return closed_ || !full(); });
    if (closed_) {
      return false;
    }
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  // Remove and return the oldest item, waiting for one if the channel is
  // empty. Return `std::nullopt` once the channel is closed and empty.
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this]() { return closed_ || !items_.empty(); });
    if (items_.empty()) {
      return std::nullopt;
    }
    std::optional<T> item{std::move(items_.front())};
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  // Remove and return the oldest item if there is one, without waiting.
  std::optional<T> try_pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    std::optional<T> item{std::move(items_.front())};
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  std::size_t capacity() const { return capacity_; }
};

}  // namespace normalizer
}  // namespace slokit
