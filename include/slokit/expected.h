#pragma once

// This component provides a class template, `Expected<Value>`, that holds
// either a `Value` or an `Error`. Operations that can fail at configuration
// time return an `Expected` instead of throwing.
//
// `Expected<void>` holds either nothing (success) or an `Error`.
//
//     Expected<FinalizedNormalizerConfig> config = finalize_config(raw);
//     if (auto* error = config.if_error()) {
//       logger.log_error(*error);
//       return;
//     }
//     NormalizationStage stage{*config};

#include <optional>
#include <utility>
#include <variant>

#include "error.h"

namespace slokit {
namespace normalizer {

template <typename Value>
class Expected {
  std::variant<Value, Error> data_;

 public:
  Expected() = default;
  Expected(const Expected&) = default;
  Expected(Expected&) = default;
  Expected(Expected&&) = default;
  Expected& operator=(const Expected&) = default;
  Expected& operator=(Expected&&) = default;

  template <typename Other>
  Expected(Other&& other) : data_(std::forward<Other>(other)) {}

  template <typename Other>
  Expected& operator=(Other&& other) {
    data_ = std::forward<Other>(other);
    return *this;
  }

  bool has_value() const noexcept {
    return std::holds_alternative<Value>(data_);
  }
  explicit operator bool() const noexcept { return has_value(); }

  Value& value() & { return std::get<0>(data_); }
  const Value& value() const& { return std::get<0>(data_); }
  Value&& value() && { return std::move(std::get<0>(data_)); }

  template <typename Other>
  Value value_or(Other&& fallback) const& {
    if (has_value()) {
      return value();
    }
    return static_cast<Value>(std::forward<Other>(fallback));
  }

  Value& operator*() & { return value(); }
  const Value& operator*() const& { return value(); }
  Value&& operator*() && { return std::move(value()); }

  Value* operator->() { return &value(); }
  const Value* operator->() const { return &value(); }

  Error& error() & { return std::get<1>(data_); }
  const Error& error() const& { return std::get<1>(data_); }
  Error&& error() && { return std::move(std::get<1>(data_)); }

  Error* if_error() & { return std::get_if<1>(&data_); }
  const Error* if_error() const& { return std::get_if<1>(&data_); }
  // Don't use `if_error` on an rvalue (temporary).
  Error* if_error() && = delete;
  const Error* if_error() const&& = delete;
};

template <>
class Expected<void> {
  std::optional<Error> data_;

 public:
  Expected() = default;
  Expected(const Expected&) = default;
  Expected(Expected&) = default;
  Expected(Expected&&) = default;
  Expected& operator=(const Expected&) = default;
  Expected& operator=(Expected&&) = default;

  template <typename Other>
  Expected(Other&& other) : data_(std::forward<Other>(other)) {}

  template <typename Other>
  Expected& operator=(Other&& other) {
    data_ = std::forward<Other>(other);
    return *this;
  }

  bool has_value() const noexcept { return !data_.has_value(); }
  explicit operator bool() const noexcept { return has_value(); }

  Error& error() & { return *data_; }
  const Error& error() const& { return *data_; }
  Error&& error() && { return std::move(*data_); }

  Error* if_error() & { return data_ ? &*data_ : nullptr; }
  const Error* if_error() const& { return data_ ? &*data_ : nullptr; }
  Error* if_error() && = delete;
  const Error* if_error() const&& = delete;
};

}  // namespace normalizer
}  // namespace slokit
