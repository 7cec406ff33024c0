#pragma once

// This component provides an interface, `Logger`, through which the normalizer
// reports configuration problems, its startup configuration, and per-event
// diagnostics.
//
// Messages are produced lazily: callers pass a `LogFunc` that writes to a
// `std::ostream`, and an implementation that discards a category of message
// never pays for formatting it.
//
// `log_debug` has a no-op default so that implementations interested only in
// errors and startup banners need not override it.

#include <functional>
#include <iosfwd>
#include <string_view>

namespace slokit {
namespace normalizer {

struct Error;

class Logger {
 public:
  using LogFunc = std::function<void(std::ostream&)>;

  virtual ~Logger() {}

  virtual void log_error(const LogFunc&) = 0;
  virtual void log_startup(const LogFunc&) = 0;
  virtual void log_debug(const LogFunc&) {}

  virtual void log_error(const Error&);
  virtual void log_error(std::string_view);
};

}  // namespace normalizer
}  // namespace slokit
