#pragma once

// This component provides a class, `NullLogger`, that implements the `Logger`
// interface from `logger.h`.
// `NullLogger` is a no-op logger, meaning it doesn't log anything.
//
// `NullLogger` is the logger used by `finalize_config` when
// `NormalizerConfig::logger` is not set.

#include <slokit/logger.h>

namespace slokit {
namespace normalizer {

class NullLogger : public Logger {
 public:
  void log_error(const LogFunc&) override {}
  void log_startup(const LogFunc&) override {}
  void log_debug(const LogFunc&) override {}

  void log_error(const Error&) override {}
  void log_error(std::string_view) override {}
};

}  // namespace normalizer
}  // namespace slokit
