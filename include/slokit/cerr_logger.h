#pragma once

// This component provides a class, `CerrLogger`, that implements the `Logger`
// interface by writing to `std::cerr`. Each message is formatted into a
// private buffer and written in one piece while a mutex is held, so that
// messages from concurrent stages do not interleave.
//
// Debug messages are dropped unless the logger was constructed with
// `debug == true`.

#include <slokit/logger.h>

#include <mutex>
#include <sstream>

namespace slokit {
namespace normalizer {

class CerrLogger : public Logger {
  std::mutex mutex_;
  std::ostringstream stream_;
  bool debug_;

 public:
  explicit CerrLogger(bool debug = false);

  void log_error(const LogFunc&) override;
  void log_startup(const LogFunc&) override;
  void log_debug(const LogFunc&) override;
  using Logger::log_error;  // expose the non-virtual overloads

 private:
  void log(const char* level, const LogFunc&);
};

}  // namespace normalizer
}  // namespace slokit
