#include <slokit/cerr_logger.h>

#include <iostream>

namespace slokit {
namespace normalizer {

CerrLogger::CerrLogger(bool debug) : debug_(debug) {}

void CerrLogger::log_error(const LogFunc& write) { log("error", write); }

void CerrLogger::log_startup(const LogFunc& write) { log("info", write); }

void CerrLogger::log_debug(const LogFunc& write) {
  if (!debug_) {
    return;
  }
  log("debug", write);
}

void CerrLogger::log(const char* level, const LogFunc& write) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << "slokit[" << level << "] ";
  write(stream_);
  stream_ << '\n';
  std::cerr << stream_.str();
  stream_.str("");
}

}  // namespace normalizer
}  // namespace slokit
