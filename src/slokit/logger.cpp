#include <slokit/error.h>
#include <slokit/logger.h>

#include <ostream>

namespace slokit {
namespace normalizer {

void Logger::log_error(const Error& error) {
  log_error([&](std::ostream& stream) { stream << error; });
}

void Logger::log_error(std::string_view message) {
  log_error([&](std::ostream& stream) { stream << message; });
}

}  // namespace normalizer
}  // namespace slokit
