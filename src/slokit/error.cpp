#include <slokit/error.h>

#include <ostream>
#include <sstream>

namespace slokit {
namespace normalizer {

std::ostream& operator<<(std::ostream& stream, const Error& error) {
  return stream << "[slokit error code " << int(error.code) << "] "
                << error.message;
}

std::string Error::to_string() const {
  std::ostringstream stream;
  stream << *this;
  return stream.str();
}

Error Error::with_prefix(std::string_view prefix) const {
  Error result{code, ""};
  result.message.reserve(prefix.size() + message.size());
  result.message.append(prefix.begin(), prefix.end());
  result.message += message;
  return result;
}

}  // namespace normalizer
}  // namespace slokit
