#include <slokit/parse_util.h>

#include <string>

#include "string_util.h"

namespace slokit {
namespace normalizer {

Expected<bool> parse_bool(std::string_view input) {
  std::string text{trim(input)};
  to_lower(text);

  if (text == "true" || text == "1" || text == "yes" || text == "on") {
    return true;
  }
  if (text == "false" || text == "0" || text == "no" || text == "off") {
    return false;
  }

  std::string message;
  message += "Is not a valid boolean: \"";
  message.append(input.begin(), input.end());
  message += "\".  Expected one of true, false, 1, 0, yes, no, on, off.";
  return Error{Error::INVALID_BOOLEAN, std::move(message)};
}

}  // namespace normalizer
}  // namespace slokit
