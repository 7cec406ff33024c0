#pragma once

// This component provides parsing-related miscellanea.

#include <slokit/expected.h>

#include <string_view>

namespace slokit {
namespace normalizer {

// Return a boolean parsed from the specified `input`, or return an `Error` if
// `input` is not one of "true", "1", "yes", "on", "false", "0", "no", or
// "off". Case and leading and trailing whitespace are ignored.
Expected<bool> parse_bool(std::string_view input);

}  // namespace normalizer
}  // namespace slokit
