#pragma once

// This component provides a registry of the environment variables that
// override the normalizer's configuration, and functions for reading them.
//
// `enum Variable` has an enumerator for each variable. The enumerator's name
// is the variable's name without the leading "SLOKIT_".

#include <optional>
#include <string>
#include <string_view>

namespace slokit {
namespace normalizer {
namespace environment {

// Keep this sorted. The values must correspond to offsets within
// `variable_names`.
enum Variable {
  EVENT_KEY_QUERY_PARAM,
  NORMALIZER_DEBUG,
  REWRITE_RULES,
  SANITIZE_FONTS,
  SANITIZE_HASHES,
  SANITIZE_IMAGES,
  SANITIZE_IPS,
  SANITIZE_NUMBERS,
  SANITIZE_UUIDS,
  STARTUP_LOGS,
};

// Keep this sorted. Offsets into this array are indicated by `Variable`
// values.
inline const char* const variable_names[] = {
    "SLOKIT_EVENT_KEY_QUERY_PARAM",
    "SLOKIT_NORMALIZER_DEBUG",
    "SLOKIT_REWRITE_RULES",
    "SLOKIT_SANITIZE_FONTS",
    "SLOKIT_SANITIZE_HASHES",
    "SLOKIT_SANITIZE_IMAGES",
    "SLOKIT_SANITIZE_IPS",
    "SLOKIT_SANITIZE_NUMBERS",
    "SLOKIT_SANITIZE_UUIDS",
    "SLOKIT_STARTUP_LOGS",
};

// Return the name of the specified environment `variable`.
std::string_view name(Variable variable);

// Return the value of the specified environment `variable`, or return
// `std::nullopt` if that variable is not set in the environment.
std::optional<std::string> lookup(Variable variable);

// Return a JSON object, serialized as a string, whose properties are the
// variables above that are set, and whose values are their values.
std::string to_json();

}  // namespace environment
}  // namespace normalizer
}  // namespace slokit
