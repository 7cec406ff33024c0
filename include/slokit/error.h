#pragma once

// This component provides a `struct`, `Error`, that conveys an error code and
// a diagnostic message. `Error` is the failure half of `Expected`.

#include <iosfwd>
#include <string>
#include <string_view>

namespace slokit {
namespace normalizer {

struct Error {
  // Don't change the numeric values of existing codes; they may appear in
  // logs and in tooling that consumes them.
  enum Code {
    OTHER = 1,
    REWRITE_RULE_INVALID_PATTERN = 2,
    CONFIG_INVALID_JSON = 3,
    CONFIG_WRONG_TYPE = 4,
    CONFIG_UNKNOWN_PROPERTY = 5,
    CONFIG_PROPERTY_WRONG_TYPE = 6,
    CONFIG_MISSING_PROPERTY = 7,
    CONFIG_FILE_UNREADABLE = 8,
    INVALID_BOOLEAN = 9,
    REWRITE_RULES_INVALID_JSON = 10,
    REWRITE_RULES_WRONG_TYPE = 11,
    URL_INVALID = 12,
    STAGE_ALREADY_RUNNING = 13,
  };

  Code code;
  std::string message;

  std::string to_string() const;
  Error with_prefix(std::string_view) const;
};

std::ostream& operator<<(std::ostream&, const Error&);

}  // namespace normalizer
}  // namespace slokit
