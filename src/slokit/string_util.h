#pragma once

// This component provides string-related miscellanea shared by the sanitizer,
// the key builder, and the configuration loader.

#include <string>
#include <string_view>
#include <vector>

namespace slokit {
namespace normalizer {

// Return a string representation of the specified boolean `value`.
// The result is "true" for `true` and "false" for `false`.
std::string to_string(bool value);

// Convert the specified `text` to lower case in-place.
void to_lower(std::string& text);

// Return whether the specified `subject` ends with the specified `suffix`,
// comparing ASCII letters case-insensitively.
bool ends_with_ignore_case(std::string_view subject, std::string_view suffix);

// Remove leading and trailing whitespace from the specified `input`.
std::string_view trim(std::string_view input);

// Return the elements of `values` separated by `separator`.
std::string join(const std::vector<std::string>& values,
                 std::string_view separator);

// Return the pieces of `input` between occurrences of `separator`. Adjacent,
// leading, and trailing separators produce empty pieces, so the result always
// has one more element than there are separators.
std::vector<std::string> split(std::string_view input, char separator);

}  // namespace normalizer
}  // namespace slokit
