#include "string_util.h"

#include <algorithm>
#include <cctype>

namespace slokit {
namespace normalizer {
namespace {

constexpr std::string_view k_spaces_characters = " \f\n\r\t\v";

char lower(char ch) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

}  // namespace

std::string to_string(bool value) { return value ? "true" : "false"; }

void to_lower(std::string& text) {
  std::transform(text.begin(), text.end(), text.begin(), lower);
}

bool ends_with_ignore_case(std::string_view subject, std::string_view suffix) {
  if (suffix.size() > subject.size()) {
    return false;
  }
  subject.remove_prefix(subject.size() - suffix.size());
  return std::equal(subject.begin(), subject.end(), suffix.begin(),
                    [](char left, char right) {
                      return lower(left) == lower(right);
                    });
}

std::string_view trim(std::string_view input) {
  input.remove_prefix(
      std::min(input.find_first_not_of(k_spaces_characters), input.size()));
  const auto pos = input.find_last_not_of(k_spaces_characters);
  if (pos != input.npos) input.remove_suffix(input.size() - pos - 1);
  return input;
}

std::string join(const std::vector<std::string>& values,
                 std::string_view separator) {
  std::string result;
  auto iter = values.begin();
  if (iter == values.end()) {
    return result;
  }
  result += *iter;
  for (++iter; iter != values.end(); ++iter) {
    result.append(separator.begin(), separator.end());
    result += *iter;
  }
  return result;
}

std::vector<std::string> split(std::string_view input, char separator) {
  std::vector<std::string> result;
  for (;;) {
    const auto pos = input.find(separator);
    if (pos == std::string_view::npos) {
      result.emplace_back(input);
      return result;
    }
    result.emplace_back(input.substr(0, pos));
    input.remove_prefix(pos + 1);
  }
}

}  // namespace normalizer
}  // namespace slokit
