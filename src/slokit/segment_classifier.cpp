#include "segment_classifier.h"

#ifdef _MSC_VER
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#endif

#include <algorithm>
#include <cstddef>
#include <string>

#include "string_util.h"

namespace slokit {
namespace normalizer {
namespace {

// Long enough for any textual IPv6 address, including an embedded IPv4 tail.
constexpr std::size_t MAX_IP_LENGTH = 45;

inline constexpr bool is_digit(char c) { return c >= '0' && c <= '9'; }
inline constexpr bool is_lower_hex(char c) {
  return is_digit(c) || (c >= 'a' && c <= 'f');
}
inline constexpr bool is_hex(char c) {
  return is_lower_hex(c) || (c >= 'A' && c <= 'F');
}

template <typename Predicate>
bool all_chars(std::string_view text, Predicate&& predicate) {
  return !text.empty() && std::all_of(text.begin(), text.end(), predicate);
}

constexpr std::string_view image_extensions[] = {
    ".png", ".jpg", ".jpeg", ".svg", ".tif", ".tiff", ".gif", ".ico"};
constexpr std::string_view font_extensions[] = {".ttf", ".woff"};

template <std::size_t N>
bool has_extension(std::string_view segment,
                   const std::string_view (&extensions)[N]) {
  return std::any_of(std::begin(extensions), std::end(extensions),
                     [&](std::string_view extension) {
                       return ends_with_ignore_case(segment, extension);
                     });
}

}  // namespace

bool is_hash(std::string_view segment) {
  switch (segment.size()) {
    case 32:  // MD5
    case 40:  // SHA1
    case 64:  // SHA256
      return all_chars(segment, is_lower_hex);
    default:
      return false;
  }
}

bool is_numeric(std::string_view segment) {
  return all_chars(segment, is_digit);
}

bool is_hexadecimal(std::string_view segment) {
  return all_chars(segment, is_hex);
}

bool is_uuid(std::string_view segment) {
  // clang-format off
  // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
  // 0       8    13   18   23          36
  // clang-format on
  if (segment.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < segment.size(); ++i) {
    const bool dash_expected = i == 8 || i == 13 || i == 18 || i == 23;
    if (dash_expected ? segment[i] != '-' : !is_lower_hex(segment[i])) {
      return false;
    }
  }
  return true;
}

bool is_ip(std::string_view segment) {
  if (segment.empty() || segment.size() > MAX_IP_LENGTH) {
    return false;
  }
  // `inet_pton` requires a null-terminated string.
  const std::string text{segment};
  unsigned char buffer[16];
  if (text.find(':') == std::string::npos) {
    return ::inet_pton(AF_INET, text.c_str(), buffer) == 1;
  }
  return ::inet_pton(AF_INET6, text.c_str(), buffer) == 1;
}

bool is_image_name(std::string_view segment) {
  return has_extension(segment, image_extensions);
}

bool is_font_name(std::string_view segment) {
  return has_extension(segment, font_extensions);
}

}  // namespace normalizer
}  // namespace slokit
