#include <slokit/url.h>

#include <ostream>

namespace slokit {
namespace normalizer {
namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool is_scheme_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
}

// Return whether `c` may appear unescaped in a path: RFC 3986 "pchar" plus
// '/'.
bool is_path_char(char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
      (c >= '0' && c <= '9')) {
    return true;
  }
  switch (c) {
    case '-':
    case '.':
    case '_':
    case '~':
    case '!':
    case '$':
    case '&':
    case '\'':
    case '(':
    case ')':
    case '*':
    case '+':
    case ',':
    case ';':
    case '=':
    case ':':
    case '@':
    case '/':
      return true;
    default:
      return false;
  }
}

// Return the length of the scheme at the front of `input`, or zero if
// `input` does not begin with "<scheme>://".
std::size_t scheme_length(std::string_view input) {
  const auto pos = input.find("://");
  if (pos == std::string_view::npos || pos == 0) {
    return 0;
  }
  for (std::size_t i = 0; i < pos; ++i) {
    if (!is_scheme_char(input[i])) {
      return 0;
    }
  }
  return pos;
}

}  // namespace

Expected<std::string> percent_decode(std::string_view input,
                                     bool plus_as_space) {
  std::string result;
  result.reserve(input.size());

  for (std::size_t i = 0; i < input.size(); ++i) {
    const char c = input[i];
    if (c == '+' && plus_as_space) {
      result += ' ';
      continue;
    }
    if (c != '%') {
      result += c;
      continue;
    }
    const int high = i + 1 < input.size() ? hex_value(input[i + 1]) : -1;
    const int low = i + 2 < input.size() ? hex_value(input[i + 2]) : -1;
    if (high < 0 || low < 0) {
      std::string message;
      message += "Invalid percent escape at offset ";
      message += std::to_string(i);
      message += " in \"";
      message.append(input.begin(), input.end());
      message += '\"';
      return Error{Error::URL_INVALID, std::move(message)};
    }
    result += static_cast<char>(high * 16 + low);
    i += 2;
  }

  return result;
}

QueryParameters parse_query(std::string_view raw_query) {
  QueryParameters result;

  while (!raw_query.empty()) {
    std::string_view pair = raw_query;
    const auto amp = raw_query.find('&');
    if (amp == std::string_view::npos) {
      raw_query = std::string_view{};
    } else {
      pair = raw_query.substr(0, amp);
      raw_query.remove_prefix(amp + 1);
    }

    if (pair.empty() || pair.find(';') != std::string_view::npos) {
      continue;
    }

    std::string_view name = pair;
    std::string_view value;
    const auto equals = pair.find('=');
    if (equals != std::string_view::npos) {
      name = pair.substr(0, equals);
      value = pair.substr(equals + 1);
    }

    auto decoded_name = percent_decode(name, true);
    if (!decoded_name) {
      continue;
    }
    auto decoded_value = percent_decode(value, true);
    if (!decoded_value) {
      continue;
    }
    result.emplace_back(std::move(*decoded_name), std::move(*decoded_value));
  }

  return result;
}

Expected<URL> URL::parse(std::string_view input) {
  URL result;

  // Anything after '#' is never sent to a server.
  input = input.substr(0, input.find('#'));

  if (const auto length = scheme_length(input)) {
    result.scheme.assign(input.begin(), input.begin() + length);
    input.remove_prefix(length + 3);
    const auto end = input.find_first_of("/?");
    result.authority.assign(input.substr(0, end));
    input.remove_prefix(end == std::string_view::npos ? input.size() : end);
  }

  std::string_view raw_path = input;
  const auto question = input.find('?');
  if (question != std::string_view::npos) {
    raw_path = input.substr(0, question);
    result.raw_query.assign(input.substr(question + 1));
  }

  auto path = percent_decode(raw_path, false);
  if (auto* error = path.if_error()) {
    return error->with_prefix("Unable to decode URL path: ");
  }
  result.path = std::move(*path);
  result.raw_path.assign(raw_path.begin(), raw_path.end());

  return result;
}

std::vector<std::string> URL::query_values(std::string_view name) const {
  std::vector<std::string> result;
  for (auto& [key, value] : parse_query(raw_query)) {
    if (key == name) {
      result.push_back(std::move(value));
    }
  }
  return result;
}

std::string URL::escaped_path() const {
  if (!raw_path.empty()) {
    auto decoded = percent_decode(raw_path, false);
    if (decoded && *decoded == path) {
      return raw_path;
    }
  }

  static const char hex_digits[] = "0123456789ABCDEF";
  std::string result;
  result.reserve(path.size());
  for (const char c : path) {
    if (is_path_char(c)) {
      result += c;
      continue;
    }
    const auto byte = static_cast<unsigned char>(c);
    result += '%';
    result += hex_digits[byte >> 4];
    result += hex_digits[byte & 0xF];
  }
  return result;
}

std::string URL::request_target() const {
  std::string result = path.empty() ? "/" : escaped_path();
  if (!raw_query.empty()) {
    result += '?';
    result += raw_query;
  }
  return result;
}

std::ostream& operator<<(std::ostream& stream, const URL& url) {
  if (!url.scheme.empty()) {
    stream << url.scheme << "://" << url.authority;
  }
  return stream << url.request_target();
}

}  // namespace normalizer
}  // namespace slokit
