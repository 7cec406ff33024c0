#pragma once

// This component provides a `struct`, `URL`, holding the parts of an HTTP
// request target that the normalizer cares about, and functions for parsing
// a request target and decoding its query string.
//
// `URL::parse` accepts either an origin-form target ("/users/42?op=list") or
// an absolute URL ("https://example.com/users/42?op=list"). The path is
// percent-decoded, and its original spelling is kept so that the URL prints
// back the way it was received. The query is kept raw, and decoded on demand
// by `parse_query`.

#include <slokit/expected.h>

#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace slokit {
namespace normalizer {

// Decoded `name=value` pairs, in the order they appear in the query string.
using QueryParameters = std::vector<std::pair<std::string, std::string>>;

struct URL {
  std::string scheme;     // e.g. "https", or empty for an origin-form target
  std::string authority;  // e.g. "example.com:8080", or empty
  std::string path;       // decoded, e.g. "/users/42"
  std::string raw_path;   // as received, e.g. "/users/4%32", or empty
  std::string raw_query;  // without the leading "?", e.g. "op=list&op=sum"

  static Expected<URL> parse(std::string_view input);

  // Return every value bound to `name` in `raw_query`, in order.
  std::vector<std::string> query_values(std::string_view name) const;

  // Return `raw_path` if it is a valid encoding of `path`, and otherwise
  // `path` with every byte that may not appear literally in a path
  // percent-encoded.
  std::string escaped_path() const;

  // Return the request target as it would appear on an HTTP request line.
  std::string request_target() const;
};

// Decode `raw_query` as `application/x-www-form-urlencoded` data. Empty pairs
// are skipped. A pair containing ';', or whose name or value contains an
// invalid percent escape, is skipped. A name without '=' has an empty value.
QueryParameters parse_query(std::string_view raw_query);

// Return `input` with "%XX" escapes decoded, or return an error if `input`
// contains a malformed escape. If `plus_as_space` is true, '+' decodes to ' '.
Expected<std::string> percent_decode(std::string_view input,
                                     bool plus_as_space);

std::ostream& operator<<(std::ostream&, const URL&);

}  // namespace normalizer
}  // namespace slokit
