#pragma once

// This component provides a class, `EventKeyBuilder`, that derives the
// classification key of an `HttpRequest`.
//
// The key is the request method, the sanitized request path, and then every
// value of the configured query parameter in the order the values appear in
// the query string, all joined by ':'. For example, with query parameter "op"
// and numbers sanitization enabled:
//
//     GET /users/42?op=list&op=summary   ->   "GET:/users/0:list:summary"
//
// Values are not escaped, so a value containing ':' yields a key with more
// fields than it has values.

#include <slokit/path_sanitizer.h>

#include <string>

namespace slokit {
namespace normalizer {

class FinalizedNormalizerConfig;
struct HttpRequest;

inline constexpr char event_key_separator = ':';

class EventKeyBuilder {
  PathSanitizer sanitizer_;
  std::string query_param_;

 public:
  explicit EventKeyBuilder(const FinalizedNormalizerConfig& config);
  EventKeyBuilder(PathSanitizer sanitizer, std::string query_param);

  std::string build_key(const HttpRequest& request) const;

  const PathSanitizer& sanitizer() const { return sanitizer_; }
  const std::string& query_param() const { return query_param_; }
};

}  // namespace normalizer
}  // namespace slokit
