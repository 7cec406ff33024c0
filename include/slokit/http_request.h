#pragma once

// This component provides a `struct`, `HttpRequest`, describing one observed
// HTTP request as produced by an upstream collaborator such as an access-log
// tailer or a proxy tap.
//
// A `NormalizationStage` reads `method` and `url`, and fills in `event_key`
// unless it is already set. The remaining fields are carried through to
// downstream stages untouched.

#include <slokit/clock.h>
#include <slokit/url.h>

#include <string>
#include <unordered_map>

namespace slokit {
namespace normalizer {

struct HttpRequest {
  std::string method;
  URL url;
  int status_code = 0;
  Duration duration = Duration::zero();
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> metadata;

  // The classification key. Empty until a normalizer (or the producer)
  // assigns it; once non-empty it is never overwritten.
  std::string event_key;
};

}  // namespace normalizer
}  // namespace slokit
