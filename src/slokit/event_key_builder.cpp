#include <slokit/event_key_builder.h>
#include <slokit/http_request.h>
#include <slokit/normalizer_config.h>

namespace slokit {
namespace normalizer {

EventKeyBuilder::EventKeyBuilder(const FinalizedNormalizerConfig& config)
    : EventKeyBuilder(PathSanitizer{config.rewrite_rules, config.sanitizer},
                      config.query_param) {}

EventKeyBuilder::EventKeyBuilder(PathSanitizer sanitizer,
                                 std::string query_param)
    : sanitizer_(std::move(sanitizer)), query_param_(std::move(query_param)) {}

std::string EventKeyBuilder::build_key(const HttpRequest& request) const {
  std::string key = request.method;
  key += event_key_separator;
  key += sanitizer_.sanitize(request.url.path);

  if (query_param_.empty()) {
    return key;
  }
  for (const auto& value : request.url.query_values(query_param_)) {
    key += event_key_separator;
    key += value;
  }
  return key;
}

}  // namespace normalizer
}  // namespace slokit
