#include <slokit/config.h>

namespace slokit {
namespace normalizer {

std::string_view to_string(ConfigName name) {
  switch (name) {
    case ConfigName::QUERY_PARAM:
      return "query_param";
    case ConfigName::REWRITE_RULES:
      return "rewrite_rules";
    case ConfigName::SANITIZE_HASHES:
      return "sanitize_hashes";
    case ConfigName::SANITIZE_NUMBERS:
      return "sanitize_numbers";
    case ConfigName::SANITIZE_UUIDS:
      return "sanitize_uuids";
    case ConfigName::SANITIZE_IPS:
      return "sanitize_ips";
    case ConfigName::SANITIZE_IMAGES:
      return "sanitize_images";
    case ConfigName::SANITIZE_FONTS:
      return "sanitize_fonts";
    case ConfigName::STARTUP_LOGS:
      return "startup_logs";
  }
  return "";
}

std::string_view to_string(ConfigMetadata::Origin origin) {
  switch (origin) {
    case ConfigMetadata::Origin::ENVIRONMENT_VARIABLE:
      return "env_var";
    case ConfigMetadata::Origin::CODE:
      return "code";
    case ConfigMetadata::Origin::DEFAULT:
      return "default";
  }
  return "";
}

}  // namespace normalizer
}  // namespace slokit
