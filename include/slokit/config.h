#pragma once

// This component provides the names of the normalizer's configuration
// settings, and `ConfigMetadata`, which records the value chosen for a
// setting and where that value came from.
//
// `pick` implements the precedence used throughout `finalize_config`:
// environment variable, then user code, then the built-in default.

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace slokit {
namespace normalizer {

enum class ConfigName : char {
  QUERY_PARAM,
  REWRITE_RULES,
  SANITIZE_HASHES,
  SANITIZE_NUMBERS,
  SANITIZE_UUIDS,
  SANITIZE_IPS,
  SANITIZE_IMAGES,
  SANITIZE_FONTS,
  STARTUP_LOGS,
};

struct ConfigMetadata {
  enum class Origin : char {
    ENVIRONMENT_VARIABLE,  // Originating from environment variables
    CODE,                  // Defined in code or in a configuration file
    DEFAULT                // Default value
  };

  ConfigName name;
  std::string value;
  Origin origin;

  ConfigMetadata() = default;
  ConfigMetadata(ConfigName n, std::string v, Origin orig)
      : name(n), value(std::move(v)), origin(orig) {}
};

std::string_view to_string(ConfigName);
std::string_view to_string(ConfigMetadata::Origin);

// Return the first of `from_env`, `from_user`, and `fallback` that has a
// value, and record the choice in `*metadata` under `name`, using
// `stringify` to render the value.
template <typename Value, typename Stringify>
Value pick(const std::optional<Value>& from_env,
           const std::optional<Value>& from_user, Value fallback,
           ConfigName name,
           std::unordered_map<ConfigName, ConfigMetadata>* metadata,
           Stringify&& stringify) {
  ConfigMetadata::Origin origin = ConfigMetadata::Origin::DEFAULT;
  Value chosen = std::move(fallback);
  if (from_env) {
    origin = ConfigMetadata::Origin::ENVIRONMENT_VARIABLE;
    chosen = *from_env;
  } else if (from_user) {
    origin = ConfigMetadata::Origin::CODE;
    chosen = *from_user;
  }
  if (metadata) {
    (*metadata)[name] = ConfigMetadata{name, stringify(chosen), origin};
  }
  return chosen;
}

}  // namespace normalizer
}  // namespace slokit
