#pragma once

// This component provides a `struct`, `NormalizerConfig`, used to configure
// a `NormalizationStage`, and the functions that turn it into a
// `FinalizedNormalizerConfig`.
//
// A `NormalizerConfig` can be filled in by code, or loaded from JSON by
// `load_config` / `load_config_file`. The JSON form is an object with these
// properties, all optional:
//
//     {
//       "query_param": "op",
//       "rewrite_rules": [
//         {"pattern": "^/v2/orders/", "replacement": "/orders"}
//       ],
//       "sanitize_hashes": true,
//       "sanitize_numbers": true,
//       "sanitize_uuids": true,
//       "sanitize_ips": true,
//       "sanitize_images": true,
//       "sanitize_fonts": true
//     }
//
// Any other property is an error, as is a property of the wrong type.
//
// `finalize_config` applies environment variable overrides (see
// `environment.h`), compiles the rewrite rules, and fills in defaults. It is
// the only place where an invalid configuration is detected; a
// `FinalizedNormalizerConfig` is always usable.

#include <slokit/config.h>
#include <slokit/expected.h>
#include <slokit/path_sanitizer.h>
#include <slokit/rewrite_rule.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace slokit {
namespace normalizer {

class Logger;

struct NormalizerConfig {
  // Name of the query parameter whose values are appended to each event key.
  // Overridden by `SLOKIT_EVENT_KEY_QUERY_PARAM`. Empty or unset means no
  // query parameter contributes to the key.
  std::optional<std::string> query_param;

  // Whole-path rewrite rules, applied in order. Overridden by
  // `SLOKIT_REWRITE_RULES`, whose value is a JSON array of rules.
  std::vector<RewriteRule> rewrite_rules;

  // Segment sanitization toggles. Each is overridden by the corresponding
  // `SLOKIT_SANITIZE_...` variable, and defaults to `false`.
  std::optional<bool> sanitize_hashes;
  std::optional<bool> sanitize_numbers;
  std::optional<bool> sanitize_uuids;
  std::optional<bool> sanitize_ips;
  std::optional<bool> sanitize_images;
  std::optional<bool> sanitize_fonts;

  // `logger` receives startup, error, and debug messages. If null, messages
  // are discarded.
  std::shared_ptr<Logger> logger;

  // Whether the stage logs its configuration when it starts. Overridden by
  // `SLOKIT_STARTUP_LOGS`. Defaults to `true`.
  std::optional<bool> log_on_startup;
};

class FinalizedNormalizerConfig {
  friend Expected<FinalizedNormalizerConfig> finalize_config(
      const NormalizerConfig& config);

  FinalizedNormalizerConfig() = default;

 public:
  std::string query_param;
  std::vector<CompiledRewriteRule> rewrite_rules;
  SanitizerConfig sanitizer;
  std::shared_ptr<Logger> logger;
  bool log_on_startup;

  std::unordered_map<ConfigName, ConfigMetadata> metadata;
};

Expected<FinalizedNormalizerConfig> finalize_config(
    const NormalizerConfig& config);

// Parse a `NormalizerConfig` from the specified JSON `text`.
Expected<NormalizerConfig> load_config(std::string_view text);

// Parse a `NormalizerConfig` from the JSON file at the specified `path`.
Expected<NormalizerConfig> load_config_file(const std::string& path);

// Return a JSON representation of `config`, serialized as a string.
std::string to_json(const FinalizedNormalizerConfig& config);

}  // namespace normalizer
}  // namespace slokit
