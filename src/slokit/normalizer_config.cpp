#include <slokit/environment.h>
#include <slokit/logger.h>
#include <slokit/normalizer_config.h>
#include <slokit/null_logger.h>
#include <slokit/parse_util.h>

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <unordered_set>

#include "json_util.h"
#include "string_util.h"

namespace slokit {
namespace normalizer {
namespace {

const std::unordered_set<std::string> allowed_rule_properties{"pattern",
                                                              "replacement"};

Error unexpected_property(const std::string& key, const nlohmann::json& value,
                          std::string_view where) {
  std::string message;
  message += "Unexpected property \"";
  message += key;
  message += "\" having value ";
  message += dump_json(value);
  message += " in ";
  message.append(where.begin(), where.end());
  message += '.';
  return Error{Error::CONFIG_UNKNOWN_PROPERTY, std::move(message)};
}

Error wrong_type(std::string_view property, std::string_view expected,
                 const nlohmann::json& value) {
  std::string message;
  message += "The \"";
  message.append(property.begin(), property.end());
  message += "\" property must be a ";
  message.append(expected.begin(), expected.end());
  message += ", but has JSON type \"";
  message += value.type_name();
  message += "\": ";
  message += dump_json(value);
  return Error{Error::CONFIG_PROPERTY_WRONG_TYPE, std::move(message)};
}

Expected<RewriteRule> parse_rule(const nlohmann::json& json_rule) {
  if (!json_rule.is_object()) {
    std::string message;
    message += "A rewrite rule must be an object, but has JSON type \"";
    message += json_rule.type_name();
    message += "\": ";
    message += dump_json(json_rule);
    return Error{Error::CONFIG_PROPERTY_WRONG_TYPE, std::move(message)};
  }

  // Look for unexpected properties.
  for (const auto& [key, value] : json_rule.items()) {
    if (!allowed_rule_properties.count(key)) {
      return unexpected_property(key, value,
                                 "rewrite rule " + dump_json(json_rule));
    }
  }

  RewriteRule rule;
  for (const auto& property : allowed_rule_properties) {
    auto found = json_rule.find(property);
    if (found == json_rule.end()) {
      std::string message;
      message += "Rewrite rule ";
      message += dump_json(json_rule);
      message += " is missing the required \"";
      message += property;
      message += "\" property.";
      return Error{Error::CONFIG_MISSING_PROPERTY, std::move(message)};
    }
    if (!found->is_string()) {
      return wrong_type(property, "string", *found);
    }
    if (property == "pattern") {
      rule.pattern = found->get<std::string>();
    } else {
      rule.replacement = found->get<std::string>();
    }
  }

  return rule;
}

Expected<std::vector<RewriteRule>> parse_rules(
    const nlohmann::json& json_rules) {
  if (!json_rules.is_array()) {
    std::string message;
    message += "Rewrite rules must be an array, but have JSON type \"";
    message += json_rules.type_name();
    message += "\": ";
    message += dump_json(json_rules);
    return Error{Error::REWRITE_RULES_WRONG_TYPE, std::move(message)};
  }

  std::vector<RewriteRule> rules;
  for (const auto& json_rule : json_rules) {
    auto rule = parse_rule(json_rule);
    if (auto* error = rule.if_error()) {
      return std::move(*error);
    }
    rules.push_back(std::move(*rule));
  }
  return rules;
}

struct EnvConfig {
  std::optional<std::string> query_param;
  std::optional<std::vector<RewriteRule>> rewrite_rules;
  std::optional<bool> sanitize_hashes;
  std::optional<bool> sanitize_numbers;
  std::optional<bool> sanitize_uuids;
  std::optional<bool> sanitize_ips;
  std::optional<bool> sanitize_images;
  std::optional<bool> sanitize_fonts;
  std::optional<bool> log_on_startup;
};

Expected<void> load_bool_env(environment::Variable variable,
                             std::optional<bool>& destination) {
  auto text = environment::lookup(variable);
  if (!text) {
    return {};
  }
  auto value = parse_bool(*text);
  if (auto* error = value.if_error()) {
    std::string prefix;
    prefix += "While parsing ";
    prefix += environment::name(variable);
    prefix += ": ";
    return error->with_prefix(prefix);
  }
  destination = *value;
  return {};
}

Expected<EnvConfig> load_normalizer_env_config() {
  EnvConfig env_config;

  env_config.query_param =
      environment::lookup(environment::EVENT_KEY_QUERY_PARAM);

  if (auto rules_env = environment::lookup(environment::REWRITE_RULES)) {
    nlohmann::json json_rules;
    try {
      json_rules = nlohmann::json::parse(*rules_env);
    } catch (const nlohmann::json::parse_error& error) {
      std::string message;
      message += "Unable to parse JSON from ";
      message += environment::name(environment::REWRITE_RULES);
      message += " value ";
      message += *rules_env;
      message += ": ";
      message += error.what();
      return Error{Error::REWRITE_RULES_INVALID_JSON, std::move(message)};
    }

    auto rules = parse_rules(json_rules);
    if (auto* error = rules.if_error()) {
      std::string prefix;
      prefix += "Unable to load rewrite rules from ";
      prefix += environment::name(environment::REWRITE_RULES);
      prefix += ": ";
      return error->with_prefix(prefix);
    }
    env_config.rewrite_rules = std::move(*rules);
  }

  const std::pair<environment::Variable, std::optional<bool> EnvConfig::*>
      toggles[] = {
          {environment::SANITIZE_HASHES, &EnvConfig::sanitize_hashes},
          {environment::SANITIZE_NUMBERS, &EnvConfig::sanitize_numbers},
          {environment::SANITIZE_UUIDS, &EnvConfig::sanitize_uuids},
          {environment::SANITIZE_IPS, &EnvConfig::sanitize_ips},
          {environment::SANITIZE_IMAGES, &EnvConfig::sanitize_images},
          {environment::SANITIZE_FONTS, &EnvConfig::sanitize_fonts},
          {environment::STARTUP_LOGS, &EnvConfig::log_on_startup},
      };
  for (const auto& [variable, member] : toggles) {
    auto result = load_bool_env(variable, env_config.*member);
    if (auto* error = result.if_error()) {
      return std::move(*error);
    }
  }

  return env_config;
}

std::string rules_to_json(const std::vector<RewriteRule>& rules) {
  auto result = nlohmann::json::array();
  for (const auto& rule : rules) {
    result.push_back(nlohmann::json::object(
        {{"pattern", rule.pattern}, {"replacement", rule.replacement}}));
  }
  return dump_json(result);
}

}  // namespace

Expected<FinalizedNormalizerConfig> finalize_config(
    const NormalizerConfig& config) {
  Expected<EnvConfig> env_config = load_normalizer_env_config();
  if (auto* error = env_config.if_error()) {
    return std::move(*error);
  }

  FinalizedNormalizerConfig result;

  result.query_param = pick(env_config->query_param, config.query_param,
                            std::string{}, ConfigName::QUERY_PARAM,
                            &result.metadata,
                            [](const std::string& value) { return value; });

  std::optional<std::vector<RewriteRule>> user_rules;
  if (!config.rewrite_rules.empty()) {
    user_rules = config.rewrite_rules;
  }
  const std::vector<RewriteRule> rules =
      pick(env_config->rewrite_rules, user_rules, std::vector<RewriteRule>{},
           ConfigName::REWRITE_RULES, &result.metadata, rules_to_json);

  for (const auto& rule : rules) {
    auto compiled = CompiledRewriteRule::compile(rule);
    if (auto* error = compiled.if_error()) {
      return std::move(*error);
    }
    result.rewrite_rules.push_back(std::move(*compiled));
  }

  const auto stringify = [](bool value) { return to_string(value); };
  auto& sanitizer = result.sanitizer;
  sanitizer.hashes =
      pick(env_config->sanitize_hashes, config.sanitize_hashes, false,
           ConfigName::SANITIZE_HASHES, &result.metadata, stringify);
  sanitizer.numbers =
      pick(env_config->sanitize_numbers, config.sanitize_numbers, false,
           ConfigName::SANITIZE_NUMBERS, &result.metadata, stringify);
  sanitizer.uuids =
      pick(env_config->sanitize_uuids, config.sanitize_uuids, false,
           ConfigName::SANITIZE_UUIDS, &result.metadata, stringify);
  sanitizer.ips = pick(env_config->sanitize_ips, config.sanitize_ips, false,
                       ConfigName::SANITIZE_IPS, &result.metadata, stringify);
  sanitizer.images =
      pick(env_config->sanitize_images, config.sanitize_images, false,
           ConfigName::SANITIZE_IMAGES, &result.metadata, stringify);
  sanitizer.fonts =
      pick(env_config->sanitize_fonts, config.sanitize_fonts, false,
           ConfigName::SANITIZE_FONTS, &result.metadata, stringify);

  result.log_on_startup =
      pick(env_config->log_on_startup, config.log_on_startup, true,
           ConfigName::STARTUP_LOGS, &result.metadata, stringify);

  if (config.logger) {
    result.logger = config.logger;
  } else {
    result.logger = std::make_shared<NullLogger>();
  }

  return result;
}

Expected<NormalizerConfig> load_config(std::string_view text) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& error) {
    std::string message;
    message += "Unable to parse normalizer configuration JSON: ";
    message += error.what();
    return Error{Error::CONFIG_INVALID_JSON, std::move(message)};
  }

  if (!json.is_object()) {
    std::string message;
    message +=
        "Normalizer configuration must be a JSON object, but has type \"";
    message += json.type_name();
    message += "\".";
    return Error{Error::CONFIG_WRONG_TYPE, std::move(message)};
  }

  NormalizerConfig config;
  const std::pair<const char*, std::optional<bool> NormalizerConfig::*>
      toggles[] = {
          {"sanitize_hashes", &NormalizerConfig::sanitize_hashes},
          {"sanitize_numbers", &NormalizerConfig::sanitize_numbers},
          {"sanitize_uuids", &NormalizerConfig::sanitize_uuids},
          {"sanitize_ips", &NormalizerConfig::sanitize_ips},
          {"sanitize_images", &NormalizerConfig::sanitize_images},
          {"sanitize_fonts", &NormalizerConfig::sanitize_fonts},
      };

  for (const auto& [key, value] : json.items()) {
    if (key == "query_param") {
      if (!value.is_string()) {
        return wrong_type(key, "string", value);
      }
      config.query_param = value.get<std::string>();
      continue;
    }

    if (key == "rewrite_rules") {
      auto rules = parse_rules(value);
      if (auto* error = rules.if_error()) {
        return std::move(*error);
      }
      config.rewrite_rules = std::move(*rules);
      continue;
    }

    const auto toggle =
        std::find_if(std::begin(toggles), std::end(toggles),
                     [&](const auto& entry) { return key == entry.first; });
    if (toggle == std::end(toggles)) {
      return unexpected_property(key, value, "normalizer configuration");
    }
    if (!value.is_boolean()) {
      return wrong_type(key, "boolean", value);
    }
    config.*(toggle->second) = value.get<bool>();
  }

  return config;
}

Expected<NormalizerConfig> load_config_file(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    std::string message;
    message += "Unable to open normalizer configuration file \"";
    message += path;
    message += "\".";
    return Error{Error::CONFIG_FILE_UNREADABLE, std::move(message)};
  }

  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    std::string message;
    message += "Unable to read normalizer configuration file \"";
    message += path;
    message += "\".";
    return Error{Error::CONFIG_FILE_UNREADABLE, std::move(message)};
  }

  auto config = load_config(contents.str());
  if (auto* error = config.if_error()) {
    std::string prefix;
    prefix += "While loading ";
    prefix += path;
    prefix += ": ";
    return error->with_prefix(prefix);
  }
  return config;
}

std::string to_json(const FinalizedNormalizerConfig& config) {
  auto rules = nlohmann::json::array();
  for (const auto& rule : config.rewrite_rules) {
    rules.push_back(nlohmann::json::object(
        {{"pattern", rule.pattern()}, {"replacement", rule.replacement()}}));
  }

  auto origins = nlohmann::json::object();
  for (const auto& [name, metadata] : config.metadata) {
    origins[std::string(to_string(name))] =
        std::string(to_string(metadata.origin));
  }

  // clang-format off
  auto result = nlohmann::json::object({
    {"query_param", config.query_param},
    {"rewrite_rules", std::move(rules)},
    {"sanitize", nlohmann::json{
      {"hashes", config.sanitizer.hashes},
      {"numbers", config.sanitizer.numbers},
      {"uuids", config.sanitizer.uuids},
      {"ips", config.sanitizer.ips},
      {"images", config.sanitizer.images},
      {"fonts", config.sanitizer.fonts},
    }},
    {"log_on_startup", config.log_on_startup},
    {"origins", std::move(origins)},
  });
  // clang-format on

  return dump_json(result);
}

}  // namespace normalizer
}  // namespace slokit
