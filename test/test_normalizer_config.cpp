#include <slokit/config.h>
#include <slokit/error.h>
#include <slokit/normalizer_config.h>
#include <slokit/null_logger.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "common/environment.h"
#include "loggers.h"
#include "test.h"

using namespace slokit::normalizer;
using slokit::test::EnvGuard;

#define CONFIG_TEST(x) TEST_CASE(x, "[normalizer_config]")

CONFIG_TEST("defaults") {
  auto finalized = finalize_config(NormalizerConfig{});
  REQUIRE(finalized);

  CHECK(finalized->query_param.empty());
  CHECK(finalized->rewrite_rules.empty());
  CHECK_FALSE(finalized->sanitizer.hashes);
  CHECK_FALSE(finalized->sanitizer.numbers);
  CHECK_FALSE(finalized->sanitizer.uuids);
  CHECK_FALSE(finalized->sanitizer.ips);
  CHECK_FALSE(finalized->sanitizer.images);
  CHECK_FALSE(finalized->sanitizer.fonts);
  CHECK(finalized->log_on_startup);
  REQUIRE(finalized->logger);
  CHECK(dynamic_cast<NullLogger*>(finalized->logger.get()) != nullptr);

  for (const auto& [name, metadata] : finalized->metadata) {
    CAPTURE(to_string(name));
    CHECK(metadata.name == name);
    CHECK(metadata.origin == ConfigMetadata::Origin::DEFAULT);
  }
  CHECK(finalized->metadata.size() == 9);
  CHECK(finalized->metadata.at(ConfigName::SANITIZE_IPS).value == "false");
  CHECK(finalized->metadata.at(ConfigName::STARTUP_LOGS).value == "true");
  CHECK(finalized->metadata.at(ConfigName::REWRITE_RULES).value == "[]");
}

CONFIG_TEST("values set in code") {
  auto logger = std::make_shared<MockLogger>();

  NormalizerConfig config;
  config.query_param = "op";
  config.rewrite_rules = {{"^/v2/", "/api"}, {"^/old$", "/new"}};
  config.sanitize_numbers = true;
  config.sanitize_images = true;
  config.log_on_startup = false;
  config.logger = logger;

  auto finalized = finalize_config(config);
  REQUIRE(finalized);

  CHECK(finalized->query_param == "op");
  REQUIRE(finalized->rewrite_rules.size() == 2);
  CHECK(finalized->rewrite_rules[0].pattern() == "^/v2/");
  CHECK(finalized->rewrite_rules[1].replacement() == "/new");
  CHECK(finalized->sanitizer.numbers);
  CHECK(finalized->sanitizer.images);
  CHECK_FALSE(finalized->sanitizer.hashes);
  CHECK_FALSE(finalized->log_on_startup);
  CHECK(finalized->logger == logger);

  const auto& metadata = finalized->metadata;
  CHECK(metadata.at(ConfigName::QUERY_PARAM).origin ==
        ConfigMetadata::Origin::CODE);
  CHECK(metadata.at(ConfigName::QUERY_PARAM).value == "op");
  CHECK(metadata.at(ConfigName::REWRITE_RULES).origin ==
        ConfigMetadata::Origin::CODE);
  CHECK(metadata.at(ConfigName::SANITIZE_NUMBERS).origin ==
        ConfigMetadata::Origin::CODE);
  CHECK(metadata.at(ConfigName::SANITIZE_HASHES).origin ==
        ConfigMetadata::Origin::DEFAULT);
}

CONFIG_TEST("an invalid rewrite rule pattern fails finalization") {
  NormalizerConfig config;
  config.rewrite_rules = {{"^/ok/", "/ok"}, {"(", "/broken"}};
  auto finalized = finalize_config(config);
  REQUIRE_FALSE(finalized);
  CHECK(finalized.error().code == Error::REWRITE_RULE_INVALID_PATTERN);
}

CONFIG_TEST("environment variables override code") {
  NormalizerConfig config;
  config.query_param = "op";
  config.sanitize_numbers = false;
  config.rewrite_rules = {{"^/v2/", "/api"}};
  config.log_on_startup = true;

  SECTION("query parameter") {
    EnvGuard guard{"SLOKIT_EVENT_KEY_QUERY_PARAM", "action"};
    auto finalized = finalize_config(config);
    REQUIRE(finalized);
    CHECK(finalized->query_param == "action");
    CHECK(finalized->metadata.at(ConfigName::QUERY_PARAM).origin ==
          ConfigMetadata::Origin::ENVIRONMENT_VARIABLE);
  }

  SECTION("an empty query parameter disables it") {
    EnvGuard guard{"SLOKIT_EVENT_KEY_QUERY_PARAM", ""};
    auto finalized = finalize_config(config);
    REQUIRE(finalized);
    CHECK(finalized->query_param.empty());
  }

  SECTION("sanitization toggles") {
    struct TestCase {
      std::string variable;
      bool SanitizerConfig::*member;
      ConfigName name;
    };

    auto test_case = GENERATE(values<TestCase>({
        {"SLOKIT_SANITIZE_HASHES", &SanitizerConfig::hashes,
         ConfigName::SANITIZE_HASHES},
        {"SLOKIT_SANITIZE_NUMBERS", &SanitizerConfig::numbers,
         ConfigName::SANITIZE_NUMBERS},
        {"SLOKIT_SANITIZE_UUIDS", &SanitizerConfig::uuids,
         ConfigName::SANITIZE_UUIDS},
        {"SLOKIT_SANITIZE_IPS", &SanitizerConfig::ips,
         ConfigName::SANITIZE_IPS},
        {"SLOKIT_SANITIZE_IMAGES", &SanitizerConfig::images,
         ConfigName::SANITIZE_IMAGES},
        {"SLOKIT_SANITIZE_FONTS", &SanitizerConfig::fonts,
         ConfigName::SANITIZE_FONTS},
    }));

    CAPTURE(test_case.variable);
    EnvGuard guard{test_case.variable, "true"};
    auto finalized = finalize_config(config);
    REQUIRE(finalized);
    CHECK(finalized->sanitizer.*(test_case.member));
    CHECK(finalized->metadata.at(test_case.name).origin ==
          ConfigMetadata::Origin::ENVIRONMENT_VARIABLE);
    CHECK(finalized->metadata.at(test_case.name).value == "true");
  }

  SECTION("startup logs") {
    EnvGuard guard{"SLOKIT_STARTUP_LOGS", "off"};
    auto finalized = finalize_config(config);
    REQUIRE(finalized);
    CHECK_FALSE(finalized->log_on_startup);
  }

  SECTION("rewrite rules") {
    EnvGuard guard{"SLOKIT_REWRITE_RULES",
                   R"([{"pattern": "^/a$", "replacement": "/b"},
                       {"pattern": "^/c$", "replacement": "/d"}])"};
    auto finalized = finalize_config(config);
    REQUIRE(finalized);
    REQUIRE(finalized->rewrite_rules.size() == 2);
    CHECK(finalized->rewrite_rules[0].pattern() == "^/a$");
    CHECK(finalized->rewrite_rules[1].replacement() == "/d");
    CHECK(finalized->metadata.at(ConfigName::REWRITE_RULES).origin ==
          ConfigMetadata::Origin::ENVIRONMENT_VARIABLE);
  }

  SECTION("an empty rule list from the environment clears the rules") {
    EnvGuard guard{"SLOKIT_REWRITE_RULES", "[]"};
    auto finalized = finalize_config(config);
    REQUIRE(finalized);
    CHECK(finalized->rewrite_rules.empty());
  }
}

CONFIG_TEST("boolean environment variables accept several spellings") {
  struct TestCase {
    std::string text;
    bool expected;
  };

  auto test_case = GENERATE(values<TestCase>({
      {"true", true},
      {"TRUE", true},
      {"1", true},
      {"yes", true},
      {" on ", true},
      {"false", false},
      {"False", false},
      {"0", false},
      {"no", false},
      {"OFF", false},
  }));

  CAPTURE(test_case.text);
  EnvGuard guard{"SLOKIT_SANITIZE_UUIDS", test_case.text};
  auto finalized = finalize_config(NormalizerConfig{});
  REQUIRE(finalized);
  CHECK(finalized->sanitizer.uuids == test_case.expected);
}

CONFIG_TEST("invalid environment values") {
  SECTION("boolean") {
    auto text = GENERATE(as<std::string>{}, "", "maybe", "2", "truthy");
    CAPTURE(text);
    EnvGuard guard{"SLOKIT_SANITIZE_IPS", text};
    auto finalized = finalize_config(NormalizerConfig{});
    REQUIRE_FALSE(finalized);
    CHECK(finalized.error().code == Error::INVALID_BOOLEAN);
    CHECK(finalized.error().message.find("SLOKIT_SANITIZE_IPS") !=
          std::string::npos);
  }

  SECTION("rewrite rules that are not JSON") {
    EnvGuard guard{"SLOKIT_REWRITE_RULES", "[{"};
    auto finalized = finalize_config(NormalizerConfig{});
    REQUIRE_FALSE(finalized);
    CHECK(finalized.error().code == Error::REWRITE_RULES_INVALID_JSON);
  }

  SECTION("rewrite rules that are not an array") {
    EnvGuard guard{"SLOKIT_REWRITE_RULES",
                   R"({"pattern": "x", "replacement": "y"})"};
    auto finalized = finalize_config(NormalizerConfig{});
    REQUIRE_FALSE(finalized);
    CHECK(finalized.error().code == Error::REWRITE_RULES_WRONG_TYPE);
  }

  SECTION("rewrite rule with a bad pattern") {
    EnvGuard guard{"SLOKIT_REWRITE_RULES",
                   R"([{"pattern": "[", "replacement": "y"}])"};
    auto finalized = finalize_config(NormalizerConfig{});
    REQUIRE_FALSE(finalized);
    CHECK(finalized.error().code == Error::REWRITE_RULE_INVALID_PATTERN);
  }
}

CONFIG_TEST("load_config") {
  SECTION("every property") {
    auto config = load_config(R"({
      "query_param": "op",
      "rewrite_rules": [{"pattern": "^/v2/", "replacement": "/api"}],
      "sanitize_hashes": true,
      "sanitize_numbers": false,
      "sanitize_uuids": true,
      "sanitize_ips": true,
      "sanitize_images": false,
      "sanitize_fonts": true
    })");
    REQUIRE(config);
    CHECK(config->query_param == "op");
    REQUIRE(config->rewrite_rules.size() == 1);
    CHECK(config->rewrite_rules[0].pattern == "^/v2/");
    CHECK(config->rewrite_rules[0].replacement == "/api");
    CHECK(config->sanitize_hashes == true);
    CHECK(config->sanitize_numbers == false);
    CHECK(config->sanitize_uuids == true);
    CHECK(config->sanitize_ips == true);
    CHECK(config->sanitize_images == false);
    CHECK(config->sanitize_fonts == true);
    CHECK_FALSE(config->logger);
    CHECK_FALSE(config->log_on_startup);
  }

  SECTION("an empty object") {
    auto config = load_config("{}");
    REQUIRE(config);
    CHECK_FALSE(config->query_param);
    CHECK(config->rewrite_rules.empty());
    CHECK_FALSE(config->sanitize_numbers);
  }

  SECTION("errors") {
    struct TestCase {
      std::string name;
      std::string json;
      Error::Code expected_error;
    };

    auto test_case = GENERATE(values<TestCase>({
        {"not JSON", "{\"query_param\": ", Error::CONFIG_INVALID_JSON},
        {"not an object", "[1, 2]", Error::CONFIG_WRONG_TYPE},
        {"unknown property", R"({"sanitize_emails": true})",
         Error::CONFIG_UNKNOWN_PROPERTY},
        {"query_param wrong type", R"({"query_param": 3})",
         Error::CONFIG_PROPERTY_WRONG_TYPE},
        {"toggle wrong type", R"({"sanitize_numbers": "true"})",
         Error::CONFIG_PROPERTY_WRONG_TYPE},
        {"rules not an array", R"({"rewrite_rules": {}})",
         Error::REWRITE_RULES_WRONG_TYPE},
        {"rule not an object", R"({"rewrite_rules": ["^/a"]})",
         Error::CONFIG_PROPERTY_WRONG_TYPE},
        {"rule missing replacement",
         R"({"rewrite_rules": [{"pattern": "^/a"}]})",
         Error::CONFIG_MISSING_PROPERTY},
        {"rule missing pattern",
         R"({"rewrite_rules": [{"replacement": "/a"}]})",
         Error::CONFIG_MISSING_PROPERTY},
        {"rule with extra property",
         R"({"rewrite_rules": [{"pattern": "a", "replacement": "b",
                                "flags": "i"}]})",
         Error::CONFIG_UNKNOWN_PROPERTY},
        {"rule pattern wrong type",
         R"({"rewrite_rules": [{"pattern": 1, "replacement": "b"}]})",
         Error::CONFIG_PROPERTY_WRONG_TYPE},
    }));

    CAPTURE(test_case.name);
    auto config = load_config(test_case.json);
    REQUIRE_FALSE(config);
    CHECK(config.error().code == test_case.expected_error);
  }
}

CONFIG_TEST("load_config_file") {
  SECTION("missing file") {
    auto config = load_config_file("/nonexistent/slokit/normalizer.json");
    REQUIRE_FALSE(config);
    CHECK(config.error().code == Error::CONFIG_FILE_UNREADABLE);
  }

  SECTION("file contents are parsed") {
    const std::string path = "slokit_test_normalizer_config.json";
    {
      std::ofstream file(path);
      file << R"({"query_param": "op", "sanitize_numbers": true})";
    }
    auto config = load_config_file(path);
    std::remove(path.c_str());
    REQUIRE(config);
    CHECK(config->query_param == "op");
    CHECK(config->sanitize_numbers == true);
  }

  SECTION("errors mention the file") {
    const std::string path = "slokit_test_bad_normalizer_config.json";
    {
      std::ofstream file(path);
      file << R"({"query_param": false})";
    }
    auto config = load_config_file(path);
    std::remove(path.c_str());
    REQUIRE_FALSE(config);
    CHECK(config.error().code == Error::CONFIG_PROPERTY_WRONG_TYPE);
    CHECK(config.error().message.find(path) != std::string::npos);
  }
}

CONFIG_TEST("to_json") {
  NormalizerConfig config;
  config.query_param = "op";
  config.rewrite_rules = {{"^/v2/", "/api"}};
  config.sanitize_ips = true;
  auto finalized = finalize_config(config);
  REQUIRE(finalized);

  const auto json = nlohmann::json::parse(to_json(*finalized));
  CHECK(json["query_param"] == "op");
  REQUIRE(json["rewrite_rules"].size() == 1);
  CHECK(json["rewrite_rules"][0]["pattern"] == "^/v2/");
  CHECK(json["rewrite_rules"][0]["replacement"] == "/api");
  CHECK(json["sanitize"]["ips"] == true);
  CHECK(json["sanitize"]["numbers"] == false);
  CHECK(json["log_on_startup"] == true);
  CHECK(json["origins"]["query_param"] == "code");
  CHECK(json["origins"]["sanitize_hashes"] == "default");
}
