#include <slokit/error.h>
#include <slokit/rewrite_rule.h>

#include "test.h"

using namespace slokit::normalizer;

#define REWRITE_RULE_TEST(x) TEST_CASE(x, "[rewrite_rule]")

REWRITE_RULE_TEST("a matching rule replaces the whole path") {
  auto rule = CompiledRewriteRule::compile({"^/v2/orders/", "/orders"});
  REQUIRE(rule);
  CHECK(rule->pattern() == "^/v2/orders/");
  CHECK(rule->replacement() == "/orders");

  CHECK(rule->matches("/v2/orders/123/items"));
  CHECK(rule->apply("/v2/orders/123/items") == "/orders");
}

REWRITE_RULE_TEST("a rule that does not match leaves the path alone") {
  auto rule = CompiledRewriteRule::compile({"^/v2/orders/", "/orders"});
  REQUIRE(rule);
  CHECK_FALSE(rule->matches("/v1/orders/123"));
  CHECK(rule->apply("/v1/orders/123") == "/v1/orders/123");
}

REWRITE_RULE_TEST("patterns are not anchored") {
  auto rule = CompiledRewriteRule::compile({"session", "/session"});
  REQUIRE(rule);
  CHECK(rule->apply("/api/session/refresh") == "/session");
  CHECK(rule->apply("/api/login") == "/api/login");
}

REWRITE_RULE_TEST("replacement is literal") {
  auto rule = CompiledRewriteRule::compile({"^/(users)/([0-9]+)$", "/$1/$2"});
  REQUIRE(rule);
  CHECK(rule->apply("/users/42") == "/$1/$2");
}

REWRITE_RULE_TEST("an invalid pattern is reported") {
  auto pattern = GENERATE(as<std::string>{}, "(", "[a-", "a{2,1}", "*x");
  CAPTURE(pattern);

  auto rule = CompiledRewriteRule::compile({pattern, "/x"});
  REQUIRE_FALSE(rule);
  CHECK(rule.error().code == Error::REWRITE_RULE_INVALID_PATTERN);
  CHECK(rule.error().message.find(pattern) != std::string::npos);
  CHECK(rule.error().to_string().rfind("[slokit error code 2] ", 0) == 0);
}

REWRITE_RULE_TEST("patterns use Go regexp syntax") {
  SECTION("flags") {
    auto rule = CompiledRewriteRule::compile({"(?i)^/API/", "/api"});
    REQUIRE(rule);
    CHECK(rule->matches("/api/users"));
    CHECK(rule->matches("/Api/users"));
    CHECK_FALSE(rule->matches("/v1/api/users"));
  }

  SECTION("named groups") {
    auto rule = CompiledRewriteRule::compile({"^/(?P<v>v[0-9]+)/", "/api"});
    REQUIRE(rule);
    CHECK(rule->apply("/v2/orders") == "/api");
    CHECK(rule->apply("/vx/orders") == "/vx/orders");
  }

  SECTION("text anchors") {
    auto rule = CompiledRewriteRule::compile({"\\A/api", "/api"});
    REQUIRE(rule);
    CHECK(rule->matches("/api/users"));
    CHECK_FALSE(rule->matches("/A/api"));
  }

  SECTION("lookaround is not supported") {
    auto rule = CompiledRewriteRule::compile({"^/api(?=/)", "/api"});
    REQUIRE_FALSE(rule);
    CHECK(rule.error().code == Error::REWRITE_RULE_INVALID_PATTERN);
  }
}

REWRITE_RULE_TEST("compiled rules can be copied and shared") {
  auto rule = CompiledRewriteRule::compile({"^/v1/", "/api"});
  REQUIRE(rule);
  const CompiledRewriteRule copy = *rule;
  CHECK(copy.pattern() == "^/v1/");
  CHECK(copy.apply("/v1/x") == "/api");
  CHECK(rule->apply("/v1/x") == "/api");
}
