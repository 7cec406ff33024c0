#pragma once

// This component provides the whole-path rewrite rules that a `PathSanitizer`
// applies before it looks at individual path segments.
//
// `RewriteRule` is the configuration form: a regular expression and the
// literal path that replaces any path the expression matches.
// `CompiledRewriteRule` is the form used at runtime. It is produced by
// `CompiledRewriteRule::compile`, which fails if the pattern is not a valid
// RE2 regular expression, and is immutable afterward. RE2 accepts the same
// syntax as Go's `regexp` package, e.g. "(?i)" flags and "(?P<name>...)"
// groups, and matches in time linear in the length of the path. A compiled
// rule may be shared by any number of threads.
//
// A rule "matches" a path if the pattern matches any part of it; the pattern
// is not implicitly anchored. When a rule matches, the whole path is replaced
// by the replacement, verbatim. No capture-group substitution is performed.

#include <slokit/expected.h>

#include <memory>
#include <string>
#include <string_view>

namespace re2 {
class RE2;
}  // namespace re2

namespace slokit {
namespace normalizer {

struct RewriteRule {
  std::string pattern;
  std::string replacement;
};

class CompiledRewriteRule {
  RewriteRule rule_;
  std::shared_ptr<const re2::RE2> regex_;

  CompiledRewriteRule(RewriteRule rule,
                      std::shared_ptr<const re2::RE2> regex);

 public:
  static Expected<CompiledRewriteRule> compile(const RewriteRule& rule);

  // Return the replacement if `path` matches this rule, or `path` otherwise.
  std::string apply(std::string_view path) const;

  bool matches(std::string_view path) const;

  const std::string& pattern() const { return rule_.pattern; }
  const std::string& replacement() const { return rule_.replacement; }
};

}  // namespace normalizer
}  // namespace slokit
