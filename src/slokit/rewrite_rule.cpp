#include <slokit/rewrite_rule.h>

#include <re2/re2.h>

namespace slokit {
namespace normalizer {

CompiledRewriteRule::CompiledRewriteRule(
    RewriteRule rule, std::shared_ptr<const re2::RE2> regex)
    : rule_(std::move(rule)), regex_(std::move(regex)) {}

Expected<CompiledRewriteRule> CompiledRewriteRule::compile(
    const RewriteRule& rule) {
  re2::RE2::Options options;
  // Failures are reported through the returned `Error`, not stderr.
  options.set_log_errors(false);
  auto regex = std::make_shared<const re2::RE2>(rule.pattern, options);
  if (!regex->ok()) {
    std::string message;
    message += "Failed to compile rewrite rule pattern \"";
    message += rule.pattern;
    message += "\": ";
    message += regex->error();
    return Error{Error::REWRITE_RULE_INVALID_PATTERN, std::move(message)};
  }
  return CompiledRewriteRule{rule, std::move(regex)};
}

bool CompiledRewriteRule::matches(std::string_view path) const {
  return re2::RE2::PartialMatch(re2::StringPiece(path.data(), path.size()),
                                *regex_);
}

std::string CompiledRewriteRule::apply(std::string_view path) const {
  if (matches(path)) {
    return rule_.replacement;
  }
  return std::string(path);
}

}  // namespace normalizer
}  // namespace slokit
