#include <slokit/path_sanitizer.h>

#include "path_util.h"
#include "segment_classifier.h"
#include "string_util.h"

namespace slokit {
namespace normalizer {

PathSanitizer::PathSanitizer(std::vector<CompiledRewriteRule> rewrite_rules,
                             const SanitizerConfig& config)
    : rewrite_rules_(std::move(rewrite_rules)), config_(config) {}

std::string PathSanitizer::rewrite(std::string_view raw_path) const {
  std::string path{raw_path};
  for (const auto& rule : rewrite_rules_) {
    path = rule.apply(path);
  }
  return path;
}

std::string_view PathSanitizer::replacement(std::string_view segment,
                                            std::size_t index,
                                            std::size_t count) const {
  if (config_.hashes && is_hash(segment)) {
    return placeholder::hash;
  }
  if (config_.numbers && (is_numeric(segment) || is_hexadecimal(segment))) {
    return placeholder::number;
  }
  if (config_.uuids && is_uuid(segment)) {
    return placeholder::uuid;
  }
  if (config_.ips && is_ip(segment)) {
    return placeholder::ip;
  }

  // Asset types are only meaningful for the resource at the end of the path.
  if (index + 1 != count) {
    return {};
  }
  if (config_.images && is_image_name(segment)) {
    return placeholder::image;
  }
  if (config_.fonts && is_font_name(segment)) {
    return placeholder::font;
  }
  return {};
}

std::string PathSanitizer::sanitize(std::string_view raw_path) const {
  if (raw_path.empty()) {
    return "/";
  }

  const std::string cleaned = clean_path(rewrite(raw_path));
  std::vector<std::string> segments = split(cleaned, '/');
  const std::size_t count = segments.size();
  for (std::size_t i = 0; i < count; ++i) {
    std::string& segment = segments[i];
    if (segment.empty()) {
      continue;
    }
    const std::string_view substitute = replacement(segment, i, count);
    if (!substitute.empty()) {
      segment.assign(substitute.begin(), substitute.end());
    }
  }

  return join(segments, "/");
}

}  // namespace normalizer
}  // namespace slokit
