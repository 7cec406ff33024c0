#pragma once

// This component provides a class, `PathSanitizer`, that reduces a URL path to
// a low-cardinality form suitable for use in an event key.
//
// `PathSanitizer::sanitize` proceeds in three steps:
//
// 1. Apply each rewrite rule, in order, to the whole path. A rule that
//    matches replaces the entire path with its replacement; later rules see
//    the replaced path.
// 2. Clean the path lexically (collapse "//", resolve "." and "..", drop a
//    trailing "/") and split it into segments on "/".
// 3. Replace each non-empty segment that looks like an identifier with a
//    placeholder. The checks below are made in order, and the first enabled
//    check that matches wins:
//
//        option    segment                              placeholder
//        -------   ----------------------------------   -----------
//        hashes    MD5, SHA1, or SHA256 hex digest      ":hash"
//        numbers   all decimal or all hex digits        "0"
//        uuids     UUID                                 ":uuid"
//        ips       IPv4 or IPv6 address                 ":ip"
//        images    image file name (last segment only)  ":image"
//        fonts     font file name (last segment only)   ":font"
//
// An empty path sanitizes to "/".

#include <slokit/rewrite_rule.h>

#include <string>
#include <string_view>
#include <vector>

namespace slokit {
namespace normalizer {

namespace placeholder {

inline constexpr std::string_view hash = ":hash";
inline constexpr std::string_view number = "0";
inline constexpr std::string_view uuid = ":uuid";
inline constexpr std::string_view ip = ":ip";
inline constexpr std::string_view image = ":image";
inline constexpr std::string_view font = ":font";

}  // namespace placeholder

struct SanitizerConfig {
  bool hashes = false;
  bool numbers = false;
  bool uuids = false;
  bool ips = false;
  bool images = false;
  bool fonts = false;
};

class PathSanitizer {
  std::vector<CompiledRewriteRule> rewrite_rules_;
  SanitizerConfig config_;

  // Return the placeholder for the segment at `index` of `count` segments,
  // or an empty view if the segment is to be kept.
  std::string_view replacement(std::string_view segment, std::size_t index,
                               std::size_t count) const;

 public:
  PathSanitizer(std::vector<CompiledRewriteRule> rewrite_rules,
                const SanitizerConfig& config);

  std::string sanitize(std::string_view raw_path) const;

  // Return the result of applying only the rewrite rules to `raw_path`.
  std::string rewrite(std::string_view raw_path) const;

  const SanitizerConfig& config() const { return config_; }
  const std::vector<CompiledRewriteRule>& rewrite_rules() const {
    return rewrite_rules_;
  }
};

}  // namespace normalizer
}  // namespace slokit
