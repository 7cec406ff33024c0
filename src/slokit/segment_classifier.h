#pragma once

// This component provides the predicates that `PathSanitizer` uses to decide
// whether a path segment is an identifier or an asset name. Each predicate
// looks at a single segment, without any slashes.

#include <string_view>

namespace slokit {
namespace normalizer {

// Return whether `segment` is a lower-case hexadecimal MD5 (32 digits),
// SHA1 (40 digits), or SHA256 (64 digits) digest.
bool is_hash(std::string_view segment);

// Return whether `segment` is a non-empty run of decimal digits.
bool is_numeric(std::string_view segment);

// Return whether `segment` is a non-empty run of hexadecimal digits, in either
// case.
bool is_hexadecimal(std::string_view segment);

// Return whether `segment` is a UUID in canonical lower-case 8-4-4-4-12 form.
// Any version is accepted.
bool is_uuid(std::string_view segment);

// Return whether `segment` is an IPv4 address in dotted-decimal notation or
// an IPv6 address in any textual form accepted by `inet_pton`.
bool is_ip(std::string_view segment);

// Return whether `segment` ends with an image file extension: .png, .jpg,
// .jpeg, .svg, .tif, .tiff, .gif, or .ico, ignoring case.
bool is_image_name(std::string_view segment);

// Return whether `segment` ends with a font file extension: .ttf or .woff,
// ignoring case.
bool is_font_name(std::string_view segment);

}  // namespace normalizer
}  // namespace slokit
