#pragma once

// This component provides lexical path manipulation.

#include <string>
#include <string_view>

namespace slokit {
namespace normalizer {

// Return the shortest path equivalent to `path` by purely lexical processing,
// following the rules of Go's `path.Clean`:
//
// 1. Replace multiple slashes with a single slash.
// 2. Eliminate each "." path element.
// 3. Eliminate each inner ".." element and the non-".." element preceding it.
// 4. Eliminate ".." elements that begin a rooted path.
//
// A trailing slash is removed unless the result is "/". An empty result
// becomes "." (or "/" for a rooted path).
std::string clean_path(std::string_view path);

}  // namespace normalizer
}  // namespace slokit
