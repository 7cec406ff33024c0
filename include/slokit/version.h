#pragma once

// This component provides the release version of this library.
// `normalizer_version_string` is printed to the log whenever a
// `NormalizationStage` is created.

namespace slokit {
namespace normalizer {

extern const char* const normalizer_version;
extern const char* const normalizer_version_string;

}  // namespace normalizer
}  // namespace slokit
