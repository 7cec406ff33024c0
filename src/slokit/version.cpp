#include <slokit/version.h>

namespace slokit {
namespace normalizer {

#define SLOKIT_NORMALIZER_VERSION "v0.3.0"

const char* const normalizer_version = SLOKIT_NORMALIZER_VERSION;
const char* const normalizer_version_string =
    "[slokit-normalizer version " SLOKIT_NORMALIZER_VERSION "]";

}  // namespace normalizer
}  // namespace slokit
