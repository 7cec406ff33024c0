#include <slokit/clock.h>

namespace slokit {
namespace normalizer {

const Clock default_clock = []() { return std::chrono::steady_clock::now(); };

}  // namespace normalizer
}  // namespace slokit
