#pragma once

// This component provides serialization helpers shared by the configuration,
// environment, and stage components.

#include <nlohmann/json.hpp>
#include <string>

namespace slokit {
namespace normalizer {

// Return `json` serialized compactly. Strings in `json` may hold arbitrary
// bytes taken from request paths, environment variables, or code; invalid
// UTF-8 sequences are written as U+FFFD instead of throwing.
inline std::string dump_json(const nlohmann::json& json) {
  return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace normalizer
}  // namespace slokit
