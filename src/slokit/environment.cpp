#include <slokit/environment.h>

#include <cstdlib>
#include <nlohmann/json.hpp>

#include "json_util.h"

namespace slokit {
namespace normalizer {
namespace environment {
namespace {

std::optional<std::string> get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return std::nullopt;
}

}  // namespace

std::string_view name(Variable variable) { return variable_names[variable]; }

std::optional<std::string> lookup(Variable variable) {
  return get_env(variable_names[variable]);
}

std::string to_json() {
  auto result = nlohmann::json::object({});

  for (const char* name : variable_names) {
    if (auto value = get_env(name)) {
      result[name] = std::move(*value);
    }
  }

  return dump_json(result);
}

}  // namespace environment
}  // namespace normalizer
}  // namespace slokit
