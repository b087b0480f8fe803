#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "jsondelta/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace jsondelta::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] jsondelta::VoidResult validate_json(const nlohmann::json& j,
                                                  const std::string& schema_path);

}  // namespace jsondelta::common
