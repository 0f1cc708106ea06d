#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "reposlice/common.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace reposlice::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * Cross-schema references of the form "reposlice:schema/<name>" resolve to
 * "<name>.schema.json" next to @p schema_path.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] reposlice::VoidResult validate_json(const nlohmann::json& j,
                                                  const std::string& schema_path);

/**
 * Validate JSON against "<schema_dir>/<schema_name>.schema.json".
 */
[[nodiscard]] reposlice::VoidResult validate_json_named(const nlohmann::json& j,
                                                        std::string_view schema_dir,
                                                        std::string_view schema_name);

/**
 * Read and parse a JSON file.
 */
[[nodiscard]] reposlice::Result<nlohmann::json> read_json_file(const std::string& path);

}  // namespace reposlice::common
