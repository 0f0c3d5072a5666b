#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of persisted deltas and config files
 */

#include "linkdiff/common.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace linkdiff::common {

/// Schema names shipped in the schemas/ directory (without ".schema.json").
inline constexpr std::string_view kStructuralDeltaSchema = "structural_delta.v1";
inline constexpr std::string_view kOperationalDiffSchema = "operational_diff.v1";
inline constexpr std::string_view kSemanticDiffSchema = "semantic_diff.v1";
inline constexpr std::string_view kConfigSchema = "config.v1";

/**
 * Validate JSON against a JSON Schema file.
 *
 * References of the form "linkdiff:schema/<name>" resolve to
 * "<name>.schema.json" next to the schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] linkdiff::VoidResult validate_json(const nlohmann::json& j,
                                                 const std::string& schema_path);

/**
 * Validate JSON against a named schema inside a schema directory.
 */
[[nodiscard]] linkdiff::VoidResult validate_json_named(const nlohmann::json& j,
                                                       const std::string& schema_dir,
                                                       std::string_view schema_name);

}  // namespace linkdiff::common
