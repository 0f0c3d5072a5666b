#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for deterministic hashing
 *
 * Rules:
 * - UTF-8 encoding (invalid sequences are rejected)
 * - Object keys in lexicographic byte order
 * - No whitespace (minimal representation)
 * - Floats holding an integral value with magnitude <= 2^53 are written as
 *   integers; NaN and infinities are rejected
 * - Arrays keep their order
 */

#include "linkdiff/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace linkdiff::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] linkdiff::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Compute SHA-256 hash of canonical JSON
 * @param j JSON value
 * @return "sha256:" + hex hash or error
 */
[[nodiscard]] linkdiff::Result<std::string> hash_canonical(const nlohmann::json& j);

/**
 * Validate JSON for canonical form requirements
 * - No NaN or infinite numbers
 * @param j JSON value
 * @return Empty on success, error on failure
 */
[[nodiscard]] linkdiff::VoidResult validate_for_canonical(const nlohmann::json& j);

}  // namespace linkdiff::canonical
