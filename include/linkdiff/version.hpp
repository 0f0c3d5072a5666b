#pragma once

/**
 * @file version.hpp
 * @brief linkdiff version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace linkdiff {

/// linkdiff version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Wire format versions (embedded in schema ids)
constexpr const char* kStructuralDeltaVersion = "structural_delta.v1";
constexpr const char* kOperationalDiffVersion = "operational_diff.v1";
constexpr const char* kSemanticDiffVersion = "semantic_diff.v1";

}  // namespace linkdiff
