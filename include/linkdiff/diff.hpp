#pragma once

/**
 * @file diff.hpp
 * @brief Strategy-selected diff/patch/merge/inverse over wire JSON
 *
 * The facade picks the structural, operational or semantic engine by name
 * and exchanges deltas in their JSON wire formats. Engine calls go through
 * the acceleration boundary.
 */

#include "linkdiff/accel.hpp"
#include "linkdiff/common.hpp"
#include "linkdiff/config.hpp"
#include "linkdiff/document.hpp"
#include "linkdiff/operational.hpp"
#include "linkdiff/semantic.hpp"
#include "linkdiff/structural.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace linkdiff {

/**
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class Strategy {
    kStructural,
    kOperational,
    kSemantic,
};

[[nodiscard]] std::string_view strategy_name(Strategy strategy);

/// @return InvalidStrategy for unknown names
[[nodiscard]] Result<Strategy> parse_strategy(std::string_view name);

struct DiffOptions
{
    std::string strategy = "structural";
    structural::Options structural;
    operational::Options operational;
    semantic::Options semantic;
    accel::DispatchOptions dispatch;
};

struct MergeOptions
{
    std::string strategy = "operational";
    /// operational only; default: the policy installed by apply_config(),
    /// else the first diff's policy
    std::optional<operational::ConflictResolution> conflict_resolution;
    accel::DispatchOptions dispatch;
};

[[nodiscard]] Result<nlohmann::json> diff(const Document& old_doc,
                                          const Document& new_doc,
                                          const DiffOptions& options = {});

/// @return InvalidDelta when the delta does not decode for the strategy
[[nodiscard]] Result<Document> patch(const Document& doc,
                                     const nlohmann::json& delta,
                                     const DiffOptions& options = {});

/// Never fails; an undecodable delta or unknown strategy is false.
[[nodiscard]] bool validate_patch(const Document& doc,
                                  const nlohmann::json& delta,
                                  const DiffOptions& options = {});

[[nodiscard]] Result<nlohmann::json> merge_diffs(std::span<const nlohmann::json> deltas,
                                                 const MergeOptions& options = {});

[[nodiscard]] Result<nlohmann::json> inverse(const nlohmann::json& delta, const DiffOptions& options = {});

/**
 * Install process-wide settings: stored canonicalization provider, cache
 * capacity, acceleration verify mode, log level and the default conflict
 * resolution used by merge_diffs().
 * @return ConfigError for an unknown conflict resolution name
 */
[[nodiscard]] VoidResult apply_config(const config::Config& config);

/// Policy installed by apply_config() (LastWriteWins until then).
[[nodiscard]] operational::ConflictResolution default_conflict_resolution();

}  // namespace linkdiff
