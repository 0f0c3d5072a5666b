#pragma once

/**
 * @file operational.hpp
 * @brief Operation-based (CRDT-style) diff, patch, merge and inverse
 *
 * A diff is an ordered list of timestamped, actor-attributed operations.
 * Operations are replayed in emission order; every array index carried by
 * an operation is valid at the moment that operation is replayed.
 */

#include "linkdiff/common.hpp"
#include "linkdiff/document.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace linkdiff::operational {

/**
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class OpType {
    kSet,
    kDelete,
    kInsert,
    kMove,
};

enum class ConflictResolution {
    kLastWriteWins,
    kMerge,
    kInverse,  ///< marks a diff produced by inverse()
};

struct Operation
{
    OpType type;
    Path path;                          ///< target; for Move the destination slot
    std::optional<Document> value;      ///< Set and Insert
    std::optional<std::size_t> from;    ///< Move: source index in the same array
    std::uint64_t timestamp = 0;
    std::string actor_id;
};

struct TimestampRange
{
    std::uint64_t min = 0;
    std::uint64_t max = 0;
};

struct Metadata
{
    std::vector<std::string> actors;  ///< first-seen order, no duplicates
    TimestampRange timestamp_range;
    ConflictResolution conflict_resolution = ConflictResolution::kLastWriteWins;
};

struct OperationalDiff
{
    std::vector<Operation> operations;
    Metadata metadata;
};

struct Options
{
    std::optional<std::string> actor_id;    ///< default: generate_actor_id()
    std::optional<std::uint64_t> timestamp;  ///< first logical timestamp; default: now_nanoseconds()
    ConflictResolution conflict_resolution = ConflictResolution::kLastWriteWins;
};

struct MergeOptions
{
    /// default: policy of the first diff, else LastWriteWins
    std::optional<ConflictResolution> conflict_resolution;
};

/**
 * Compute operations turning old_doc into new_doc.
 *
 * Arrays emit, in order: moves sorted by (from, to), deletes by descending
 * index, in-place changes by ascending index, inserts by ascending index.
 */
[[nodiscard]] Result<OperationalDiff> diff(const Document& old_doc,
                                           const Document& new_doc,
                                           const Options& options = {});

/**
 * Replay operations in emission order.
 * @return PatchFailed when a parent container is missing or an index is out of range
 */
[[nodiscard]] Result<Document> patch(const Document& doc, const OperationalDiff& diff);

/**
 * Check each operation against the document as replay reaches it:
 * Set/Delete need the parent path, Insert needs the parent container (or
 * the root), Move needs both indices in range of the addressed array.
 * Never fails.
 */
[[nodiscard]] bool validate_patch(const Document& doc, const OperationalDiff& diff);

/**
 * Concatenate, sort by timestamp (stable) and resolve conflicts.
 * LastWriteWins keeps the newest operation per path; later input wins ties.
 */
[[nodiscard]] Result<OperationalDiff> merge_diffs(std::span<const OperationalDiff> diffs,
                                                  const MergeOptions& options = {});

/**
 * Best-effort undo: reverse order, Set -> Delete, Delete -> Set(null),
 * Insert -> Delete, Move back to its source. Deleted and overwritten
 * values are not recoverable. The policy becomes Inverse.
 */
[[nodiscard]] Result<OperationalDiff> inverse(const OperationalDiff& diff);

/// 16 lowercase hex characters from a random 64-bit value.
[[nodiscard]] std::string generate_actor_id();

/// System clock in nanoseconds since the epoch.
[[nodiscard]] std::uint64_t now_nanoseconds();

[[nodiscard]] std::string_view op_type_name(OpType type);
[[nodiscard]] std::optional<OpType> parse_op_type(std::string_view name);
[[nodiscard]] std::string_view conflict_resolution_name(ConflictResolution policy);
[[nodiscard]] std::optional<ConflictResolution> parse_conflict_resolution(std::string_view name);

// ============================================================================
// Wire codec
// ============================================================================

[[nodiscard]] nlohmann::json to_json(const OperationalDiff& diff);
[[nodiscard]] Result<OperationalDiff> diff_from_json(const nlohmann::json& j);

/**
 * Read a diff file, validate it against operational_diff.v1 and decode it.
 */
[[nodiscard]] Result<OperationalDiff> load_diff(const std::string& path,
                                                const std::string& schema_dir);

}  // namespace linkdiff::operational
