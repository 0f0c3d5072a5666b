#pragma once

/**
 * @file structural.hpp
 * @brief Structural (jsondiffpatch-style) diff, patch, merge and inverse
 *
 * Delta shape:
 *   Added{value}, Removed{value}, Changed{old, new}, Moved{from_index},
 *   TextPatch{ops}, ObjectDelta{key -> Delta},
 *   ArrayDelta{removed: old index -> Removed,
 *              changed: new index -> Added | Changed | Moved | TextPatch | nested}
 *
 * Arrays are patched in three passes: removals (deletes and move sources)
 * by descending old index, insertions (adds and move targets) by ascending
 * new index, then in-place changes by new index.
 */

#include "linkdiff/common.hpp"
#include "linkdiff/document.hpp"
#include "linkdiff/lcs.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace linkdiff::structural {

/**
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class ArrayDiffMode {
    kLcs,     ///< LCS alignment
    kSimple,  ///< positional comparison
};

struct Options
{
    bool include_moves = true;
    ArrayDiffMode array_diff = ArrayDiffMode::kLcs;
    bool text_diff = true;
    std::size_t text_min_length = 60;        ///< old string must be longer (code points)
    double text_similarity_threshold = 0.5;  ///< minimum similarity for a TextPatch
};

struct Delta;
struct ObjectEntry;
struct ArrayEntry;

struct Added
{
    Document value;
};

struct Removed
{
    Document value;
};

struct Changed
{
    Document old_value;
    Document new_value;
};

/// Stored under the destination index of the new array.
struct Moved
{
    std::size_t from_index;
};

struct TextPatch
{
    std::vector<lcs::TextOp> ops;
};

/// Entries sorted by key.
struct ObjectDelta
{
    std::vector<ObjectEntry> entries;
};

struct RemovedEntry
{
    std::size_t index;  ///< old index
    Removed removed;
};

/// removed sorted by old index, changed sorted by new index.
struct ArrayDelta
{
    std::vector<RemovedEntry> removed;
    std::vector<ArrayEntry> changed;
};

using DeltaNode = std::variant<Added, Removed, Changed, Moved, TextPatch, ObjectDelta, ArrayDelta>;

struct Delta
{
    DeltaNode node;
};

struct ObjectEntry
{
    std::string key;
    Delta delta;
};

struct ArrayEntry
{
    std::size_t index;  ///< new index
    Delta delta;
};

/// True when applying the delta changes nothing.
[[nodiscard]] bool is_empty(const Delta& delta);

/**
 * Compute the delta turning old_doc into new_doc.
 * Equal documents yield an empty delta.
 */
[[nodiscard]] Result<Delta> diff(const Document& old_doc,
                                 const Document& new_doc,
                                 const Options& options = {});

/**
 * Apply a delta.
 * @return PatchFailed when a referenced key is missing or an index is out of range
 */
[[nodiscard]] Result<Document> patch(const Document& doc, const Delta& delta);

/// Dry-run patch; never fails.
[[nodiscard]] bool validate_patch(const Document& doc, const Delta& delta);

/**
 * Merge deltas in order; later entries win per key, object and array deltas
 * merge recursively.
 */
[[nodiscard]] Result<Delta> merge_diffs(std::span<const Delta> deltas);

/**
 * Delta that undoes the given one.
 */
[[nodiscard]] Result<Delta> inverse(const Delta& delta);

// ============================================================================
// Wire codec (jsondiffpatch format)
// ============================================================================

/**
 * Encode a delta:
 *   [new] added, [old, new] changed, [old, 0, 0] removed,
 *   [ops, 0, 2] text patch, ["", to, 3] moved (under "_<from>"),
 *   arrays tagged "_t": "a" with removals under "_<old>".
 */
[[nodiscard]] nlohmann::json to_json(const Delta& delta);

[[nodiscard]] Result<Delta> delta_from_json(const nlohmann::json& j);

/**
 * Read a delta file, validate it against structural_delta.v1 and decode it.
 */
[[nodiscard]] Result<Delta> load_delta(const std::string& path, const std::string& schema_dir);

[[nodiscard]] nlohmann::json text_ops_to_json(std::span<const lcs::TextOp> ops);
[[nodiscard]] Result<std::vector<lcs::TextOp>> text_ops_from_json(const nlohmann::json& j);

}  // namespace linkdiff::structural
