#pragma once

/**
 * @file lcs.hpp
 * @brief Sequence alignment (longest common subsequence) and text diffs
 *
 * Alignment is computed by dynamic programming after trimming the common
 * prefix and suffix. Backtracking runs from the end and prefers dropping
 * an old element on ties, so results are deterministic.
 */

#include "linkdiff/common.hpp"
#include "linkdiff/document.hpp"

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace linkdiff::lcs {

struct Match
{
    std::size_t old_index;
    std::size_t new_index;
};

/**
 * Result of aligning two sequences.
 * matches are ordered; deletes and inserts ascend.
 */
struct Alignment
{
    std::vector<Match> matches;
    std::vector<std::size_t> deletes;  ///< old indices without a partner
    std::vector<std::size_t> inserts;  ///< new indices without a partner
};

/// Element moved from old index `from` to new index `to`.
struct MovePair
{
    std::size_t from;
    std::size_t to;
};

/// Element kept in place but modified (old index -> new index).
struct ChangePair
{
    std::size_t old_index;
    std::size_t new_index;
};

/// Equality of old element i and new element j.
using IndexEqual = std::function<bool(std::size_t, std::size_t)>;

/**
 * Align two index ranges of sizes n and m with a caller-supplied equality.
 */
[[nodiscard]] Alignment align_with(std::size_t n, std::size_t m, const IndexEqual& equal);

/**
 * Align two document sequences by value equality.
 */
[[nodiscard]] Alignment align(std::span<const Document> old_seq, std::span<const Document> new_seq);

/**
 * Pair inserts with deletes of an equal value (first fit).
 *
 * Inserts are visited in ascending new index; each takes the earliest
 * still-unpaired delete holding an equal value whose index differs.
 * Paired entries are removed from the alignment. With duplicate values the
 * pairing is one of several valid ones.
 */
[[nodiscard]] std::vector<MovePair> pair_moves(Alignment& alignment,
                                               std::span<const Document> old_seq,
                                               std::span<const Document> new_seq);

/**
 * Pair leftover deletes and inserts that fall in the same gap between two
 * consecutive matches, positionally. Paired entries are removed from the
 * alignment.
 */
[[nodiscard]] std::vector<ChangePair> pair_changes(Alignment& alignment);

// ============================================================================
// Text diff (Unicode code points)
// ============================================================================

/**
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class TextOpKind {
    kDelete,   ///< remove [start, end)
    kInsert,   ///< insert text at start (end == start)
    kReplace,  ///< replace [start, end) with text
};

/**
 * One edit of a text diff. Positions count code points of the old text.
 * old_text holds the removed characters so the op can be inverted.
 */
struct TextOp
{
    TextOpKind kind;
    std::size_t start;
    std::size_t end;
    std::string old_text;
    std::string text;

    friend bool operator==(const TextOp&, const TextOp&) = default;
};

struct TextDiff
{
    std::vector<TextOp> ops;  ///< ascending, non-overlapping
    double similarity;        ///< 2 * common / (len_old + len_new)
};

/// Maximum DP cells spent on the middle of a text diff.
inline constexpr std::size_t kTextCellBudget = 4'000'000;

/**
 * Diff two UTF-8 strings code point by code point. Beyond the cell budget
 * the differing middle becomes one replace op.
 */
[[nodiscard]] TextDiff diff_text(std::string_view old_text, std::string_view new_text);

/**
 * Apply ops to text.
 * @return PatchFailed when an op is out of range or ops overlap
 */
[[nodiscard]] Result<std::string> apply_text(std::string_view text, std::span<const TextOp> ops);

/**
 * Ops that turn the new text back into the old one.
 */
[[nodiscard]] std::vector<TextOp> invert_text(std::span<const TextOp> ops);

/// Number of code points in a UTF-8 string (invalid bytes count as one).
[[nodiscard]] std::size_t code_point_length(std::string_view text);

[[nodiscard]] std::string_view text_op_name(TextOpKind kind);

}  // namespace linkdiff::lcs
