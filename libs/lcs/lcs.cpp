/**
 * @file lcs.cpp
 * @brief LCS alignment, move pairing and change pairing
 */

#include "linkdiff/lcs.hpp"

#include <algorithm>
#include <cstdint>
#include <ranges>

namespace linkdiff::lcs {

Alignment align_with(std::size_t n, std::size_t m, const IndexEqual& equal)
{
    Alignment alignment;

    std::size_t prefix = 0;
    while (prefix < n && prefix < m && equal(prefix, prefix)) {
        ++prefix;
    }
    std::size_t suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix
           && equal(n - 1 - suffix, m - 1 - suffix)) {
        ++suffix;
    }

    const std::size_t rows = n - prefix - suffix;
    const std::size_t cols = m - prefix - suffix;
    const std::size_t stride = cols + 1;

    // table[i * stride + j] = LCS length of old[prefix, prefix+i) and new[prefix, prefix+j)
    std::vector<std::uint32_t> table((rows + 1) * stride, 0);
    for (std::size_t i = 1; i <= rows; ++i) {
        for (std::size_t j = 1; j <= cols; ++j) {
            if (equal(prefix + i - 1, prefix + j - 1)) {
                table[i * stride + j] = table[(i - 1) * stride + (j - 1)] + 1;
            } else {
                table[i * stride + j] =
                    std::max(table[(i - 1) * stride + j], table[i * stride + (j - 1)]);
            }
        }
    }

    std::vector<Match> middle;
    std::size_t i = rows;
    std::size_t j = cols;
    while (i > 0 || j > 0) {
        if (i > 0 && j > 0 && equal(prefix + i - 1, prefix + j - 1)) {
            middle.push_back(Match{.old_index = prefix + i - 1, .new_index = prefix + j - 1});
            --i;
            --j;
        } else if (j == 0 || (i > 0 && table[(i - 1) * stride + j] >= table[i * stride + (j - 1)])) {
            alignment.deletes.push_back(prefix + i - 1);
            --i;
        } else {
            alignment.inserts.push_back(prefix + j - 1);
            --j;
        }
    }

    alignment.matches.reserve(prefix + middle.size() + suffix);
    for (std::size_t k = 0; k < prefix; ++k) {
        alignment.matches.push_back(Match{.old_index = k, .new_index = k});
    }
    for (const auto& match : middle | std::views::reverse) {
        alignment.matches.push_back(match);
    }
    for (std::size_t k = suffix; k > 0; --k) {
        alignment.matches.push_back(Match{.old_index = n - k, .new_index = m - k});
    }
    std::ranges::sort(alignment.deletes);
    std::ranges::sort(alignment.inserts);
    return alignment;
}

Alignment align(std::span<const Document> old_seq, std::span<const Document> new_seq)
{
    return align_with(old_seq.size(), new_seq.size(), [&](std::size_t i, std::size_t j) {
        return old_seq[i] == new_seq[j];
    });
}

std::vector<MovePair> pair_moves(Alignment& alignment,
                                 std::span<const Document> old_seq,
                                 std::span<const Document> new_seq)
{
    std::vector<MovePair> moves;
    std::vector<bool> delete_used(alignment.deletes.size(), false);
    std::vector<std::size_t> unpaired_inserts;

    for (std::size_t to : alignment.inserts) {
        bool paired = false;
        for (std::size_t d = 0; d < alignment.deletes.size(); ++d) {
            const std::size_t from = alignment.deletes[d];
            if (delete_used[d] || from == to || !(old_seq[from] == new_seq[to])) {
                continue;
            }
            delete_used[d] = true;
            moves.push_back(MovePair{.from = from, .to = to});
            paired = true;
            break;
        }
        if (!paired) {
            unpaired_inserts.push_back(to);
        }
    }

    std::vector<std::size_t> unpaired_deletes;
    for (std::size_t d = 0; d < alignment.deletes.size(); ++d) {
        if (!delete_used[d]) {
            unpaired_deletes.push_back(alignment.deletes[d]);
        }
    }
    alignment.deletes = std::move(unpaired_deletes);
    alignment.inserts = std::move(unpaired_inserts);
    return moves;
}

std::vector<ChangePair> pair_changes(Alignment& alignment)
{
    std::vector<ChangePair> changes;
    std::vector<std::size_t> rest_deletes;
    std::vector<std::size_t> rest_inserts;

    auto del = alignment.deletes.begin();
    auto ins = alignment.inserts.begin();
    // Gap g lies before matches[g]; the last gap is unbounded.
    for (std::size_t g = 0; g <= alignment.matches.size(); ++g) {
        const bool bounded = g < alignment.matches.size();
        std::vector<std::size_t> gap_deletes;
        std::vector<std::size_t> gap_inserts;
        while (del != alignment.deletes.end()
               && (!bounded || *del < alignment.matches[g].old_index)) {
            gap_deletes.push_back(*del++);
        }
        while (ins != alignment.inserts.end()
               && (!bounded || *ins < alignment.matches[g].new_index)) {
            gap_inserts.push_back(*ins++);
        }

        const std::size_t paired = std::min(gap_deletes.size(), gap_inserts.size());
        for (std::size_t k = 0; k < paired; ++k) {
            changes.push_back(ChangePair{.old_index = gap_deletes[k], .new_index = gap_inserts[k]});
        }
        rest_deletes.insert(rest_deletes.end(),
                            gap_deletes.begin() + static_cast<std::ptrdiff_t>(paired),
                            gap_deletes.end());
        rest_inserts.insert(rest_inserts.end(),
                            gap_inserts.begin() + static_cast<std::ptrdiff_t>(paired),
                            gap_inserts.end());
    }

    alignment.deletes = std::move(rest_deletes);
    alignment.inserts = std::move(rest_inserts);
    return changes;
}

}  // namespace linkdiff::lcs
