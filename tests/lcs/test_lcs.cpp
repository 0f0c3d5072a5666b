/**
 * @file test_lcs.cpp
 * @brief Sequence alignment, move pairing and change pairing tests
 */

#include "linkdiff/lcs.hpp"

#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace linkdiff::lcs::test {

namespace {

using Json = nlohmann::json;

std::vector<Json> seq(const char* text)
{
    return Json::parse(text).get<std::vector<Json>>();
}

}  // namespace

TEST(LcsAlign, IdenticalSequencesMatchEverything)
{
    auto a = seq(R"([1, 2, 3])");
    auto alignment = align(a, a);
    ASSERT_EQ(alignment.matches.size(), 3U);
    EXPECT_TRUE(alignment.deletes.empty());
    EXPECT_TRUE(alignment.inserts.empty());
    for (std::size_t k = 0; k < 3; ++k) {
        EXPECT_EQ(alignment.matches[k].old_index, k);
        EXPECT_EQ(alignment.matches[k].new_index, k);
    }
}

TEST(LcsAlign, DeleteInMiddle)
{
    auto old_seq = seq(R"([1, 2, 3])");
    auto new_seq = seq(R"([1, 3])");
    auto alignment = align(old_seq, new_seq);
    EXPECT_EQ(alignment.deletes, std::vector<std::size_t>{1});
    EXPECT_TRUE(alignment.inserts.empty());
    ASSERT_EQ(alignment.matches.size(), 2U);
    EXPECT_EQ(alignment.matches[1].old_index, 2U);
    EXPECT_EQ(alignment.matches[1].new_index, 1U);
}

TEST(LcsAlign, EmptySides)
{
    auto items = seq(R"(["a", "b"])");
    std::vector<Json> empty;

    auto removed = align(items, empty);
    EXPECT_EQ(removed.deletes, (std::vector<std::size_t>{0, 1}));
    EXPECT_TRUE(removed.matches.empty());

    auto added = align(empty, items);
    EXPECT_EQ(added.inserts, (std::vector<std::size_t>{0, 1}));
}

TEST(LcsAlign, CustomEquality)
{
    std::vector<int> a{1, 2, 3, 4};
    std::vector<int> b{10, 30, 40};
    auto alignment = align_with(a.size(), b.size(), [&](std::size_t i, std::size_t j) {
        return a[i] * 10 == b[j];
    });
    EXPECT_EQ(alignment.matches.size(), 3U);
    EXPECT_EQ(alignment.deletes, std::vector<std::size_t>{1});
}

TEST(LcsMoves, SwapBecomesMove)
{
    auto old_seq = seq(R"(["a", "b", "c"])");
    auto new_seq = seq(R"(["b", "a", "c"])");
    auto alignment = align(old_seq, new_seq);
    auto moves = pair_moves(alignment, old_seq, new_seq);

    ASSERT_EQ(moves.size(), 1U);
    EXPECT_EQ(moves[0].from, 1U);
    EXPECT_EQ(moves[0].to, 0U);
    EXPECT_TRUE(alignment.deletes.empty());
    EXPECT_TRUE(alignment.inserts.empty());
}

TEST(LcsMoves, UnequalValuesStayUnpaired)
{
    auto old_seq = seq(R"([1, 2])");
    auto new_seq = seq(R"([1, 3])");
    auto alignment = align(old_seq, new_seq);
    auto moves = pair_moves(alignment, old_seq, new_seq);
    EXPECT_TRUE(moves.empty());
    EXPECT_EQ(alignment.deletes, std::vector<std::size_t>{1});
    EXPECT_EQ(alignment.inserts, std::vector<std::size_t>{1});
}

TEST(LcsChanges, SameGapPairsPositionally)
{
    auto old_seq = seq(R"([1, 2, 3])");
    auto new_seq = seq(R"([1, 9, 3])");
    auto alignment = align(old_seq, new_seq);
    auto changes = pair_changes(alignment);

    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].old_index, 1U);
    EXPECT_EQ(changes[0].new_index, 1U);
    EXPECT_TRUE(alignment.deletes.empty());
    EXPECT_TRUE(alignment.inserts.empty());
}

TEST(LcsChanges, SurplusInsertsRemain)
{
    auto old_seq = seq(R"([1, 2, 5])");
    auto new_seq = seq(R"([1, 3, 4, 5])");
    auto alignment = align(old_seq, new_seq);
    auto changes = pair_changes(alignment);

    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].old_index, 1U);
    EXPECT_EQ(changes[0].new_index, 1U);
    EXPECT_TRUE(alignment.deletes.empty());
    EXPECT_EQ(alignment.inserts, std::vector<std::size_t>{2});
}

}  // namespace linkdiff::lcs::test
