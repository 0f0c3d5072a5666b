/**
 * @file test_operational.cpp
 * @brief Operational diff, replay, merge, inverse and wire format tests
 */

#include "linkdiff/operational.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace linkdiff::operational::test {

namespace {

using Json = nlohmann::json;

Options fixed_options(const std::string& actor = "actor-a", std::uint64_t timestamp = 100)
{
    Options options;
    options.actor_id = actor;
    options.timestamp = timestamp;
    return options;
}

OperationalDiff diff_ok(const Json& old_doc, const Json& new_doc, const Options& options = fixed_options())
{
    auto result = diff(old_doc, new_doc, options);
    EXPECT_TRUE(result) << (result ? "" : result.error().message);
    return result ? std::move(*result) : OperationalDiff{};
}

void expect_replay(const Json& old_doc, const Json& new_doc)
{
    auto ops = diff_ok(old_doc, new_doc);
    auto patched = patch(old_doc, ops);
    ASSERT_TRUE(patched) << patched.error().message;
    EXPECT_EQ(*patched, new_doc) << to_json(ops).dump(2);
}

Operation set_op(const char* pointer, Json value, std::uint64_t timestamp, const std::string& actor)
{
    auto path = common::parse_pointer(pointer);
    EXPECT_TRUE(path);
    return Operation{.type = OpType::kSet,
                     .path = path ? *path : Path{},
                     .value = std::move(value),
                     .from = std::nullopt,
                     .timestamp = timestamp,
                     .actor_id = actor};
}

OperationalDiff single(Operation op)
{
    OperationalDiff result;
    result.metadata.actors = {op.actor_id};
    result.metadata.timestamp_range = TimestampRange{.min = op.timestamp, .max = op.timestamp};
    result.operations.push_back(std::move(op));
    return result;
}

}  // namespace

TEST(OperationalDiff, ObjectChangesBecomeSetAndDelete)
{
    Json old_doc = Json::parse(R"({"name": "John", "age": 30, "tmp": 1})");
    Json new_doc = Json::parse(R"({"name": "Jane", "age": 30, "city": "NYC"})");
    auto ops = diff_ok(old_doc, new_doc);

    ASSERT_EQ(ops.operations.size(), 3U);
    EXPECT_EQ(ops.operations[0].type, OpType::kSet);
    EXPECT_EQ(common::to_pointer(ops.operations[0].path), "/city");
    EXPECT_EQ(ops.operations[1].type, OpType::kSet);
    EXPECT_EQ(common::to_pointer(ops.operations[1].path), "/name");
    EXPECT_EQ(*ops.operations[1].value, "Jane");
    EXPECT_EQ(ops.operations[2].type, OpType::kDelete);
    EXPECT_EQ(common::to_pointer(ops.operations[2].path), "/tmp");

    EXPECT_EQ(ops.operations[0].timestamp, 100U);
    EXPECT_EQ(ops.operations[2].timestamp, 102U);
    EXPECT_EQ(ops.metadata.timestamp_range.min, 100U);
    EXPECT_EQ(ops.metadata.timestamp_range.max, 102U);
    EXPECT_EQ(ops.metadata.actors, std::vector<std::string>{"actor-a"});
    for (const auto& op : ops.operations) {
        EXPECT_EQ(op.actor_id, "actor-a");
    }

    auto patched = patch(old_doc, ops);
    ASSERT_TRUE(patched);
    EXPECT_EQ(*patched, new_doc);
}

TEST(OperationalDiff, EqualDocumentsEmitNothing)
{
    Json doc = Json::parse(R"({"a": [1, 2], "b": {"c": null}})");
    auto ops = diff_ok(doc, doc);
    EXPECT_TRUE(ops.operations.empty());
    EXPECT_EQ(ops.metadata.timestamp_range.min, 100U);
}

TEST(OperationalDiff, GeneratesActorAndTimestamp)
{
    auto result = diff(Json::parse(R"({"a": 1})"), Json::parse(R"({"a": 2})"));
    ASSERT_TRUE(result);
    ASSERT_EQ(result->metadata.actors.size(), 1U);
    EXPECT_EQ(result->metadata.actors[0].size(), 16U);
    EXPECT_GT(result->operations.at(0).timestamp, 0U);
}

TEST(OperationalDiff, ArraySwapIsOneMove)
{
    Json old_doc = Json::parse(R"({"items": ["a", "b", "c"]})");
    Json new_doc = Json::parse(R"({"items": ["b", "a", "c"]})");
    auto ops = diff_ok(old_doc, new_doc);

    ASSERT_EQ(ops.operations.size(), 1U);
    EXPECT_EQ(ops.operations[0].type, OpType::kMove);
    EXPECT_EQ(common::to_pointer(ops.operations[0].path), "/items/0");
    EXPECT_EQ(ops.operations[0].from, 1U);

    auto patched = patch(old_doc, ops);
    ASSERT_TRUE(patched);
    EXPECT_EQ(*patched, new_doc);
}

TEST(OperationalDiff, MoveTowardsTheEnd)
{
    auto ops = diff_ok(Json::parse(R"(["a", "b", "c"])"), Json::parse(R"(["b", "c", "a"])"));
    ASSERT_EQ(ops.operations.size(), 1U);
    EXPECT_EQ(ops.operations[0].type, OpType::kMove);
    EXPECT_EQ(ops.operations[0].from, 0U);
    EXPECT_EQ(common::to_pointer(ops.operations[0].path), "/3");
}

TEST(OperationalDiff, ReplayReproducesTarget)
{
    expect_replay(Json::parse("[1, 2, 3, 4, 5]"), Json::parse("[5, 1, 2, 4, 6]"));
    expect_replay(Json::parse("[1, 2, 3]"), Json::parse("[0, 1, 9, 3]"));
    expect_replay(Json::parse("[1, 2, 3, 4]"), Json::parse("[4, 1, 3, 5]"));
    expect_replay(Json::parse("[]"), Json::parse(R"([{"x": 1}, 2])"));
    expect_replay(Json::parse(R"([{"x": 1}, 2])"), Json::parse("[]"));
    expect_replay(Json::parse(R"({"a": {"b": [1, {"c": 2}]}})"),
                  Json::parse(R"({"a": {"b": [{"c": 3}, 1], "d": true}})"));
    expect_replay(Json::parse(R"({"a": 1})"), Json::parse("[1]"));
    expect_replay(Json(1), Json("one"));
}

TEST(OperationalPatch, SetAndDeleteReplayIsIdempotent)
{
    Json old_doc = Json::parse(R"({"a": 1, "gone": true, "b": {"c": 2, "old": "x"}})");
    Json new_doc = Json::parse(R"({"a": 5, "b": {"c": 3}})");
    auto ops = diff_ok(old_doc, new_doc);

    std::size_t deletes = 0;
    for (const auto& op : ops.operations) {
        ASSERT_TRUE(op.type == OpType::kSet || op.type == OpType::kDelete);
        deletes += op.type == OpType::kDelete ? 1U : 0U;
    }
    EXPECT_EQ(deletes, 2U);

    auto once = patch(old_doc, ops);
    ASSERT_TRUE(once);
    auto twice = patch(*once, ops);
    ASSERT_TRUE(twice);
    EXPECT_EQ(*twice, new_doc);
}

TEST(OperationalPatch, MissingParentFails)
{
    auto ops = single(set_op("/missing/child", 1, 1, "x"));
    auto patched = patch(Json::object(), ops);
    ASSERT_FALSE(patched);
    EXPECT_EQ(patched.error().code, "PatchFailed");
    EXPECT_FALSE(validate_patch(Json::object(), ops));
    EXPECT_TRUE(validate_patch(Json::parse(R"({"missing": {}})"), ops));
}

TEST(OperationalPatch, MoveOutOfRangeFails)
{
    Operation move{.type = OpType::kMove,
                   .path = Path{std::size_t{0}},
                   .value = std::nullopt,
                   .from = 7,
                   .timestamp = 1,
                   .actor_id = "x"};
    auto ops = single(std::move(move));
    EXPECT_FALSE(patch(Json::parse("[1, 2]"), ops));
    EXPECT_FALSE(validate_patch(Json::parse("[1, 2]"), ops));
}

TEST(OperationalMerge, LastWriteWinsByTimestamp)
{
    std::vector<OperationalDiff> diffs{single(set_op("/x", 1, 100, "a")), single(set_op("/x", 2, 50, "b"))};
    auto merged = merge_diffs(diffs);
    ASSERT_TRUE(merged);
    ASSERT_EQ(merged->operations.size(), 1U);
    EXPECT_EQ(*merged->operations[0].value, 1);
    EXPECT_EQ(merged->metadata.actors, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(merged->metadata.timestamp_range.min, 100U);
    EXPECT_EQ(merged->metadata.conflict_resolution, ConflictResolution::kLastWriteWins);

    auto patched = patch(Json::object(), *merged);
    ASSERT_TRUE(patched);
    EXPECT_EQ(*patched, Json::parse(R"({"x": 1})"));
}

TEST(OperationalMerge, LaterInputWinsTimestampTies)
{
    std::vector<OperationalDiff> diffs{single(set_op("/x", 1, 10, "a")), single(set_op("/x", 2, 10, "b"))};
    auto merged = merge_diffs(diffs);
    ASSERT_TRUE(merged);
    ASSERT_EQ(merged->operations.size(), 1U);
    EXPECT_EQ(*merged->operations[0].value, 2);
}

TEST(OperationalMerge, MergePolicyKeepsEveryOperation)
{
    std::vector<OperationalDiff> diffs{single(set_op("/x", 1, 30, "a")),
                                       single(set_op("/y", 2, 10, "b")),
                                       single(set_op("/x", 3, 20, "c"))};
    auto merged = merge_diffs(diffs, MergeOptions{.conflict_resolution = ConflictResolution::kMerge});
    ASSERT_TRUE(merged);
    ASSERT_EQ(merged->operations.size(), 3U);
    EXPECT_EQ(merged->operations[0].timestamp, 10U);
    EXPECT_EQ(merged->operations[1].timestamp, 20U);
    EXPECT_EQ(merged->operations[2].timestamp, 30U);
    EXPECT_EQ(merged->metadata.timestamp_range.min, 10U);
    EXPECT_EQ(merged->metadata.timestamp_range.max, 30U);
    EXPECT_EQ(merged->metadata.conflict_resolution, ConflictResolution::kMerge);
}

TEST(OperationalMerge, PolicyDefaultsToFirstDiff)
{
    auto first = single(set_op("/x", 1, 1, "a"));
    first.metadata.conflict_resolution = ConflictResolution::kMerge;
    std::vector<OperationalDiff> diffs{first, single(set_op("/x", 2, 2, "b"))};
    auto merged = merge_diffs(diffs);
    ASSERT_TRUE(merged);
    EXPECT_EQ(merged->metadata.conflict_resolution, ConflictResolution::kMerge);
    EXPECT_EQ(merged->operations.size(), 2U);
}

TEST(OperationalInverse, MovesAreUndoneExactly)
{
    for (const char* target : {R"(["b", "a", "c"])", R"(["b", "c", "a"])", R"(["c", "a", "b"])"}) {
        Json old_doc = Json::parse(R"(["a", "b", "c"])");
        Json new_doc = Json::parse(target);
        auto ops = diff_ok(old_doc, new_doc);
        auto back = inverse(ops);
        ASSERT_TRUE(back);
        auto restored = patch(new_doc, *back);
        ASSERT_TRUE(restored) << restored.error().message;
        EXPECT_EQ(*restored, old_doc) << target;
    }
}

TEST(OperationalInverse, DeleteBecomesNullSet)
{
    Json old_doc = Json::parse(R"({"keep": 1, "gone": "value"})");
    Json new_doc = Json::parse(R"({"keep": 1, "added": 2})");
    auto ops = diff_ok(old_doc, new_doc);
    auto back = inverse(ops);
    ASSERT_TRUE(back);

    EXPECT_EQ(back->metadata.conflict_resolution, ConflictResolution::kInverse);
    ASSERT_EQ(back->operations.size(), 2U);
    EXPECT_EQ(back->operations[0].type, OpType::kSet);
    EXPECT_EQ(common::to_pointer(back->operations[0].path), "/gone");
    EXPECT_TRUE(back->operations[0].value->is_null());
    EXPECT_EQ(back->operations[1].type, OpType::kDelete);
    EXPECT_EQ(common::to_pointer(back->operations[1].path), "/added");

    auto restored = patch(new_doc, *back);
    ASSERT_TRUE(restored);
    EXPECT_EQ(*restored, Json::parse(R"({"keep": 1, "gone": null})"));
}

TEST(OperationalJson, WireRoundTrip)
{
    Json old_doc = Json::parse(R"({"items": ["a", "b", "c"], "n": 1})");
    Json new_doc = Json::parse(R"({"items": ["b", "a", "c", "d"]})");
    auto ops = diff_ok(old_doc, new_doc);

    Json wire = to_json(ops);
    EXPECT_EQ(wire["metadata"]["conflict_resolution"], "last_write_wins");
    EXPECT_EQ(wire["metadata"]["actors"], Json::parse(R"(["actor-a"])"));

    auto decoded = diff_from_json(Json::parse(wire.dump()));
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(to_json(*decoded), wire);

    auto patched = patch(old_doc, *decoded);
    ASSERT_TRUE(patched);
    EXPECT_EQ(*patched, new_doc);
}

TEST(OperationalJson, RejectsMalformedOperations)
{
    for (const char* text : {
             R"({"operations": [{"type": "jump", "path": [], "timestamp": 1}], "metadata": {}})",
             R"({"operations": [{"type": "set", "path": ["a"], "timestamp": 1}], "metadata": {}})",
             R"({"operations": [{"type": "move", "path": [0], "timestamp": 1}], "metadata": {}})",
             R"({"operations": [{"type": "delete", "path": "a", "timestamp": 1}], "metadata": {}})",
             R"({"operations": [], "metadata": {"conflict_resolution": "random"}})",
             R"({"operations": []})"}) {
        auto decoded = diff_from_json(Json::parse(text));
        ASSERT_FALSE(decoded) << text;
        EXPECT_EQ(decoded.error().code, "InvalidDelta") << text;
    }
}

TEST(OperationalJson, LoadDiffValidatesAgainstSchema)
{
    auto dir = std::filesystem::temp_directory_path() / "linkdiff_operational_json";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);

    {
        std::ofstream out(dir / "good.json");
        out << to_json(diff_ok(Json::parse(R"({"a": 1})"), Json::parse(R"({"a": 2})"))).dump(2);
        std::ofstream bad(dir / "bad.json");
        bad << R"({"operations": [{"type": "set", "path": ["a"], "timestamp": -4, "value": 1}], "metadata": {}})";
    }

    auto good = load_diff((dir / "good.json").string(), LINKDIFF_SCHEMA_DIR);
    ASSERT_TRUE(good) << good.error().message;
    EXPECT_EQ(good->operations.size(), 1U);

    EXPECT_FALSE(load_diff((dir / "bad.json").string(), LINKDIFF_SCHEMA_DIR));
}

TEST(OperationalNames, ParseAndPrint)
{
    EXPECT_EQ(parse_op_type("move"), OpType::kMove);
    EXPECT_FALSE(parse_op_type("swap"));
    EXPECT_EQ(conflict_resolution_name(ConflictResolution::kLastWriteWins), "last_write_wins");
    EXPECT_EQ(parse_conflict_resolution("inverse"), ConflictResolution::kInverse);
    EXPECT_FALSE(parse_conflict_resolution("LWW"));
}

}  // namespace linkdiff::operational::test
