/**
 * @file test_structural.cpp
 * @brief Structural diff, patch, merge and inverse tests
 */

#include "linkdiff/structural.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace linkdiff::structural::test {

namespace {

using Json = nlohmann::json;

Delta diff_ok(const Json& old_doc, const Json& new_doc, const Options& options = {})
{
    auto delta = diff(old_doc, new_doc, options);
    EXPECT_TRUE(delta) << (delta ? "" : delta.error().message);
    return delta ? std::move(*delta) : Delta{.node = ObjectDelta{}};
}

void expect_round_trip(const Json& old_doc, const Json& new_doc, const Options& options = {})
{
    auto delta = diff_ok(old_doc, new_doc, options);

    auto forward = patch(old_doc, delta);
    ASSERT_TRUE(forward) << forward.error().message;
    EXPECT_EQ(*forward, new_doc);

    auto back = inverse(delta);
    ASSERT_TRUE(back) << back.error().message;
    auto restored = patch(new_doc, *back);
    ASSERT_TRUE(restored) << restored.error().message;
    EXPECT_EQ(*restored, old_doc);
}

const std::string kLongText =
    "The quick brown fox jumps over the lazy dog and keeps running until the end of the field.";
const std::string kLongTextEdited =
    "The quick brown fox jumps over the sleepy dog and keeps running until the end of the field.";

}  // namespace

TEST(StructuralDiff, EqualDocumentsGiveEmptyDelta)
{
    Json doc = Json::parse(R"({"a": [1, 2, {"b": null}], "c": "text"})");
    auto delta = diff_ok(doc, doc);
    EXPECT_TRUE(is_empty(delta));
    EXPECT_EQ(to_json(delta), Json::object());

    auto patched = patch(doc, delta);
    ASSERT_TRUE(patched);
    EXPECT_EQ(*patched, doc);
}

TEST(StructuralDiff, ObjectChangeAndAddition)
{
    Json old_doc = Json::parse(R"({"name": "John", "age": 30})");
    Json new_doc = Json::parse(R"({"name": "Jane", "age": 30, "city": "NYC"})");

    auto delta = diff_ok(old_doc, new_doc);
    EXPECT_EQ(to_json(delta), Json::parse(R"({"name": ["John", "Jane"], "city": ["NYC"]})"));

    auto patched = patch(old_doc, delta);
    ASSERT_TRUE(patched);
    EXPECT_EQ(*patched, new_doc);
}

TEST(StructuralDiff, KeyRemoval)
{
    Json old_doc = Json::parse(R"({"keep": 1, "drop": {"x": 1}})");
    Json new_doc = Json::parse(R"({"keep": 1})");
    auto delta = diff_ok(old_doc, new_doc);
    EXPECT_EQ(to_json(delta), Json::parse(R"({"drop": [{"x": 1}, 0, 0]})"));
    expect_round_trip(old_doc, new_doc);
}

TEST(StructuralDiff, ArrayMoveDetected)
{
    Json old_doc = Json::parse(R"({"items": ["a", "b", "c"]})");
    Json new_doc = Json::parse(R"({"items": ["b", "a", "c"]})");

    auto delta = diff_ok(old_doc, new_doc);
    EXPECT_EQ(to_json(delta), Json::parse(R"({"items": {"_t": "a", "_1": ["", 0, 3]}})"));

    const auto& items = std::get<ObjectDelta>(delta.node).entries.at(0);
    const auto& array = std::get<ArrayDelta>(items.delta.node);
    ASSERT_EQ(array.changed.size(), 1U);
    EXPECT_EQ(array.changed[0].index, 0U);
    EXPECT_EQ(std::get<Moved>(array.changed[0].delta.node).from_index, 1U);

    auto patched = patch(old_doc, delta);
    ASSERT_TRUE(patched);
    EXPECT_EQ(*patched, new_doc);
}

TEST(StructuralDiff, ArrayWithoutMovesUsesRemoveAndAdd)
{
    Json old_doc = Json::parse(R"(["a", "b", "c"])");
    Json new_doc = Json::parse(R"(["b", "a", "c"])");
    Options options;
    options.include_moves = false;

    auto delta = diff_ok(old_doc, new_doc, options);
    EXPECT_EQ(to_json(delta), Json::parse(R"({"_t": "a", "_1": ["b", 0, 0], "0": ["b"]})"));
    expect_round_trip(old_doc, new_doc, options);
}

TEST(StructuralDiff, SimpleArrayModeComparesPositions)
{
    Json old_doc = Json::parse(R"({"x": [1, 2, 3]})");
    Json new_doc = Json::parse(R"({"x": [1, 5, 3]})");
    Options options;
    options.array_diff = ArrayDiffMode::kSimple;

    auto delta = diff_ok(old_doc, new_doc, options);
    EXPECT_EQ(to_json(delta), Json::parse(R"({"x": {"_t": "a", "1": [2, 5]}})"));
    expect_round_trip(old_doc, new_doc, options);
}

TEST(StructuralDiff, MixedArrayEditsRoundTrip)
{
    expect_round_trip(Json::parse("[1, 2, 3, 4, 5]"), Json::parse("[5, 1, 2, 4, 6]"));
    expect_round_trip(Json::parse("[1, 2, 3]"), Json::parse("[0, 1, 9, 3]"));
    expect_round_trip(Json::parse(R"([{"id": 1, "v": "a"}, {"id": 2}])"),
                      Json::parse(R"([{"id": 1, "v": "b"}, {"id": 2}, {"id": 3}])"));
    expect_round_trip(Json::parse("[]"), Json::parse(R"(["x", "y"])"));
    expect_round_trip(Json::parse(R"(["x", "y"])"), Json::parse("[]"));
}

TEST(StructuralDiff, NestedChangesRoundTrip)
{
    Json old_doc = Json::parse(R"({
        "user": {"name": "Ann", "tags": ["a", "b"], "address": {"city": "Oslo"}},
        "version": 1
    })");
    Json new_doc = Json::parse(R"({
        "user": {"name": "Ann", "tags": ["b", "c"], "address": {"city": "Bergen", "zip": "5003"}},
        "version": 2
    })");
    expect_round_trip(old_doc, new_doc);
}

TEST(StructuralDiff, TypeChangeIsReplacement)
{
    auto delta = diff_ok(Json::parse(R"({"a": 1})"), Json::parse(R"({"a": [1]})"));
    EXPECT_EQ(to_json(delta), Json::parse(R"({"a": [1, [1]]})"));

    auto root = diff_ok(Json(1), Json("one"));
    EXPECT_EQ(to_json(root), Json::parse(R"([1, "one"])"));
}

TEST(StructuralDiff, LongSimilarStringsBecomeTextPatch)
{
    Json old_doc = {{"body", kLongText}};
    Json new_doc = {{"body", kLongTextEdited}};

    auto delta = diff_ok(old_doc, new_doc);
    const auto& entry = std::get<ObjectDelta>(delta.node).entries.at(0);
    ASSERT_TRUE(std::holds_alternative<TextPatch>(entry.delta.node));

    Json wire = to_json(delta);
    ASSERT_TRUE(wire["body"].is_array());
    EXPECT_EQ(wire["body"][1], 0);
    EXPECT_EQ(wire["body"][2], 2);

    expect_round_trip(old_doc, new_doc);
}

TEST(StructuralDiff, ShortStringsAreReplaced)
{
    auto delta = diff_ok(Json("hello"), Json("hallo"));
    EXPECT_TRUE(std::holds_alternative<Changed>(delta.node));
}

TEST(StructuralDiff, TextDiffDisabled)
{
    Options options;
    options.text_diff = false;
    auto delta = diff_ok(Json(kLongText), Json(kLongTextEdited), options);
    EXPECT_TRUE(std::holds_alternative<Changed>(delta.node));
}

TEST(StructuralPatch, MissingKeyFails)
{
    auto delta = delta_from_json(Json::parse(R"({"gone": [1, 0, 0]})"));
    ASSERT_TRUE(delta);
    auto patched = patch(Json::parse(R"({"other": 1})"), *delta);
    ASSERT_FALSE(patched);
    EXPECT_EQ(patched.error().code, "PatchFailed");
    EXPECT_FALSE(validate_patch(Json::parse(R"({"other": 1})"), *delta));
    EXPECT_TRUE(validate_patch(Json::parse(R"({"gone": 1})"), *delta));
}

TEST(StructuralPatch, ArrayIndexOutOfRangeFails)
{
    auto delta = delta_from_json(Json::parse(R"({"_t": "a", "_5": ["x", 0, 0]})"));
    ASSERT_TRUE(delta);
    auto patched = patch(Json::parse(R"(["x"])"), *delta);
    ASSERT_FALSE(patched);
    EXPECT_EQ(patched.error().code, "PatchFailed");
}

TEST(StructuralPatch, ContainerMismatchFails)
{
    auto delta = delta_from_json(Json::parse(R"({"a": ["x"]})"));
    ASSERT_TRUE(delta);
    EXPECT_FALSE(patch(Json::parse("[1, 2]"), *delta));
}

TEST(StructuralPatch, InputIsNotMutated)
{
    const Json old_doc = Json::parse(R"({"a": 1})");
    const Json copy = old_doc;
    auto delta = diff_ok(old_doc, Json::parse(R"({"a": 2})"));
    auto patched = patch(old_doc, delta);
    ASSERT_TRUE(patched);
    EXPECT_EQ(old_doc, copy);
}

TEST(StructuralMerge, LaterDeltaWinsPerKey)
{
    Json base = Json::parse(R"({"a": 1})");
    std::vector<Delta> deltas{diff_ok(base, Json::parse(R"({"a": 2})")),
                              diff_ok(Json::parse(R"({"a": 2})"), Json::parse(R"({"a": 2, "b": 3})")),
                              diff_ok(base, Json::parse(R"({"a": 5})"))};
    auto merged = merge_diffs(deltas);
    ASSERT_TRUE(merged);
    EXPECT_EQ(to_json(*merged), Json::parse(R"({"a": [1, 5], "b": [3]})"));

    auto patched = patch(base, *merged);
    ASSERT_TRUE(patched);
    EXPECT_EQ(*patched, Json::parse(R"({"a": 5, "b": 3})"));
}

TEST(StructuralMerge, NestedObjectsMergeRecursively)
{
    Json base = Json::parse(R"({"o": {"x": 1, "y": 1}})");
    std::vector<Delta> deltas{diff_ok(base, Json::parse(R"({"o": {"x": 2, "y": 1}})")),
                              diff_ok(base, Json::parse(R"({"o": {"x": 1, "y": 2}})"))};
    auto merged = merge_diffs(deltas);
    ASSERT_TRUE(merged);
    auto patched = patch(base, *merged);
    ASSERT_TRUE(patched);
    EXPECT_EQ(*patched, Json::parse(R"({"o": {"x": 2, "y": 2}})"));
}

TEST(StructuralMerge, EmptyInputGivesEmptyDelta)
{
    auto merged = merge_diffs(std::span<const Delta>{});
    ASSERT_TRUE(merged);
    EXPECT_TRUE(is_empty(*merged));
}

TEST(StructuralInverse, InverseOfInverseIsOriginal)
{
    Json old_doc = Json::parse(R"({"a": 1, "list": [1, 2, 3], "gone": true})");
    Json new_doc = Json::parse(R"({"a": 2, "list": [3, 1, 2], "new": false})");
    auto delta = diff_ok(old_doc, new_doc);
    auto once = inverse(delta);
    ASSERT_TRUE(once);
    auto twice = inverse(*once);
    ASSERT_TRUE(twice);
    EXPECT_EQ(to_json(*twice), to_json(delta));
}

}  // namespace linkdiff::structural::test
