/**
 * @file test_diff.cpp
 * @brief Strategy facade and process-wide configuration tests
 */

#include "linkdiff/diff.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace linkdiff::test {

namespace {

using Json = nlohmann::json;

const Json kOld = Json::parse(R"({"name": "John", "age": 30, "tags": ["a", "b", "c"]})");
const Json kNew = Json::parse(R"({"name": "Jane", "age": 30, "tags": ["b", "a", "c", "d"], "city": "Oslo"})");

DiffOptions with_strategy(const std::string& strategy)
{
    DiffOptions options;
    options.strategy = strategy;
    options.operational.actor_id = "actor-a";
    options.operational.timestamp = 100;
    return options;
}

Json name_change(const std::string& name,
                 const std::string& actor,
                 std::uint64_t timestamp,
                 operational::ConflictResolution policy = operational::ConflictResolution::kLastWriteWins)
{
    DiffOptions options = with_strategy("operational");
    options.operational.actor_id = actor;
    options.operational.timestamp = timestamp;
    options.operational.conflict_resolution = policy;
    auto delta = diff(Json{{"name", "n"}}, Json{{"name", name}}, options);
    return delta ? *delta : Json();
}

}  // namespace

TEST(Strategy, ParseAndName)
{
    for (Strategy strategy : {Strategy::kStructural, Strategy::kOperational, Strategy::kSemantic}) {
        auto parsed = parse_strategy(strategy_name(strategy));
        ASSERT_TRUE(parsed);
        EXPECT_EQ(*parsed, strategy);
    }
    auto unknown = parse_strategy("textual");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, "InvalidStrategy");
}

TEST(Facade, UnknownStrategyIsRejected)
{
    DiffOptions options = with_strategy("fuzzy");
    auto delta = diff(kOld, kNew, options);
    ASSERT_FALSE(delta);
    EXPECT_EQ(delta.error().code, "InvalidStrategy");

    auto patched = patch(kOld, Json::object(), options);
    ASSERT_FALSE(patched);
    EXPECT_EQ(patched.error().code, "InvalidStrategy");

    EXPECT_FALSE(validate_patch(kOld, Json::object(), options));

    MergeOptions merge_options;
    merge_options.strategy = "fuzzy";
    EXPECT_FALSE(merge_diffs({}, merge_options));
}

TEST(Facade, EveryStrategyRoundTrips)
{
    for (const char* strategy : {"structural", "operational"}) {
        SCOPED_TRACE(strategy);
        const DiffOptions options = with_strategy(strategy);
        auto delta = diff(kOld, kNew, options);
        ASSERT_TRUE(delta) << delta.error().message;
        EXPECT_TRUE(validate_patch(kOld, *delta, options));

        auto patched = patch(kOld, *delta, options);
        ASSERT_TRUE(patched) << patched.error().message;
        EXPECT_EQ(*patched, kNew);
    }
}

TEST(Facade, StructuralIsTheDefault)
{
    auto delta = diff(kOld, kNew);
    ASSERT_TRUE(delta);
    EXPECT_EQ((*delta)["name"], Json::parse(R"(["John", "Jane"])"));
    EXPECT_EQ((*delta)["city"], Json::parse(R"(["Oslo"])"));
    EXPECT_FALSE(delta->contains("age"));
}

TEST(Facade, SemanticRoundTrip)
{
    const Json before = Json::parse(R"({"@context": {"@vocab": "http://schema.org/"}, "@id": "http://example.org/a", "name": "A"})");
    const Json after = Json::parse(R"({"@context": {"@vocab": "http://schema.org/"}, "@id": "http://example.org/a", "name": "B"})");
    const DiffOptions options = with_strategy("semantic");

    auto delta = diff(before, after, options);
    ASSERT_TRUE(delta) << delta.error().message;
    EXPECT_EQ((*delta)["added_triples"].size(), 1U);
    EXPECT_EQ((*delta)["metadata"]["semantic_equivalence"], false);

    auto patched = patch(before, *delta, options);
    ASSERT_TRUE(patched) << patched.error().message;
    EXPECT_EQ(*patched, after);
    EXPECT_FALSE(validate_patch(after, *delta, options));
}

TEST(Facade, MismatchedDeltaShapeIsInvalid)
{
    auto structural_delta = diff(kOld, kNew);
    ASSERT_TRUE(structural_delta);

    auto patched = patch(kOld, *structural_delta, with_strategy("operational"));
    ASSERT_FALSE(patched);
    EXPECT_EQ(patched.error().code, "InvalidDelta");
    EXPECT_FALSE(validate_patch(kOld, *structural_delta, with_strategy("semantic")));

    auto inverted = inverse(*structural_delta, with_strategy("semantic"));
    ASSERT_FALSE(inverted);
    EXPECT_EQ(inverted.error().code, "InvalidDelta");
}

TEST(Facade, InverseUndoesStructuralAndOperationalDeltas)
{
    auto delta = diff(kOld, kNew);
    ASSERT_TRUE(delta);
    auto undo = inverse(*delta);
    ASSERT_TRUE(undo) << undo.error().message;
    auto restored = patch(kNew, *undo);
    ASSERT_TRUE(restored) << restored.error().message;
    EXPECT_EQ(*restored, kOld);

    const DiffOptions options = with_strategy("operational");
    auto ops = diff(Json::parse(R"({"list": [1, 2, 3]})"), Json::parse(R"({"list": [3, 1, 2]})"), options);
    ASSERT_TRUE(ops);
    auto ops_undo = inverse(*ops, options);
    ASSERT_TRUE(ops_undo) << ops_undo.error().message;
    EXPECT_EQ((*ops_undo)["metadata"]["conflict_resolution"], "inverse");
    auto ops_restored = patch(Json::parse(R"({"list": [3, 1, 2]})"), *ops_undo, options);
    ASSERT_TRUE(ops_restored) << ops_restored.error().message;
    EXPECT_EQ(*ops_restored, Json::parse(R"({"list": [1, 2, 3]})"));
}

TEST(Facade, StructuralAndSemanticMerge)
{
    const std::vector<Json> structural{Json::parse(R"({"a": [1, 2]})"), Json::parse(R"({"a": [1, 3], "b": [4]})")};
    MergeOptions options;
    options.strategy = "structural";
    auto merged = merge_diffs(structural, options);
    ASSERT_TRUE(merged) << merged.error().message;
    EXPECT_EQ(*merged, Json::parse(R"({"a": [1, 3], "b": [4]})"));

    const std::vector<Json> semantic{
        Json::parse(R"({"added_triples": [{"subject": "http://x/a", "predicate": "http://x/p", "object": "http://x/b"}],
                        "removed_triples": []})"),
        Json::parse(R"({"added_triples": [],
                        "removed_triples": [{"subject": "http://x/c", "predicate": "http://x/p", "object": "http://x/d"}]})"),
    };
    options.strategy = "semantic";
    merged = merge_diffs(semantic, options);
    ASSERT_TRUE(merged) << merged.error().message;
    EXPECT_EQ((*merged)["added_triples"].size(), 1U);
    EXPECT_EQ((*merged)["removed_triples"].size(), 1U);

    const std::vector<Json> broken{Json::parse(R"({"operations": "none", "metadata": {}})")};
    options.strategy = "operational";
    auto failed = merge_diffs(broken, options);
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, "InvalidDelta");
}

TEST(Facade, ApplyConfigRejectsUnknownPolicy)
{
    config::Config config;
    config.default_conflict_resolution = "coin_flip";
    auto applied = apply_config(config);
    ASSERT_FALSE(applied);
    EXPECT_EQ(applied.error().code, "ConfigError");
}

// The only test in this binary that installs a configuration.
TEST(Facade, MergePolicyPrecedence)
{
    const std::vector<Json> merge_policy{
        name_change("x", "a", 1, operational::ConflictResolution::kMerge),
        name_change("y", "b", 2),
    };
    MergeOptions options;

    // first diff's policy when nothing else is set
    auto merged = merge_diffs(merge_policy, options);
    ASSERT_TRUE(merged) << merged.error().message;
    EXPECT_EQ((*merged)["operations"].size(), 2U);

    options.conflict_resolution = operational::ConflictResolution::kLastWriteWins;
    merged = merge_diffs(merge_policy, options);
    ASSERT_TRUE(merged);
    ASSERT_EQ((*merged)["operations"].size(), 1U);
    EXPECT_EQ((*merged)["operations"][0]["value"], "y");

    // configured policy beats the diffs' own policy
    config::Config config;
    config.default_conflict_resolution = "merge";
    ASSERT_TRUE(apply_config(config));
    EXPECT_EQ(default_conflict_resolution(), operational::ConflictResolution::kMerge);

    const std::vector<Json> lww_policy{name_change("x", "a", 1), name_change("y", "b", 2)};
    merged = merge_diffs(lww_policy, MergeOptions{});
    ASSERT_TRUE(merged);
    EXPECT_EQ((*merged)["operations"].size(), 2U);

    // explicit option beats configuration
    options.conflict_resolution = operational::ConflictResolution::kLastWriteWins;
    merged = merge_diffs(lww_policy, options);
    ASSERT_TRUE(merged);
    EXPECT_EQ((*merged)["operations"].size(), 1U);

    ASSERT_TRUE(apply_config(config::Config{}));
    EXPECT_EQ(default_conflict_resolution(), operational::ConflictResolution::kLastWriteWins);
}

}  // namespace linkdiff::test
