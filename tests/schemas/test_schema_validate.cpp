/**
 * @file test_schema_validate.cpp
 * @brief Wire formats and engine output against the shipped JSON Schemas
 */

#include "linkdiff/config.hpp"
#include "linkdiff/diff.hpp"
#include "linkdiff/schema_validate.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace linkdiff::common::test {

namespace {

using Json = nlohmann::json;

std::string schema_path(std::string_view name)
{
    return std::string(LINKDIFF_SCHEMA_DIR) + "/" + std::string(name) + ".schema.json";
}

struct SchemaCase
{
    std::string_view schema_name;
    Json valid_json;
    Json invalid_json;
};

std::vector<SchemaCase> make_schema_cases()
{
    return {
        {.schema_name = kStructuralDeltaSchema,
         .valid_json = Json::parse(R"({
             "name": ["John", "Jane"],
             "gone": [1, 0, 0],
             "bio": [[{"op": "insert", "at": 3, "text": "!"}], 0, 2],
             "items": {"_t": "a", "_1": ["", 0, 3], "2": [4], "_4": [9, 0, 0]}
         })"),
         .invalid_json = Json::parse(R"({"items": {"_t": "a", "zzz": 1}})")},
        {.schema_name = kOperationalDiffSchema,
         .valid_json = Json::parse(R"({
             "operations": [
                 {"type": "set", "path": ["name"], "value": "Jane", "timestamp": 1, "actor_id": "a"},
                 {"type": "move", "path": ["items", 0], "from": 2, "timestamp": 2, "actor_id": "a"}
             ],
             "metadata": {"actors": ["a"], "timestamp_range": [1, 2], "conflict_resolution": "last_write_wins"}
         })"),
         .invalid_json = Json::parse(R"({
             "operations": [{"type": "rename", "path": ["name"], "timestamp": 1}],
             "metadata": {}
         })")},
        {.schema_name = kSemanticDiffSchema,
         .valid_json = Json::parse(R"({
             "added_triples": [
                 {"subject": "http://example.org/a", "predicate": "http://schema.org/name", "object": {"value": "A"}},
                 {"subject": "_:c14n0", "predicate": "http://schema.org/knows", "object": "http://example.org/a"}
             ],
             "removed_triples": [],
             "context_changes": {"added_mappings": {"ex": "http://ex.org/"}, "base_changes": [null, "http://base/"]},
             "metadata": {"semantic_equivalence": false}
         })"),
         .invalid_json = Json::parse(R"({"added_triples": []})")},
        {.schema_name = kConfigSchema,
         .valid_json = Json::parse(R"({"cache_capacity": 16, "log_level": "debug", "canon_provider": null})"),
         .invalid_json = Json::parse(R"({"cache_capacity": 0})")},
    };
}

}  // namespace

TEST(SchemaValidateTest, ValidSchemaSamplesPass)
{
    for (const auto& schema_case : make_schema_cases()) {
        SCOPED_TRACE(std::string(schema_case.schema_name));
        auto result = validate_json(schema_case.valid_json, schema_path(schema_case.schema_name));
        EXPECT_TRUE(result) << (result ? std::string() : result.error().message);
    }
}

TEST(SchemaValidateTest, InvalidSchemaSamplesFail)
{
    for (const auto& schema_case : make_schema_cases()) {
        SCOPED_TRACE(std::string(schema_case.schema_name));
        auto result = validate_json_named(schema_case.invalid_json, LINKDIFF_SCHEMA_DIR, schema_case.schema_name);
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().code, "SchemaValidationFailed");
        EXPECT_FALSE(result.error().message.empty());
    }
}

TEST(SchemaValidateTest, MissingSchemaFile)
{
    auto result = validate_json(Json::object(), schema_path("nonexistent.v1"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

TEST(SchemaValidateTest, EngineOutputConforms)
{
    const Json old_doc = Json::parse(R"({
        "@context": {"@vocab": "http://schema.org/"},
        "@id": "http://example.org/a",
        "name": "A short name",
        "tags": ["x", "y", "z"]
    })");
    const Json new_doc = Json::parse(R"({
        "@context": {"@vocab": "http://schema.org/", "ex": "http://ex.org/"},
        "@id": "http://example.org/a",
        "name": "A longer name",
        "tags": ["z", "x", "w"]
    })");

    const std::vector<std::pair<std::string, std::string_view>> strategies{
        {"structural", kStructuralDeltaSchema},
        {"operational", kOperationalDiffSchema},
        {"semantic", kSemanticDiffSchema},
    };
    for (const auto& [strategy, schema_name] : strategies) {
        SCOPED_TRACE(strategy);
        DiffOptions options;
        options.strategy = strategy;
        auto delta = linkdiff::diff(old_doc, new_doc, options);
        ASSERT_TRUE(delta) << delta.error().message;
        auto result = validate_json_named(*delta, LINKDIFF_SCHEMA_DIR, schema_name);
        EXPECT_TRUE(result) << (result ? std::string() : result.error().message);
    }

    auto config = validate_json_named(config::config_to_json(config::Config{}), LINKDIFF_SCHEMA_DIR, kConfigSchema);
    EXPECT_TRUE(config) << (config ? std::string() : config.error().message);
}

}  // namespace linkdiff::common::test
