/**
 * @file test_canonical_json.cpp
 * @brief Canonical JSON determinism tests
 */

#include "linkdiff/canonical_json.hpp"

#include <cmath>
#include <limits>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace linkdiff::canonical::test {

namespace {

using Json = nlohmann::json;

std::string canonical_text(const Json& j)
{
    auto canonical = canonicalize(j);
    return canonical ? *canonical : std::string("<error: ") + canonical.error().message + ">";
}

}  // namespace

TEST(CanonicalJSON, KeywordsSortBeforeTerms)
{
    Json doc = Json::parse(R"({
        "name": "Alice",
        "@type": "Person",
        "@id": "http://example.org/alice",
        "@context": {"@vocab": "http://schema.org/"}
    })");
    EXPECT_EQ(canonical_text(doc),
              R"({"@context":{"@vocab":"http://schema.org/"},"@id":"http://example.org/alice",)"
              R"("@type":"Person","name":"Alice"})");
}

TEST(CanonicalJSON, KeysCompareAsBytes)
{
    Json doc = Json::parse(R"({"b": 1, "B": 2, "é": 3, "a": 4})");
    EXPECT_EQ(canonical_text(doc), "{\"B\":2,\"a\":4,\"b\":1,\"\xC3\xA9\":3}");
}

TEST(CanonicalJSON, NestedObjectsInsideArrays)
{
    Json doc = Json::parse(R"({"items": [{"z": 1, "a": [3, 1]}, {"y": {"d": 0, "c": null}}]})");
    EXPECT_EQ(canonical_text(doc), R"({"items":[{"a":[3,1],"z":1},{"y":{"c":null,"d":0}}]})");
}

TEST(CanonicalJSON, WhitespaceIsDropped)
{
    const std::string text = canonical_text(Json::parse("{ \"a\" : [ 1 , 2 ] ,\n \"b\" : \"x y\" }"));
    EXPECT_EQ(text, R"({"a":[1,2],"b":"x y"})");
}

TEST(CanonicalJSON, IntegralFloatsBecomeIntegers)
{
    EXPECT_EQ(canonical_text(Json{{"age", 30.0}}), R"({"age":30})");
    EXPECT_EQ(canonical_text(Json{{"age", -2.0}}), R"({"age":-2})");
    EXPECT_EQ(canonical_text(Json{{"ratio", 1.5}}), R"({"ratio":1.5})");
    EXPECT_EQ(canonical_text(Json{{"count", -123}}), R"({"count":-123})");
}

TEST(CanonicalJSON, IntegerAndFloatSpellingsAgree)
{
    auto a = hash_canonical(Json::parse(R"({"age": 30})"));
    auto b = hash_canonical(Json::parse(R"({"age": 30.0})"));
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(*a, *b);
}

TEST(CanonicalJSON, NonFiniteNumbersRejected)
{
    Json nested = {
        {"values", Json::array({1.0, std::numeric_limits<double>::infinity()})}
    };
    auto canonical = canonicalize(nested);
    ASSERT_FALSE(canonical);
    EXPECT_EQ(canonical.error().code, "CanonicalizationFailed");

    EXPECT_FALSE(canonicalize(Json::array({std::nan("")})));
    EXPECT_FALSE(validate_for_canonical(nested));
    EXPECT_TRUE(validate_for_canonical(Json{{"ok", 3.25}}));
}

TEST(CanonicalJSON, InvalidUtf8Rejected)
{
    Json doc = {
        {"name", std::string("\xff\xfe")}
    };
    auto canonical = canonicalize(doc);
    ASSERT_FALSE(canonical);
    EXPECT_EQ(canonical.error().code, "CanonicalizationFailed");
}

TEST(CanonicalJSON, HashIsPrefixedSha256)
{
    auto hash = hash_canonical(Json::parse(R"({"b": 2, "a": 1})"));
    ASSERT_TRUE(hash);
    EXPECT_EQ(*hash, "sha256:" + common::sha256(R"({"a":1,"b":2})"));
    EXPECT_EQ(hash->size(), 7U + 64U);
}

TEST(CanonicalJSON, ReorderedDocumentsHashEqual)
{
    auto first = hash_canonical(Json::parse(R"({"@id": "x", "tags": ["a", "b"], "meta": {"k": 1, "j": 2}})"));
    auto second = hash_canonical(Json::parse(R"({"meta": {"j": 2, "k": 1}, "tags": ["a", "b"], "@id": "x"})"));
    auto reordered_array = hash_canonical(Json::parse(R"({"@id": "x", "tags": ["b", "a"], "meta": {"k": 1, "j": 2}})"));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    ASSERT_TRUE(reordered_array);
    EXPECT_EQ(*first, *second);
    EXPECT_NE(*first, *reordered_array);
}

TEST(CanonicalJSON, RepeatedCallsAreIdentical)
{
    Json doc = Json::parse(R"({"nested": {"b": [3, 1, 2], "a": "☃"}, "id": "test-123"})");
    const std::string first = canonical_text(doc);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(canonical_text(doc), first);
    }
}

}  // namespace linkdiff::canonical::test
