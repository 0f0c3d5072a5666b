/**
 * @file test_path.cpp
 * @brief Document path and JSON Pointer tests
 */

#include "linkdiff/document.hpp"

#include <utility>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace linkdiff;
using namespace linkdiff::common;
using Json = nlohmann::json;

TEST(JsonPointer, RootIsEmpty)
{
    EXPECT_EQ(to_pointer({}), "");
    auto path = parse_pointer("");
    ASSERT_TRUE(path);
    EXPECT_TRUE(path->empty());
}

TEST(JsonPointer, KeysAndIndices)
{
    Path path{std::string("items"), std::size_t{2}, std::string("name")};
    EXPECT_EQ(to_pointer(path), "/items/2/name");

    auto parsed = parse_pointer("/items/2/name");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(*parsed, path);
}

TEST(JsonPointer, Escaping)
{
    Path path{std::string("a/b"), std::string("m~n")};
    EXPECT_EQ(to_pointer(path), "/a~1b/m~0n");

    auto parsed = parse_pointer("/a~1b/m~0n");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(*parsed, path);
}

TEST(JsonPointer, LeadingZeroIsKey)
{
    auto parsed = parse_pointer("/01");
    ASSERT_TRUE(parsed);
    ASSERT_EQ(parsed->size(), 1U);
    EXPECT_EQ(std::get<std::string>(parsed->front()), "01");
}

TEST(JsonPointer, Malformed)
{
    EXPECT_FALSE(parse_pointer("no-slash"));
    EXPECT_FALSE(parse_pointer("/bad~2escape"));
}

TEST(PathJson, RoundTrip)
{
    Path path{std::string("a"), std::size_t{0}};
    Json j = path_to_json(path);
    EXPECT_EQ(j, Json::parse(R"(["a", 0])"));

    auto decoded = path_from_json(j);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, path);
}

TEST(PathJson, RejectsBadTokens)
{
    EXPECT_FALSE(path_from_json(Json::parse(R"({"a": 1})")));
    EXPECT_FALSE(path_from_json(Json::parse(R"([-1])")));
    EXPECT_FALSE(path_from_json(Json::parse(R"([true])")));
}

TEST(FindAt, ResolvesNestedValues)
{
    Json doc = Json::parse(R"({"items": [{"name": "x"}, {"name": "y"}]})");
    const Json* found = find_at(std::as_const(doc), Path{std::string("items"), std::size_t{1}, std::string("name")});
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(*found, "y");

    EXPECT_EQ(find_at(std::as_const(doc), Path{std::string("items"), std::size_t{5}}), nullptr);
    EXPECT_EQ(find_at(std::as_const(doc), Path{std::string("missing")}), nullptr);
    EXPECT_EQ(find_at(std::as_const(doc), Path{std::size_t{0}}), nullptr);
}

TEST(DocumentKinds, Names)
{
    EXPECT_EQ(kind_name(Json::object()), "object");
    EXPECT_EQ(kind_name(Json::array()), "array");
    EXPECT_EQ(kind_name(Json(1)), "integer");
    EXPECT_EQ(kind_name(Json(1.5)), "float");
    EXPECT_EQ(kind_name(Json(nullptr)), "null");
    EXPECT_TRUE(same_container_kind(Json::object(), Json::object()));
    EXPECT_FALSE(same_container_kind(Json::object(), Json::array()));
    EXPECT_FALSE(same_container_kind(Json(1), Json(1)));
}
