/**
 * @file test_sha256.cpp
 * @brief SHA-256 determinism tests
 */

#include "linkdiff/common.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace linkdiff::common;

TEST(SHA256, EmptyString)
{
    EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256, HelloWorld)
{
    EXPECT_EQ(sha256("Hello, World!"), "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
}

TEST(SHA256, MultiBlockInput)
{
    // 56 bytes forces the length into a second block
    EXPECT_EQ(sha256("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256, IncrementalMatchesOneShot)
{
    Sha256 hasher;
    hasher.update(std::string_view("Hello, "));
    hasher.update(std::string_view("World!"));
    EXPECT_EQ(hasher.hex_digest(), sha256("Hello, World!"));
}

TEST(SHA256, Prefixed)
{
    std::string hash = sha256_prefixed("test");
    EXPECT_TRUE(hash.starts_with("sha256:"));
    EXPECT_EQ(hash.length(), 7 + 64);
}

TEST(SHA256, DifferentInputs)
{
    EXPECT_NE(sha256("a"), sha256("b"));
    EXPECT_NE(sha256("abc"), sha256("ABC"));
}

TEST(LineCount, SkipsEmptyLines)
{
    EXPECT_EQ(count_nonempty_lines(""), 0U);
    EXPECT_EQ(count_nonempty_lines("a\n\nb\n"), 2U);
    EXPECT_EQ(count_nonempty_lines("single"), 1U);
}
