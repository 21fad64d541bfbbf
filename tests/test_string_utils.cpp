/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string, base64 and encoding helpers
 */

#include <gtest/gtest.h>
#include <ldiftap/utils/string_utils.h>

using namespace ldiftap::utils;

class StringUtilsTest : public ::testing::Test {
protected:
    // Test setup if needed
};

// toLower tests
TEST_F(StringUtilsTest, ToLower_Mixed) {
    EXPECT_EQ(toLower("ObjectClass"), "objectclass");
}

TEST_F(StringUtilsTest, ToLower_Empty) {
    EXPECT_EQ(toLower(""), "");
}

TEST_F(StringUtilsTest, ToLower_NonAsciiBytesUnchanged) {
    EXPECT_EQ(toLower("\xC3\x89T\xC3\xA9"), "\xC3\x89t\xC3\xA9");
}

// trim tests
TEST_F(StringUtilsTest, Trim_BothEnds) {
    EXPECT_EQ(trim("  cn=admin,dc=example,dc=com \t"), "cn=admin,dc=example,dc=com");
}

TEST_F(StringUtilsTest, Trim_OnlySpaces) {
    EXPECT_EQ(trim("     "), "");
}

TEST_F(StringUtilsTest, Trim_Empty) {
    EXPECT_EQ(trim(""), "");
}

TEST_F(StringUtilsTest, TrimRight_KeepsLeadingSpace) {
    EXPECT_EQ(trimRight(" continued  \r"), " continued");
}

TEST_F(StringUtilsTest, TrimRight_OnlyWhitespace) {
    EXPECT_EQ(trimRight(" \t "), "");
}

// split tests
TEST_F(StringUtilsTest, Split_Basic) {
    auto parts = split("cn,mail,uid", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "cn");
    EXPECT_EQ(parts[1], "mail");
    EXPECT_EQ(parts[2], "uid");
}

TEST_F(StringUtilsTest, Split_Empty) {
    auto parts = split("", ',');
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], "");
}

TEST_F(StringUtilsTest, Split_TrailingDelimiter) {
    auto parts = split("a,b,", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[2], "");
}

TEST_F(StringUtilsTest, Split_NoDelimiter) {
    auto parts = split("single", ',');
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], "single");
}

// startsWith / endsWithIgnoreCase tests
TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(startsWith("dn: cn=x", "dn:"));
    EXPECT_FALSE(startsWith("dn", "dn:"));
    EXPECT_TRUE(startsWith("anything", ""));
}

TEST_F(StringUtilsTest, EndsWithIgnoreCase) {
    EXPECT_TRUE(endsWithIgnoreCase("cn=x,DC=Example,dc=COM", "dc=example,dc=com"));
    EXPECT_FALSE(endsWithIgnoreCase("cn=x,dc=other,dc=com", "dc=example,dc=com"));
    EXPECT_FALSE(endsWithIgnoreCase("com", "dc=com"));
}

// Base64 tests
TEST_F(StringUtilsTest, ToBase64_KnownVector) {
    EXPECT_EQ(toBase64("Hello World"), "SGVsbG8gV29ybGQ=");
    EXPECT_EQ(toBase64("ab"), "YWI=");
    EXPECT_EQ(toBase64("abc"), "YWJj");
}

TEST_F(StringUtilsTest, ToBase64_Empty) {
    EXPECT_EQ(toBase64(""), "");
}

TEST_F(StringUtilsTest, FromBase64_KnownVector) {
    auto decoded = fromBase64("SGVsbG8gV29ybGQ=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "Hello World");
}

TEST_F(StringUtilsTest, FromBase64_DoublePadding) {
    auto decoded = fromBase64("YQ==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "a");
}

TEST_F(StringUtilsTest, FromBase64_BinaryBytes) {
    const std::string bytes("\xFF\xD8\xFF\x00\x10", 5);
    auto decoded = fromBase64(toBase64(bytes));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
}

TEST_F(StringUtilsTest, FromBase64_IgnoresWhitespace) {
    auto decoded = fromBase64("SGVs bG8g\nV29y bGQ=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "Hello World");
}

TEST_F(StringUtilsTest, FromBase64_EmptyInput) {
    auto decoded = fromBase64("");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "");
}

TEST_F(StringUtilsTest, FromBase64_RejectsBadLength) {
    EXPECT_FALSE(fromBase64("abc").has_value());
}

TEST_F(StringUtilsTest, FromBase64_RejectsBadAlphabet) {
    EXPECT_FALSE(fromBase64("ab!d").has_value());
    EXPECT_FALSE(fromBase64("!!!not-base64!!!").has_value());
}

TEST_F(StringUtilsTest, FromBase64_RejectsMisplacedPadding) {
    EXPECT_FALSE(fromBase64("a=bc").has_value());
    EXPECT_FALSE(fromBase64("a===").has_value());
}

// UTF-8 / ASCII tests
TEST_F(StringUtilsTest, IsValidUtf8_Valid) {
    EXPECT_TRUE(isValidUtf8("plain ascii"));
    EXPECT_TRUE(isValidUtf8("caf\xC3\xA9"));
    EXPECT_TRUE(isValidUtf8("\xE2\x82\xAC"));          // euro sign
    EXPECT_TRUE(isValidUtf8("\xF0\x9F\x98\x80"));      // emoji
}

TEST_F(StringUtilsTest, IsValidUtf8_Invalid) {
    EXPECT_FALSE(isValidUtf8("caf\xE9"));              // latin-1 byte
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));             // overlong
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));         // surrogate
    EXPECT_FALSE(isValidUtf8("\xE2\x82"));             // truncated
}

TEST_F(StringUtilsTest, IsAscii) {
    EXPECT_TRUE(isAscii("cn: admin"));
    EXPECT_FALSE(isAscii("caf\xC3\xA9"));
}

TEST_F(StringUtilsTest, Latin1ToUtf8) {
    EXPECT_EQ(latin1ToUtf8("caf\xE9"), "caf\xC3\xA9");
    EXPECT_EQ(latin1ToUtf8("plain"), "plain");
}
