/**
 * @file UtilTest.cpp
 * @brief Unit tests for utility functions (textUtil, StoreError)
 */

#include <gtest/gtest.h>
#include <string>

#include <docstore/util/StoreError.hpp>
#include <docstore/util/textUtil.hpp>

using namespace DocStore;
using namespace DocStore::util;

// =============================================================================
// parseLongStrict Tests
// =============================================================================

TEST(ParseLongStrictTest, ValidPositiveNumber) {
    long result = 0;
    std::error_code ec;

    EXPECT_TRUE(parseLongStrict("12345", result, ec));
    EXPECT_EQ(result, 12345);
    EXPECT_FALSE(ec);
}

TEST(ParseLongStrictTest, ValidNegativeNumber) {
    long result = 0;
    std::error_code ec;

    EXPECT_TRUE(parseLongStrict("-12345", result, ec));
    EXPECT_EQ(result, -12345);
}

TEST(ParseLongStrictTest, InvalidString) {
    long result = 0;
    std::error_code ec;

    EXPECT_FALSE(parseLongStrict("abc", result, ec));
    EXPECT_EQ(ec, std::errc::invalid_argument);
}

TEST(ParseLongStrictTest, MixedContent) {
    long result = 0;
    std::error_code ec;

    EXPECT_FALSE(parseLongStrict("123abc", result, ec));
    EXPECT_TRUE(ec);
}

TEST(ParseLongStrictTest, LeadingWhitespaceRejected) {
    long result = 0;
    std::error_code ec;

    EXPECT_FALSE(parseLongStrict(" 42", result, ec));
    EXPECT_FALSE(parseLongStrict("", result, ec));
}

TEST(ParseLongStrictTest, Overflow) {
    long result = 0;
    std::error_code ec;

    EXPECT_FALSE(parseLongStrict("99999999999999999999999", result, ec));
    EXPECT_EQ(ec, std::errc::result_out_of_range);
}

// =============================================================================
// Name normalization
// =============================================================================

TEST(TextUtilTest, TrimAndNormalize) {
    EXPECT_EQ(trim("  V60 \t\n"), "V60");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(normalizeKey("  Hario V60 "), "hario v60");
}

TEST(TextUtilTest, ContainsIgnoreCase) {
    EXPECT_TRUE(containsIgnoreCase("Comandante C40", "c40"));
    EXPECT_TRUE(containsIgnoreCase("Comandante C40", "MAND"));
    EXPECT_FALSE(containsIgnoreCase("Comandante C40", "niche"));
}

TEST(TextUtilTest, StartsWith) {
    EXPECT_TRUE(startsWith("test_alice", "test_"));
    EXPECT_FALSE(startsWith("alice_test_", "test_"));
    EXPECT_TRUE(startsWith("x", ""));
}

TEST(TextUtilTest, SafeIdentifier) {
    EXPECT_TRUE(isSafeIdentifier("alice"));
    EXPECT_TRUE(isSafeIdentifier("test_user-01"));
    EXPECT_FALSE(isSafeIdentifier(""));
    EXPECT_FALSE(isSafeIdentifier(".."));
    EXPECT_FALSE(isSafeIdentifier("a/b"));
    EXPECT_FALSE(isSafeIdentifier("a b"));
    EXPECT_FALSE(isSafeIdentifier("a.json"));
}

TEST(TextUtilTest, Fnv1aKnownValues) {
    EXPECT_EQ(fnv1a64(""), 14695981039346656037ULL);
    EXPECT_EQ(toHex(fnv1a64("")), "cbf29ce484222325");
    EXPECT_EQ(toHex(fnv1a64("a")), "af63dc4c8601ec8c");
    EXPECT_EQ(toHex(0), "0000000000000000");
}

// =============================================================================
// Error category
// =============================================================================

TEST(StoreErrorTest, CategoryAndMessages) {
    std::error_code ec = StoreErrc::LockTimeout;
    EXPECT_STREQ(ec.category().name(), "docstore");
    EXPECT_EQ(ec.value(), static_cast<int>(StoreErrc::LockTimeout));
    EXPECT_FALSE(ec.message().empty());

    std::error_code other = StoreErrc::NotFound;
    EXPECT_NE(ec, other);
    EXPECT_EQ(other, StoreErrc::NotFound);
}
