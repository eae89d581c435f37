// Unit tests for gtin/normalize.hpp
// Tests: hyphen removal, whitespace trimming, zero padding, widths

#include <gtest/gtest.h>

#include <gtin/normalize.hpp>

#include <string>

namespace gtin {
namespace {

// =============================================================================
// Text input
// =============================================================================

class NormalizeTextTest : public ::testing::Test {};

TEST_F(NormalizeTextTest, PadsToValidationWidth) {
  EXPECT_EQ(Normalize("4006381333931"), "04006381333931");
  EXPECT_EQ(Normalize("96385074"), "00000096385074");
}

TEST_F(NormalizeTextTest, RemovesHyphens) {
  EXPECT_EQ(Normalize("4-006381333931"), "04006381333931");
  EXPECT_EQ(Normalize("4006-3813-3393-1"), "04006381333931");
  EXPECT_EQ(Normalize("--"), "00000000000000");
}

TEST_F(NormalizeTextTest, TrimsEdgeWhitespace) {
  EXPECT_EQ(Normalize("  4006381333931"), "04006381333931");
  EXPECT_EQ(Normalize("4006381333931\t\n"), "04006381333931");
  EXPECT_EQ(Normalize("\r\v\f96385074 "), "00000096385074");
}

TEST_F(NormalizeTextTest, TrimsAsciiSeparators) {
  EXPECT_EQ(Normalize("\x1f" "4006381333931"), "04006381333931");
  EXPECT_EQ(Normalize("400638133393\x1e", kGenerationWidth), "0400638133393");
  EXPECT_EQ(Normalize("\x1c\x1d" "96385074"), "00000096385074");
  // Other control characters are not trimmed.
  EXPECT_EQ(Normalize("\x1b" "96385074"), "00000\x1b" "96385074");
}

TEST_F(NormalizeTextTest, HyphensRemovedBeforeTrim) {
  // Whitespace behind a hyphen becomes an edge once the hyphen is gone.
  EXPECT_EQ(Normalize("- 4006381333931 -"), "04006381333931");
}

TEST_F(NormalizeTextTest, KeepsInteriorWhitespace) {
  EXPECT_EQ(Normalize("4006 381333931"), "4006 381333931");
}

TEST_F(NormalizeTextTest, KeepsOtherCharacters) {
  EXPECT_EQ(Normalize("ABC"), "00000000000ABC");
}

TEST_F(NormalizeTextTest, NeverTruncates) {
  EXPECT_EQ(Normalize("123456789012345678"), "123456789012345678");
  EXPECT_EQ(Normalize("04006381333931"), "04006381333931");
}

TEST_F(NormalizeTextTest, EmptyInput) {
  EXPECT_EQ(Normalize(""), "00000000000000");
  EXPECT_EQ(Normalize("   "), "00000000000000");
}

// =============================================================================
// Integer input
// =============================================================================

class NormalizeIntegerTest : public ::testing::Test {};

TEST_F(NormalizeIntegerTest, PadsDecimalRendering) {
  EXPECT_EQ(Normalize(CodeInput::Integer(4006381333931ull)), "04006381333931");
  EXPECT_EQ(Normalize(CodeInput::Integer(0)), "00000000000000");
}

TEST_F(NormalizeIntegerTest, SameCanonicalFormAsText) {
  EXPECT_EQ(Normalize(CodeInput::Integer(36000291452ull)),
            Normalize("036000291452"));
}

// =============================================================================
// Widths
// =============================================================================

class NormalizeWidthTest : public ::testing::Test {};

TEST_F(NormalizeWidthTest, GenerationWidth) {
  EXPECT_EQ(Normalize("400638133393", kGenerationWidth), "0400638133393");
  EXPECT_EQ(Normalize("1234567", kGenerationWidth), "0000001234567");
}

TEST_F(NormalizeWidthTest, CustomWidth) {
  EXPECT_EQ(Normalize("7", 3), "007");
  EXPECT_EQ(Normalize("12345", 3), "12345");
  EXPECT_EQ(Normalize("12", 0), "12");
}

// =============================================================================
// Helpers
// =============================================================================

class NormalizeHelpersTest : public ::testing::Test {};

TEST_F(NormalizeHelpersTest, IsAllDigits) {
  EXPECT_TRUE(internal::IsAllDigits("0123456789"));
  EXPECT_FALSE(internal::IsAllDigits(""));
  EXPECT_FALSE(internal::IsAllDigits("12 34"));
  EXPECT_FALSE(internal::IsAllDigits("12a4"));
}

TEST_F(NormalizeHelpersTest, CleanTextDoesNotPad) {
  EXPECT_EQ(internal::CleanText(" 12-3 "), "123");
}

}  // namespace
}  // namespace gtin
