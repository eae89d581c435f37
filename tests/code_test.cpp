// Unit tests for gtin/code.hpp
// Tests: CodeInput construction, integer parsing, TypeKindError

#include <gtest/gtest.h>

#include <gtin/code.hpp>

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace gtin {
namespace {

// Floats, booleans and containers are not code inputs.
static_assert(!std::is_convertible_v<double, CodeInput>);
static_assert(!std::is_convertible_v<float, CodeInput>);
static_assert(!std::is_convertible_v<bool, CodeInput>);
static_assert(!std::is_convertible_v<std::vector<int>, CodeInput>);
static_assert(std::is_convertible_v<uint64_t, CodeInput>);
static_assert(std::is_convertible_v<const char*, CodeInput>);

class CodeInputTest : public ::testing::Test {};

TEST_F(CodeInputTest, TextKeepsRawCharacters) {
  CodeInput code = CodeInput::Text(" 4-006381333931 ");
  EXPECT_EQ(code.kind(), CodeInput::Kind::kText);
  EXPECT_FALSE(code.is_integer());
  EXPECT_EQ(code.raw(), " 4-006381333931 ");
}

TEST_F(CodeInputTest, IntegerRenderedAsDecimal) {
  CodeInput code = CodeInput::Integer(4006381333931ull);
  EXPECT_EQ(code.kind(), CodeInput::Kind::kInteger);
  EXPECT_EQ(code.raw(), "4006381333931");
}

TEST_F(CodeInputTest, ImplicitConversions) {
  CodeInput from_literal = "96385074";
  CodeInput from_string = std::string("96385074");
  CodeInput from_int = 96385074;
  CodeInput from_zero = 0;

  EXPECT_FALSE(from_literal.is_integer());
  EXPECT_FALSE(from_string.is_integer());
  EXPECT_TRUE(from_int.is_integer());
  EXPECT_EQ(from_int.raw(), "96385074");
  EXPECT_EQ(from_zero.raw(), "0");
}

TEST_F(CodeInputTest, NegativeIntegerIsTypeKindError) {
  EXPECT_THROW(CodeInput(-1), TypeKindError);
  EXPECT_THROW(CodeInput(static_cast<int64_t>(-4006381333931)), TypeKindError);
}

TEST_F(CodeInputTest, TypeKindErrorIsInvalidArgument) {
  try {
    CodeInput code(-5);
    (void)code;
    FAIL() << "expected TypeKindError";
  } catch (const std::invalid_argument& e) {
    EXPECT_NE(std::string(e.what()).find("string or integer"), std::string::npos);
  }
}

// =============================================================================
// ParseInteger
// =============================================================================

class ParseIntegerTest : public ::testing::Test {};

TEST_F(ParseIntegerTest, Digits) {
  CodeInput code = CodeInput::ParseInteger("4006381333931");
  EXPECT_TRUE(code.is_integer());
  EXPECT_EQ(code.raw(), "4006381333931");
}

TEST_F(ParseIntegerTest, LeadingZerosDropped) {
  EXPECT_EQ(CodeInput::ParseInteger("036000291452").raw(), "36000291452");
  EXPECT_EQ(CodeInput::ParseInteger("0000").raw(), "0");
}

TEST_F(ParseIntegerTest, BeyondUint64) {
  CodeInput code = CodeInput::ParseInteger("123456789012345678901234");
  EXPECT_EQ(code.raw(), "123456789012345678901234");
}

TEST_F(ParseIntegerTest, RejectsNonIntegers) {
  EXPECT_THROW(CodeInput::ParseInteger(""), TypeKindError);
  EXPECT_THROW(CodeInput::ParseInteger("12.5"), TypeKindError);
  EXPECT_THROW(CodeInput::ParseInteger("-12"), TypeKindError);
  EXPECT_THROW(CodeInput::ParseInteger(" 12"), TypeKindError);
  EXPECT_THROW(CodeInput::ParseInteger("4006-381333931"), TypeKindError);
  EXPECT_THROW(CodeInput::ParseInteger("1e5"), TypeKindError);
}

}  // namespace
}  // namespace gtin
