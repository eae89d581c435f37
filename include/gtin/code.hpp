#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace gtin {

/**
 * Raised when a value cannot be interpreted as a code input, i.e. it is
 * neither decimal text nor a non-negative integer (floats, lists, booleans,
 * nulls coming from dynamic sources).
 */
class TypeKindError : public std::invalid_argument {
 public:
  TypeKindError()
      : std::invalid_argument(
            "input must be a string or integer representation of a code") {}
  explicit TypeKindError(const std::string& detail)
      : std::invalid_argument(
            "input must be a string or integer representation of a code: " +
            detail) {}
};

/**
 * A code as supplied by the caller, tagged with how it was supplied.
 *
 * Text keeps the raw characters (hyphens, whitespace and anything else
 * included); an integer is rendered to its decimal form once, at
 * construction. The raw text is what the prefix validator measures to pick a
 * length class, so "0012345678905" and 12345678905 are different inputs.
 */
class CodeInput {
 public:
  enum class Kind {
    kText,
    kInteger
  };

  static CodeInput Text(std::string_view text) {
    return CodeInput(Kind::kText, std::string(text));
  }

  static CodeInput Integer(uint64_t value) {
    return CodeInput(Kind::kInteger, std::to_string(value));
  }

  /**
   * Build an integer input from its decimal spelling.
   * Accepts only ASCII digits (any count, no sign, no whitespace).
   * @throws TypeKindError if `digits` is not a non-negative decimal integer.
   */
  static CodeInput ParseInteger(std::string_view digits);

  // Implicit conversions keep call sites short: IsValidGtin("4006381333931").
  CodeInput(const char* text) : CodeInput(Text(text)) {}
  CodeInput(const std::string& text) : CodeInput(Text(text)) {}
  CodeInput(std::string_view text) : CodeInput(Text(text)) {}

  /** Any integral type except bool. Negative values throw TypeKindError. */
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> &&
                                          !std::is_same_v<T, bool>,
                                      int> = 0>
  CodeInput(T value) : kind_(Kind::kInteger) {
    if constexpr (std::is_signed_v<T>) {
      if (value < 0) {
        throw TypeKindError("negative integer " + std::to_string(value));
      }
    }
    raw_ = std::to_string(static_cast<uint64_t>(value));
  }

  // Floating-point values are not codes.
  template <typename T,
            std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
  CodeInput(T) = delete;

  Kind kind() const { return kind_; }
  bool is_integer() const { return kind_ == Kind::kInteger; }

  /** Raw text (for integers, the decimal rendering). */
  const std::string& raw() const { return raw_; }

 private:
  CodeInput(Kind kind, std::string raw) : kind_(kind), raw_(std::move(raw)) {}

  Kind kind_;
  std::string raw_;
};

}  // namespace gtin
