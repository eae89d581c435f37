#include <gtin/code.hpp>

#include <gtin/normalize.hpp>

namespace gtin {

CodeInput CodeInput::ParseInteger(std::string_view digits) {
  if (!internal::IsAllDigits(digits)) {
    throw TypeKindError("'" + std::string(digits) + "' is not an integer");
  }
  // Leading zeros are not part of an integer's decimal rendering.
  size_t first = digits.find_first_not_of('0');
  if (first == std::string_view::npos) {
    return CodeInput(Kind::kInteger, "0");
  }
  return CodeInput(Kind::kInteger, std::string(digits.substr(first)));
}

}  // namespace gtin
