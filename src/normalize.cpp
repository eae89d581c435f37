#include <gtin/normalize.hpp>

#include <algorithm>

namespace gtin {

namespace internal {

// C whitespace plus the ASCII separators FS, GS, RS and US (0x1c-0x1f).
bool IsWhitespace(char c) {
  return c == ' ' || (c >= '\t' && c <= '\r') || (c >= '\x1c' && c <= '\x1f');
}

std::string CleanText(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    if (c != '-') result += c;
  }

  size_t start = 0;
  while (start < result.size() && IsWhitespace(result[start])) {
    ++start;
  }
  size_t end = result.size();
  while (end > start && IsWhitespace(result[end - 1])) {
    --end;
  }
  return result.substr(start, end - start);
}

std::string ZeroFill(std::string text, size_t width) {
  if (text.size() >= width) {
    return text;
  }
  text.insert(0, width - text.size(), '0');
  return text;
}

bool IsAllDigits(std::string_view text) {
  if (text.empty()) return false;
  return std::all_of(text.begin(), text.end(),
                     [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace internal

std::string Normalize(const CodeInput& input, size_t fill_width) {
  if (input.is_integer()) {
    return internal::ZeroFill(input.raw(), fill_width);
  }
  return internal::ZeroFill(internal::CleanText(input.raw()), fill_width);
}

}  // namespace gtin
