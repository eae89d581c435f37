#include <gtin/checksum.hpp>

namespace gtin {

namespace {

inline int DigitValue(char c) {
  return (c >= '0' && c <= '9') ? c - '0' : 0;
}

}  // namespace

int Checksum(std::string_view payload) {
  int total = 0;
  for (size_t i = 0; i < payload.size(); ++i) {
    const int weight = (i % 2 == 1) ? 1 : 3;
    total += weight * DigitValue(payload[i]);
  }
  return (10 - (total % 10)) % 10;
}

bool VerifyChecksum(std::string_view code) {
  if (code.empty()) return false;
  const char last = code.back();
  if (last < '0' || last > '9') return false;
  return (last - '0') == Checksum(code.substr(0, code.size() - 1));
}

}  // namespace gtin
