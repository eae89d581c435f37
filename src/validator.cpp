#include <gtin/validator.hpp>

#include <gtin/checksum.hpp>
#include <gtin/normalize.hpp>
#include <gtin/prefix.hpp>

#include <chrono>
#include <utility>

namespace gtin {

namespace {

inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

inline void EmitCounter(const ValidatorOptions& opt,
                        std::string_view name,
                        uint64_t delta) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

inline void EmitHistogram(const ValidatorOptions& opt,
                          std::string_view name,
                          uint64_t value) {
  if (opt.metrics) opt.metrics->Histogram(name, value);
}

bool IsStructuralLength(size_t length) {
  switch (length) {
    case 8:
    case 12:
    case 13:
    case 14:
    case 18:
      return true;
    default:
      return false;
  }
}

}  // namespace

const char* StatusName(ValidationStatus status) {
  switch (status) {
    case ValidationStatus::kOk:
      return "ok";
    case ValidationStatus::kReservedPrefix:
      return "reserved_prefix";
    case ValidationStatus::kNonDigit:
      return "non_digit";
    case ValidationStatus::kBadLength:
      return "bad_length";
    case ValidationStatus::kChecksumMismatch:
      return "checksum_mismatch";
  }
  return "unknown";
}

ValidationResult Validate(const CodeInput& code) {
  ValidationResult result;
  if (!IsPrefixAllowed(code)) {
    result.status = ValidationStatus::kReservedPrefix;
    return result;
  }

  result.canonical = Normalize(code, kValidationWidth);
  if (!internal::IsAllDigits(result.canonical)) {
    result.status = ValidationStatus::kNonDigit;
  } else if (!IsStructuralLength(result.canonical.size())) {
    result.status = ValidationStatus::kBadLength;
  } else if (!VerifyChecksum(result.canonical)) {
    result.status = ValidationStatus::kChecksumMismatch;
  }
  return result;
}

bool IsValidGtin(const CodeInput& code) {
  return Validate(code).ok();
}

std::string AddCheckDigit(const CodeInput& code) {
  std::string canonical = Normalize(code, kGenerationWidth);
  const int digit = Checksum(canonical);
  canonical += static_cast<char>('0' + digit);
  return canonical;
}

// --- Validator ---

Validator::Validator(ValidatorOptions options) : options_(std::move(options)) {}

ValidationResult Validator::Validate(const CodeInput& code) const {
  EmitCounter(options_, "gtin.validate.calls", 1);
  const uint64_t start_us = NowMicros();

  ValidationResult result = gtin::Validate(code);

  EmitHistogram(options_, "gtin.validate.latency_us", NowMicros() - start_us);
  std::string name = "gtin.validate.";
  name += StatusName(result.status);
  name += "_total";
  EmitCounter(options_, name, 1);
  return result;
}

bool Validator::IsValid(const CodeInput& code) const {
  return Validate(code).ok();
}

std::string Validator::AddCheckDigit(const CodeInput& code) const {
  EmitCounter(options_, "gtin.check_digit.calls", 1);
  return gtin::AddCheckDigit(code);
}

}  // namespace gtin
