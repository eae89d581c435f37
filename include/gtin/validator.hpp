#pragma once

#include <gtin/code.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace gtin {

/** A minimal metrics sink interface (counters + histograms). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., calls, rejections per stage). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;
};

/** Which validation stage decided the outcome. */
enum class ValidationStatus {
  kOk,
  kReservedPrefix,    // prefix gate: unknown length class or reserved prefix
  kNonDigit,          // canonical form contains a non-digit character
  kBadLength,         // canonical length not in {8, 12, 13, 14, 18}
  kChecksumMismatch   // last digit differs from the computed check digit
};

/** Stable snake_case name, used in reports and metric names. */
const char* StatusName(ValidationStatus status);

struct ValidationResult {
  ValidationStatus status = ValidationStatus::kOk;

  // Canonical (width 14) form. Empty when the prefix gate rejected first.
  std::string canonical;

  bool ok() const { return status == ValidationStatus::kOk; }
};

/**
 * Validate any GTIN-8, GTIN-12, GTIN-13 or GTIN-14 code.
 *
 * Stages, in order: prefix gate on the raw input, canonicalization to width
 * 14, digit check, length class check, checksum. The first failing stage is
 * reported; invalid codes are never an error.
 */
ValidationResult Validate(const CodeInput& code);

/** Equivalent to Validate(code).ok(). */
bool IsValidGtin(const CodeInput& code);

/**
 * Canonicalize `code` to width 13 and append its check digit.
 * Does not validate: the result is always the canonical text plus one digit.
 */
std::string AddCheckDigit(const CodeInput& code);

/** Options for an instrumented Validator. */
struct ValidatorOptions {
  // If set, every call emits counters under "gtin.validate.*" /
  // "gtin.check_digit.*" and a "gtin.validate.latency_us" histogram.
  std::shared_ptr<MetricsSink> metrics;
};

/**
 * Validator with observability hooks.
 *
 * Results are identical to the free functions. Thread-safe as long as the
 * configured MetricsSink is.
 */
class Validator {
 public:
  explicit Validator(ValidatorOptions options = {});

  ValidationResult Validate(const CodeInput& code) const;
  bool IsValid(const CodeInput& code) const;
  std::string AddCheckDigit(const CodeInput& code) const;

  const ValidatorOptions& options() const { return options_; }

 private:
  ValidatorOptions options_;
};

}  // namespace gtin
