#pragma once

#include <gtin/code.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

namespace gtin {

/**
 * GS1 prefix gate.
 *
 * The length class comes from the raw input (hyphens and whitespace count),
 * the prefix digits from the canonical form:
 *
 * - length 8: the first 3 raw characters; 000-099 and 200-299 are reserved
 * - length 12/13/14: canonical (width 14) digit 0 is `n1`, digits 1-3 the
 *   prefix; n1 > 8 is rejected, as is any prefix in the reserved ranges
 *   (020-029, 040-059, 200-299, 960-969, 980-999) or in the table of
 *   reserved/unassigned single prefixes
 * - any other length: rejected
 *
 * Never throws; unreadable prefix windows are rejected.
 */
bool IsPrefixAllowed(const CodeInput& input);

namespace internal {

/** True if a 3-digit GS1 prefix is reserved for GTIN-12/13/14 (n1 <= 8). */
bool IsReservedPrefix(int prefix);

/** True if a 3-digit prefix is reserved for GTIN-8. */
bool IsReservedGtin8Prefix(int prefix);

/** Longest digit run ParsePrefixWindow accepts. */
constexpr size_t kMaxPrefixWindowDigits = 9;

/**
 * Read a short window as an integer literal: edge whitespace and a single
 * leading '+' or '-' are tolerated, the rest must be digits. More than
 * kMaxPrefixWindowDigits digits yields nullopt.
 */
std::optional<int> ParsePrefixWindow(std::string_view window);

}  // namespace internal
}  // namespace gtin
