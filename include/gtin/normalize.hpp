#pragma once

#include <gtin/code.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace gtin {

/** Canonical width used by validation (room for a GTIN-14). */
constexpr size_t kValidationWidth = 14;

/** Canonical width used for check-digit generation (13 + 1 appended). */
constexpr size_t kGenerationWidth = 13;

/**
 * Convert a code input to its canonical form.
 *
 * - kInteger: decimal text, left-padded with '0' to `fill_width`
 * - kText: every '-' removed, then leading/trailing whitespace trimmed,
 *   then left-padded with '0' to `fill_width`
 *
 * Padding only extends: input already `fill_width` or longer is returned
 * as cleaned. Characters other than digits, '-' and edge whitespace are
 * kept; the structural check downstream rejects them.
 *
 * @param input The code to normalize
 * @param fill_width Target width (kValidationWidth by default)
 * @return Canonical code
 */
std::string Normalize(const CodeInput& input,
                      size_t fill_width = kValidationWidth);

namespace internal {

// Whitespace as understood by the normalizer: ASCII space, \t \n \v \f \r
// and the separators 0x1c-0x1f.
bool IsWhitespace(char c);

// Remove '-' then trim edge whitespace. No padding.
std::string CleanText(std::string_view text);

// Left-pad with '0' up to `width`; never truncates.
std::string ZeroFill(std::string text, size_t width);

bool IsAllDigits(std::string_view text);

}  // namespace internal
}  // namespace gtin
