#pragma once

#include <string_view>

namespace gtin {

/**
 * GS1 mod-10 check digit over a payload (the code without its check digit).
 *
 * Weights run left to right from index 0: even positions weigh 3, odd
 * positions weigh 1. Result is (10 - sum % 10) % 10.
 *
 * A character that is not a decimal digit contributes 0.
 */
int Checksum(std::string_view payload);

/**
 * True iff the last character of `code` is a digit equal to
 * Checksum(code minus its last character). Empty input is never valid.
 */
bool VerifyChecksum(std::string_view code);

}  // namespace gtin
