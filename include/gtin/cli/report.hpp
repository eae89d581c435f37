#pragma once

#include <gtin/code.hpp>
#include <gtin/validator.hpp>

#include <json/json.h>

#include <istream>
#include <string>
#include <vector>

namespace gtin::cli {

/**
 * Convert a JSON value to a code input.
 * Strings become text inputs, non-negative integers become integer inputs.
 * @throws gtin::TypeKindError for any other value (floats, arrays, objects,
 *         booleans, null, negative integers).
 */
CodeInput CodeFromJson(const Json::Value& value);

/**
 * Parse a JSON array without converting its elements.
 * @throws std::runtime_error if the stream is not a JSON array.
 */
Json::Value ReadCodeArray(std::istream& in);

/**
 * Read a JSON array of codes.
 * @throws std::runtime_error if the stream is not a JSON array.
 * @throws gtin::TypeKindError if an element is not a code.
 */
std::vector<CodeInput> ReadCodes(std::istream& in);

/** Parse a positional argument as a text or integer code. */
CodeInput CodeFromArg(const std::string& arg, bool as_integer);

// --- Report records ---

Json::Value ValidationToJson(const CodeInput& code,
                             const ValidationResult& result);
Json::Value CheckDigitToJson(const CodeInput& code, const std::string& completed);

/** "<code>\tvalid|invalid\t<status>" */
std::string ValidationToText(const CodeInput& code,
                             const ValidationResult& result);

/** Compact single-document rendering of a report. */
std::string WriteJson(const Json::Value& json);

}  // namespace gtin::cli
