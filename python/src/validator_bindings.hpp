/**
 * Validator bindings for gtin Python bindings.
 */

#pragma once

#include <gtin/code.hpp>
#include <pybind11/pybind11.h>

namespace gtin::python {

/**
 * Resolve a Python object to a code input: str -> text, int -> integer.
 * @throws gtin::TypeKindError for anything else (float, list, bool, None...).
 */
CodeInput ToCodeInput(const pybind11::handle& obj);

/**
 * Bind is_valid_GTIN, add_check_digit and validate.
 */
void BindValidator(pybind11::module_& m);

}  // namespace gtin::python
