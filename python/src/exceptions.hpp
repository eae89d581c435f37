/**
 * Exception handling for gtin Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>

namespace gtin::python {

/**
 * Register exception types with the Python module.
 */
void RegisterExceptions(pybind11::module_& m);

}  // namespace gtin::python
