/**
 * Exception handling for gtin Python bindings.
 *
 * Maps gtin::TypeKindError to gtin.TypeKindError, a TypeError subclass, so
 * callers can catch either.
 */

#include "exceptions.hpp"

#include <gtin/code.hpp>
#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace gtin::python {

void RegisterExceptions(py::module_& m) {
  py::register_exception<gtin::TypeKindError>(m, "TypeKindError",
                                              PyExc_TypeError);
}

}  // namespace gtin::python
