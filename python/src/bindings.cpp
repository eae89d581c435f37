/**
 * Main pybind11 module definition for gtin.
 */

#include <pybind11/pybind11.h>
#include <gtin/version.hpp>

#include "exceptions.hpp"
#include "validator_bindings.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_gtin, m) {
  m.doc() = R"doc(
_gtin: GTIN-8/12/13/14 validation and check digit generation.

Basic usage:
    import _gtin

    _gtin.is_valid_GTIN("4006381333931")   # True
    _gtin.is_valid_GTIN(4006381333931)     # True
    _gtin.add_check_digit("400638133393")  # "04006381333931"

    _gtin.is_valid_GTIN(4.5)               # raises _gtin.TypeKindError
)doc";

  // Register exceptions first
  gtin::python::RegisterExceptions(m);

  gtin::python::BindValidator(m);

  // Version info
  m.attr("__version__") = gtin::Version();
}
