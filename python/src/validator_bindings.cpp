/**
 * Validator bindings for gtin Python bindings.
 */

#include "validator_bindings.hpp"

#include <gtin/validator.hpp>
#include <pybind11/pybind11.h>

#include <string>

namespace py = pybind11;

namespace gtin::python {

CodeInput ToCodeInput(const py::handle& obj) {
  if (py::isinstance<py::str>(obj)) {
    return CodeInput::Text(obj.cast<std::string>());
  }
  // bool is an int subclass in Python but never a code.
  if (py::isinstance<py::bool_>(obj)) {
    throw TypeKindError("got bool");
  }
  if (py::isinstance<py::int_>(obj)) {
    std::string digits = py::str(obj).cast<std::string>();
    if (!digits.empty() && digits[0] == '-') {
      throw TypeKindError("negative integer " + digits);
    }
    return CodeInput::ParseInteger(digits);
  }
  throw TypeKindError(std::string("got ") + Py_TYPE(obj.ptr())->tp_name);
}

void BindValidator(py::module_& m) {
  py::enum_<ValidationStatus>(m, "ValidationStatus",
                              "Validation stage that decided the outcome")
      .value("OK", ValidationStatus::kOk)
      .value("RESERVED_PREFIX", ValidationStatus::kReservedPrefix)
      .value("NON_DIGIT", ValidationStatus::kNonDigit)
      .value("BAD_LENGTH", ValidationStatus::kBadLength)
      .value("CHECKSUM_MISMATCH", ValidationStatus::kChecksumMismatch);

  py::class_<ValidationResult>(m, "ValidationResult", "Validation outcome")
      .def_readonly("status", &ValidationResult::status)
      .def_readonly("canonical", &ValidationResult::canonical)
      .def_property_readonly("ok", &ValidationResult::ok)
      .def("__bool__", &ValidationResult::ok)
      .def("__repr__", [](const ValidationResult& r) {
        return std::string("<ValidationResult ") + StatusName(r.status) + ">";
      });

  m.def(
      "is_valid_GTIN",
      [](const py::object& code) { return IsValidGtin(ToCodeInput(code)); },
      py::arg("code"),
      "Validates any GTIN-8, GTIN-12, GTIN-13 or GTIN-14 code.");

  m.def(
      "add_check_digit",
      [](const py::object& code) { return AddCheckDigit(ToCodeInput(code)); },
      py::arg("code"),
      "Adds a check digit to the end of code (canonical width 13 + 1).");

  m.def(
      "validate",
      [](const py::object& code) { return Validate(ToCodeInput(code)); },
      py::arg("code"),
      "Validates code and reports which stage rejected it.");
}

}  // namespace gtin::python
