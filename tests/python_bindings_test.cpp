// Unit tests for the _gtin Python bindings
// Tests: Python object to CodeInput conversion, exception registration,
// bound functions called from Python code

#include <gtest/gtest.h>

#include <pybind11/embed.h>

#include <gtin/code.hpp>

#include <memory>
#include <string>

#include "exceptions.hpp"
#include "validator_bindings.hpp"

namespace py = pybind11;

PYBIND11_EMBEDDED_MODULE(_gtin_embedded, m) {
  gtin::python::RegisterExceptions(m);
  gtin::python::BindValidator(m);
}

namespace gtin::python {
namespace {

class PythonBindingsTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    interpreter_ = std::make_unique<py::scoped_interpreter>();
  }

  static void TearDownTestSuite() { interpreter_.reset(); }

  // Evaluate `expr` with the module imported as `g`.
  static py::object Eval(const char* expr) {
    py::dict scope;
    scope["g"] = py::module_::import("_gtin_embedded");
    return py::eval(py::str(expr), scope);
  }

  static std::unique_ptr<py::scoped_interpreter> interpreter_;
};

std::unique_ptr<py::scoped_interpreter> PythonBindingsTest::interpreter_;

// =============================================================================
// ToCodeInput
// =============================================================================

TEST_F(PythonBindingsTest, StrIsText) {
  CodeInput code = ToCodeInput(py::str("036000291452"));
  EXPECT_FALSE(code.is_integer());
  EXPECT_EQ(code.raw(), "036000291452");
}

TEST_F(PythonBindingsTest, IntIsInteger) {
  CodeInput code = ToCodeInput(py::int_(4006381333931LL));
  EXPECT_TRUE(code.is_integer());
  EXPECT_EQ(code.raw(), "4006381333931");
}

TEST_F(PythonBindingsTest, IntBeyondUint64StaysExact) {
  CodeInput code = ToCodeInput(Eval("10 ** 25"));
  EXPECT_EQ(code.raw(), "10000000000000000000000000");
}

TEST_F(PythonBindingsTest, BoolRejected) {
  EXPECT_THROW(ToCodeInput(py::bool_(true)), TypeKindError);
  EXPECT_THROW(ToCodeInput(py::bool_(false)), TypeKindError);
}

TEST_F(PythonBindingsTest, FloatRejected) {
  EXPECT_THROW(ToCodeInput(py::float_(4.5)), TypeKindError);
}

TEST_F(PythonBindingsTest, ContainersAndNoneRejected) {
  EXPECT_THROW(ToCodeInput(py::list()), TypeKindError);
  EXPECT_THROW(ToCodeInput(py::dict()), TypeKindError);
  EXPECT_THROW(ToCodeInput(py::none()), TypeKindError);
}

TEST_F(PythonBindingsTest, NegativeIntRejected) {
  EXPECT_THROW(ToCodeInput(py::int_(-4006381333931LL)), TypeKindError);
}

// =============================================================================
// Module functions
// =============================================================================

TEST_F(PythonBindingsTest, IsValidGtin) {
  EXPECT_TRUE(Eval("g.is_valid_GTIN('4006381333931')").cast<bool>());
  EXPECT_TRUE(Eval("g.is_valid_GTIN(4006381333931)").cast<bool>());
  EXPECT_FALSE(Eval("g.is_valid_GTIN('4006381333932')").cast<bool>());
}

TEST_F(PythonBindingsTest, AddCheckDigit) {
  EXPECT_EQ(Eval("g.add_check_digit('400638133393')").cast<std::string>(),
            "04006381333931");
}

TEST_F(PythonBindingsTest, ValidateReportsStatus) {
  EXPECT_TRUE(Eval("g.validate('4006381333932').status == "
                   "g.ValidationStatus.CHECKSUM_MISMATCH")
                  .cast<bool>());
  EXPECT_EQ(Eval("g.validate('96385074').canonical").cast<std::string>(),
            "00000096385074");
}

TEST_F(PythonBindingsTest, TypeKindErrorIsTypeError) {
  EXPECT_TRUE(Eval("issubclass(g.TypeKindError, TypeError)").cast<bool>());

  for (const char* expr : {"g.is_valid_GTIN(4.5)", "g.is_valid_GTIN([1])",
                           "g.add_check_digit(True)"}) {
    try {
      Eval(expr);
      ADD_FAILURE() << expr << " did not raise";
    } catch (const py::error_already_set& e) {
      EXPECT_TRUE(e.matches(PyExc_TypeError)) << expr;
      EXPECT_TRUE(e.matches(Eval("g.TypeKindError"))) << expr;
    }
  }
}

}  // namespace
}  // namespace gtin::python
