#include <gtin/validator.hpp>

#include <iostream>

int main() {
  const char* codes[] = {
      "4006381333931",    // GTIN-13
      "4006381333932",    // wrong check digit
      "96385074",         // GTIN-8
      "036000291452",     // GTIN-12 (UPC-A)
      "4-006381333931",   // hyphens are ignored
      "0123456",          // too short for any class
  };

  for (const char* code : codes) {
    gtin::ValidationResult r = gtin::Validate(code);
    std::cout << code << ": " << (r.ok() ? "valid" : "invalid")
              << " (" << gtin::StatusName(r.status) << ")\n";
  }

  // Integers and text normalize to the same canonical code.
  std::cout << "4006381333931 as integer: "
            << (gtin::IsValidGtin(4006381333931ull) ? "valid" : "invalid") << "\n";

  // Check digit generation always pads the payload to 13 digits first.
  std::cout << "400638133393 + check digit = "
            << gtin::AddCheckDigit("400638133393") << "\n";

  // Integers are resolved at the call site; untyped input is rejected.
  try {
    gtin::CodeInput::ParseInteger("12.5");
  } catch (const gtin::TypeKindError& e) {
    std::cerr << "rejected: " << e.what() << "\n";
  }
  return 0;
}
