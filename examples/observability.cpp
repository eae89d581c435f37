#include <gtin/cli/metrics.hpp>
#include <gtin/validator.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main() {
  auto metrics = std::make_shared<gtin::cli::CounterMetrics>();

  gtin::ValidatorOptions opt;
  opt.metrics = metrics;
  gtin::Validator validator(opt);

  const std::vector<std::string> scanned = {
      "4006381333931", "9501101530003", "4006381333930",
      "2000000000008", "12345670",      "not-a-code-x",
  };

  for (const auto& code : scanned) {
    validator.IsValid(code);
  }
  std::cout << validator.AddCheckDigit("950110153000") << "\n";

  // Prometheus text exposition format.
  std::cout << metrics->Export();
  return 0;
}
