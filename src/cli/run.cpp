#include <gtin/cli/run.hpp>

#include <gtin/cli/metrics.hpp>
#include <gtin/cli/report.hpp>
#include <gtin/validator.hpp>
#include <gtin/version.hpp>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

namespace gtin::cli {

namespace {

constexpr const char* kProgramName = "gtin_cli";

// Codes are converted one at a time, so a bad element surfaces after the
// codes in front of it were handled.
template <typename Fn>
void ForEachCode(const Config& config, Fn&& fn) {
  if (config.command == "batch") {
    std::ifstream in(config.args[0]);
    if (!in.is_open()) {
      throw std::runtime_error("cannot open " + config.args[0]);
    }
    for (const auto& item : ReadCodeArray(in)) {
      fn(CodeFromJson(item));
    }
    return;
  }
  for (const auto& arg : config.args) {
    fn(CodeFromArg(arg, config.input.integer));
  }
}

int RunValidate(const Validator& validator,
                const Config& config,
                std::ostream& out) {
  const bool json = config.output.format == "json";
  bool all_valid = true;
  Json::Value report(Json::arrayValue);

  ForEachCode(config, [&](const CodeInput& code) {
    ValidationResult result = validator.Validate(code);
    all_valid = all_valid && result.ok();
    if (json) {
      report.append(ValidationToJson(code, result));
    } else {
      out << ValidationToText(code, result) << "\n";
    }
  });

  if (json) {
    out << WriteJson(report) << "\n";
  }
  return all_valid ? kExitOk : kExitInvalid;
}

int RunCheckDigit(const Validator& validator,
                  const Config& config,
                  std::ostream& out) {
  const bool json = config.output.format == "json";
  Json::Value report(Json::arrayValue);

  ForEachCode(config, [&](const CodeInput& code) {
    std::string completed = validator.AddCheckDigit(code);
    if (json) {
      report.append(CheckDigitToJson(code, completed));
    } else {
      out << completed << "\n";
    }
  });

  if (json) {
    out << WriteJson(report) << "\n";
  }
  return kExitOk;
}

}  // namespace

int Run(const Config& config, std::ostream& out, std::ostream& err) {
  try {
    config.Validate();
  } catch (const std::runtime_error& e) {
    err << "error: " << e.what() << "\n\n";
    PrintUsage(err, kProgramName);
    return kExitError;
  }

  if (config.show_help) {
    PrintUsage(out, kProgramName);
    return kExitOk;
  }
  if (config.show_version) {
    out << "gtin " << Version() << "\n";
    return kExitOk;
  }

  auto metrics = std::make_shared<CounterMetrics>();
  ValidatorOptions opt;
  if (config.output.metrics) {
    opt.metrics = metrics;
  }
  Validator validator(opt);

  int rc = kExitOk;
  try {
    if (config.command == "check-digit") {
      rc = RunCheckDigit(validator, config, out);
    } else {
      rc = RunValidate(validator, config, out);
    }
  } catch (const TypeKindError& e) {
    err << "error: " << e.what() << "\n";
    rc = kExitError;
  } catch (const std::runtime_error& e) {
    err << "error: " << e.what() << "\n";
    rc = kExitError;
  }

  if (config.output.metrics) {
    err << metrics->Export();
  }
  return rc;
}

}  // namespace gtin::cli
