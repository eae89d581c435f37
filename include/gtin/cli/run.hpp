#pragma once

#include <gtin/cli/config.hpp>

#include <ostream>

namespace gtin::cli {

/** Exit status of a gtin_cli run. */
enum ExitCode : int {
  kExitOk = 0,       // every code valid, or nothing to validate
  kExitInvalid = 1,  // at least one code failed validation
  kExitError = 2,    // usage, configuration or input kind error
};

/**
 * Execute the command described by `config`.
 *
 * Results go to `out`. Errors, usage text and the --metrics export go to
 * `err`. The metrics export is written on the error path too, covering the
 * codes handled before the failure.
 */
int Run(const Config& config, std::ostream& out, std::ostream& err);

}  // namespace gtin::cli
