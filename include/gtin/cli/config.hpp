#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace gtin::cli {

/**
 * Output configuration.
 */
struct OutputConfig {
  std::string format = "text";  // text | json
  bool metrics = false;         // print counters to stderr on exit
};

/**
 * Input configuration.
 */
struct InputConfig {
  bool integer = false;  // positional codes are integers, not text
};

/**
 * Complete command line configuration.
 */
struct Config {
  std::string command;            // validate | check-digit | batch
  std::vector<std::string> args;  // codes, or the batch file path
  OutputConfig output;
  InputConfig input;
  bool show_help = false;
  bool show_version = false;

  /**
   * Load configuration from a YAML-like file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   * Options given on the command line override a --config file.
   * @param argc Argument count
   * @param argv Argument values
   * @return Parsed configuration
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

void PrintUsage(std::ostream& os, const char* argv0);

}  // namespace gtin::cli
