#include <gtin/cli/config.hpp>

#include <fstream>
#include <ostream>
#include <stdexcept>

namespace gtin::cli {

namespace {

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw std::runtime_error("Invalid boolean for " + key + ": " + value);
}

}  // namespace

void PrintUsage(std::ostream& os, const char* argv0) {
  os << "Usage: " << argv0 << " [options] <command> [args...]\n"
     << "\nCommands:\n"
     << "  validate <code>...        Validate GTIN-8/12/13/14 codes\n"
     << "  check-digit <code>...     Append the check digit to each code\n"
     << "  batch <file.json>         Validate a JSON array of codes\n"
     << "\nOptions:\n"
     << "  --config, -c <path>       Path to YAML config file\n"
     << "  --format <fmt>            Output format: text, json (default: text)\n"
     << "  --integer                 Treat codes as integers\n"
     << "  --metrics                 Print counters to stderr on exit\n"
     << "  --version                 Print the library version\n"
     << "  --help, -h                Show this help\n"
     << "\nExamples:\n"
     << "  " << argv0 << " validate 4006381333931 96385074\n"
     << "  " << argv0 << " --format json check-digit 400638133393\n"
     << "  " << argv0 << " --config /etc/gtin/cli.yaml batch codes.json\n";
}

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;
  int line_no = 0;

  while (std::getline(file, line)) {
    ++line_no;
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error(path + ":" + std::to_string(line_no) +
                               ": expected 'key: value'");
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (current_section == "output") {
      if (key == "format") {
        config.output.format = value;
      } else if (key == "metrics") {
        config.output.metrics = ParseBool("output.metrics", value);
      }
    } else if (current_section == "input") {
      if (key == "integer") {
        config.input.integer = ParseBool("input.integer", value);
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  Config config;
  std::string config_file;
  bool format_set = false;

  int i = 1;
  for (; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
    } else if (arg == "--version") {
      config.show_version = true;
    } else if (arg == "--config" || arg == "-c") {
      if (++i >= argc) {
        throw std::runtime_error("--config requires a path argument");
      }
      config_file = argv[i];
    } else if (arg == "--format") {
      if (++i >= argc) {
        throw std::runtime_error("--format requires text or json");
      }
      config.output.format = argv[i];
      format_set = true;
    } else if (arg == "--integer") {
      config.input.integer = true;
    } else if (arg == "--metrics") {
      config.output.metrics = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    } else {
      break;
    }
  }

  // First positional argument is the command, the rest are its operands.
  // Operands are never parsed as options ("-" may start a hyphenated code).
  if (i < argc) {
    config.command = argv[i++];
  }
  for (; i < argc; ++i) {
    config.args.emplace_back(argv[i]);
  }

  // If a config file was specified, load it first then override with CLI args
  if (!config_file.empty()) {
    Config file_config = LoadFromFile(config_file);

    if (!format_set) {
      config.output.format = file_config.output.format;
    }
    config.output.metrics = config.output.metrics || file_config.output.metrics;
    config.input.integer = config.input.integer || file_config.input.integer;
  }

  return config;
}

void Config::Validate() const {
  if (show_help || show_version) {
    return;
  }

  if (output.format != "text" && output.format != "json") {
    throw std::runtime_error("Invalid output format: " + output.format +
                             " (must be text or json)");
  }

  if (command.empty()) {
    throw std::runtime_error("A command is required (validate, check-digit, batch)");
  }

  if (command == "validate" || command == "check-digit") {
    if (args.empty()) {
      throw std::runtime_error(command + " requires at least one code");
    }
  } else if (command == "batch") {
    if (args.size() != 1) {
      throw std::runtime_error("batch requires exactly one JSON file path");
    }
  } else {
    throw std::runtime_error("Unknown command: " + command);
  }
}

}  // namespace gtin::cli
