#include <gtin/cli/config.hpp>
#include <gtin/cli/run.hpp>

#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
  gtin::cli::Config config;
  try {
    config = gtin::cli::Config::LoadFromArgs(argc, argv);
  } catch (const std::runtime_error& e) {
    std::cerr << "error: " << e.what() << "\n\n";
    gtin::cli::PrintUsage(std::cerr, argv[0]);
    return gtin::cli::kExitError;
  }

  return gtin::cli::Run(config, std::cout, std::cerr);
}
