#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Reads the config file, then layers environment and command line on top
bool build_config(const bsync::cli::ProgramOptions& options, bsync::config::SyncConfig& config) {
  try {
    if (!options.config_path.empty()) {
      config = bsync::config::load_config(options.config_path);
    } else {
      const std::string default_path = bsync::config::default_config_path();
      std::error_code ec;
      if (!default_path.empty() && std::filesystem::exists(default_path, ec)) {
        config = bsync::config::load_config(default_path);
      }
    }
    bsync::config::apply_environment(config);
    bsync::cli::apply_overrides(options, config);
    bsync::config::validate(config);
    return true;
  } catch (const bsync::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

bool start_logging(const bsync::config::SyncConfig& config) {
  try {
    bsync::logger::init_logging(config.logging.file,
                                bsync::logger::parse_severity(config.logging.level),
                                config.logging.console);
    return true;
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << '\n';
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to open log file " << config.logging.file << ": " << e.what() << '\n';
  }
  return false;
}

} // namespace

int main(int argc, char* argv[]) {
  const std::string program_name = argc > 0 ? argv[0] : "bucketsync";
  const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  const auto options = bsync::cli::parse_command_line(args);
  if (options.help) {
    bsync::cli::print_usage(std::cout, program_name);
    return bsync::cli::EXIT_OK;
  }
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n';
    bsync::cli::print_usage(std::cerr, program_name);
    return bsync::cli::EXIT_USAGE;
  }

  bsync::config::SyncConfig config;
  if (!build_config(options, config)) {
    return bsync::cli::EXIT_USAGE;
  }
  if (!start_logging(config)) {
    return bsync::cli::EXIT_FAILED;
  }

  bsync::cli::CLI cli(config, options);
  return cli.run();
}
