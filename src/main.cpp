#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

bool setup_logging(const shardroot::cli::CliOptions& options) {
  try {
    shardroot::logging::init_logging(options.log_file,
                                     shardroot::logging::parse_log_level(options.log_level),
                                     options.log_console);
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to initialize logging: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const std::string program_name = (argc > 0 && argv[0] != nullptr) ? argv[0] : "shardroot";
  const std::vector<std::string> args = shardroot::cli::collect_arguments(argc, argv);

  if (const auto options = shardroot::cli::parse_arguments(args); !options.valid) {
    std::cerr << "Error: " << options.error << '\n';
    shardroot::cli::CLI::print_usage(program_name, std::cerr);
    return 1;
  } else if (!setup_logging(options)) {
    return 1;
  } else {
    LOG_INFO << "shardroot started: " << options.command;
    return shardroot::cli::CLI(options).run();
  }
}
