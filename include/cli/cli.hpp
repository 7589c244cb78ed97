#pragma once

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "client/client.hpp"

namespace shardroot {
namespace cli {

struct CliOptions {
  std::string command;
  std::vector<std::string> arguments;

  // Redundancy parameters
  std::string params_file;
  uint32_t data_shards{4};
  uint32_t parity_shards{2};
  uint64_t segment_size{16 * 1024 * 1024};

  // Object options
  bool replicated{false};
  bool is_public{false};
  std::string content_type;
  std::string creator;
  std::vector<std::string> secondary_sps;

  // Runtime
  size_t threads{0};
  std::string log_file{"shardroot.log"};
  std::string log_level{"info"};
  bool log_console{false};

  bool valid{false};
  std::string error;
};

// argv[1..argc) as strings; empty when argc < 2
std::vector<std::string> collect_arguments(int argc, char* argv[]);

// Parses argv[1..] into options; sets valid=false and error on bad input
CliOptions parse_arguments(const std::vector<std::string>& args);

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(const CliOptions& options, std::ostream& out = std::cout, std::ostream& err = std::cerr);


  // ---- STARTUP ----
  // Runs the selected command, returns the process exit status
  int run();

  static void print_usage(const std::string& program_name, std::ostream& out);

private:
  // ---- PARAMETERS ----
  CliOptions options_;
  std::ostream& out_;
  std::ostream& err_;


  // ---- COMMAND PROCESSING ----
  int handle_hash_command();
  int handle_create_object_command();
  int handle_verify_shard_command();
  int handle_params_command();
  std::shared_ptr<config::RedundancyParamsProvider> make_provider() const;
  int log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace shardroot
