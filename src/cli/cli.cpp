#include "cli/cli.hpp"
#include "crypto/sha256.hpp"
#include <fstream>
#include <limits>
#include <unordered_map>
#include <boost/log/trivial.hpp>

namespace shardroot {
namespace cli {

namespace {

// Number of positional arguments each command takes
const std::unordered_map<std::string, size_t> COMMAND_ARITY = {
  {"hash", 1},
  {"create-object", 3},
  {"verify-shard", 2},
  {"params", 0},
  {"help", 0}
};

template <typename T>
bool parse_number(const std::string& value, T& out) {
  try {
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size() || value.front() == '-' ||
        parsed > std::numeric_limits<T>::max()) {
      return false;
    }
    out = static_cast<T>(parsed);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

} // namespace

//==============================================
// ARGUMENT PARSING
//==============================================

std::vector<std::string> collect_arguments(int argc, char* argv[]) {
  std::vector<std::string> args;
  if (argc > 1 && argv != nullptr) {
    args.assign(argv + 1, argv + argc);
  }
  return args;
}

CliOptions parse_arguments(const std::vector<std::string>& args) {
  CliOptions options;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "--replica") {
      options.replicated = true;
      continue;
    }
    if (arg == "--public") {
      options.is_public = true;
      continue;
    }
    if (arg == "--log-console") {
      options.log_console = true;
      continue;
    }

    if (arg.rfind("--", 0) == 0) {
      if (i + 1 >= args.size()) {
        options.error = "Missing value for " + arg;
        return options;
      }
      const std::string& value = args[++i];
      bool ok = true;

      if (arg == "--params") {
        options.params_file = value;
      } else if (arg == "--data-shards") {
        ok = parse_number(value, options.data_shards);
      } else if (arg == "--parity-shards") {
        ok = parse_number(value, options.parity_shards);
      } else if (arg == "--segment-size") {
        ok = parse_number(value, options.segment_size);
      } else if (arg == "--content-type") {
        options.content_type = value;
      } else if (arg == "--creator") {
        options.creator = value;
      } else if (arg == "--secondary-sp") {
        options.secondary_sps.push_back(value);
      } else if (arg == "--threads") {
        ok = parse_number(value, options.threads);
      } else if (arg == "--log-file") {
        options.log_file = value;
      } else if (arg == "--log-level") {
        options.log_level = value;
      } else {
        options.error = "Unknown argument: " + arg;
        return options;
      }

      if (!ok) {
        options.error = "Invalid number for " + arg + ": " + value;
        return options;
      }
      continue;
    }

    if (options.command.empty()) {
      options.command = arg;
    } else {
      options.arguments.push_back(arg);
    }
  }

  if (options.command.empty()) {
    options.error = "No command given";
    return options;
  }

  auto arity = COMMAND_ARITY.find(options.command);
  if (arity == COMMAND_ARITY.end()) {
    options.error = "Unknown command: " + options.command;
    return options;
  }
  if (options.arguments.size() != arity->second) {
    options.error = "Command " + options.command + " takes " + std::to_string(arity->second) +
                    " argument(s), got " + std::to_string(options.arguments.size());
    return options;
  }

  options.valid = true;
  return options;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(const CliOptions& options, std::ostream& out, std::ostream& err)
  : options_(options)
  , out_(out)
  , err_(err) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized for command: " << options_.command;
}


//==============================================
// STARTUP
//==============================================

int CLI::run() {
  BOOST_LOG_TRIVIAL(info) << "CLI: Running command " << options_.command;

  try {
    if (options_.command == "hash") {
      return handle_hash_command();
    } else if (options_.command == "create-object") {
      return handle_create_object_command();
    } else if (options_.command == "verify-shard") {
      return handle_verify_shard_command();
    } else if (options_.command == "params") {
      return handle_params_command();
    } else if (options_.command == "help") {
      print_usage("shardroot", out_);
      return 0;
    }
  } catch (const std::exception& e) {
    return log_and_display_error("Command " + options_.command + " failed", e.what());
  }

  err_ << "Unknown command: " << options_.command << std::endl;
  return 1;
}

void CLI::print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " <command> [arguments] [flags]\n"
      << "Commands:\n"
      << "  hash <file>                            Print total size and per-shard hash roots\n"
      << "  create-object <bucket> <object> <file> Print the object creation request as JSON\n"
      << "  verify-shard <shard-file> <hex-root>   Recompute a shard root and compare\n"
      << "  params                                 Print the effective redundancy parameters\n"
      << "  help                                   Display this help message\n"
      << "Flags:\n"
      << "  --params <json>          Read redundancy parameters from a JSON file\n"
      << "  --data-shards <n>        Data shard count (default 4)\n"
      << "  --parity-shards <n>      Parity shard count (default 2)\n"
      << "  --segment-size <bytes>   Segment size (default 16777216)\n"
      << "  --replica                Use replica redundancy instead of erasure coding\n"
      << "  --public                 Create a public object\n"
      << "  --content-type <type>    Object content type\n"
      << "  --creator <address>      Creator account address\n"
      << "  --secondary-sp <address> Secondary storage provider (repeatable)\n"
      << "  --threads <n>            Worker threads for shard hashing\n"
      << "  --log-file <path>        Log file (default shardroot.log)\n"
      << "  --log-level <level>      trace|debug|info|warning|error|fatal\n"
      << "  --log-console            Also write log records to stderr\n"
      << "Example: " << program_name << " hash ./photo.jpg --data-shards 4 --parity-shards 2\n";
}


//==============================================
// COMMAND PROCESSING
//==============================================

std::shared_ptr<config::RedundancyParamsProvider> CLI::make_provider() const {
  if (!options_.params_file.empty()) {
    return std::make_shared<config::JsonParamsProvider>(options_.params_file);
  }

  integrity::RedundancyConfig config;
  config.data_shards = options_.data_shards;
  config.parity_shards = options_.parity_shards;
  config.segment_size = options_.segment_size;
  return std::make_shared<config::StaticParamsProvider>(config);
}

int CLI::handle_hash_command() {
  const std::string& filename = options_.arguments[0];
  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    return log_and_display_error("Error opening file", filename);
  }

  client::Client client(make_provider(), options_.threads);
  auto type = options_.replicated ? integrity::RedundancyType::Replicated
                                  : integrity::RedundancyType::ErasureCoded;
  integrity::IntegrityResult result = client.compute_hash_roots(&file, type);

  out_ << "total_size: " << result.total_size << "\n";
  for (size_t i = 0; i < result.hash_roots.size(); ++i) {
    out_ << "root[" << i << "]: " << crypto::to_hex(result.hash_roots[i]) << "\n";
  }
  out_ << std::flush;
  return 0;
}

int CLI::handle_create_object_command() {
  const std::string& bucket = options_.arguments[0];
  const std::string& object = options_.arguments[1];
  const std::string& filename = options_.arguments[2];

  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    return log_and_display_error("Error opening file", filename);
  }

  client::CreateObjectOptions object_options;
  object_options.is_public = options_.is_public;
  object_options.content_type = options_.content_type;
  object_options.replicated = options_.replicated;
  object_options.secondary_sp_addresses = options_.secondary_sps;

  client::Client client(make_provider(), options_.threads);
  client::CreateObjectRequest request =
    client.build_create_object(options_.creator, bucket, object, &file, object_options);

  out_ << request.to_json() << std::flush;
  return 0;
}

int CLI::handle_verify_shard_command() {
  const std::string& filename = options_.arguments[0];
  crypto::Digest expected = crypto::digest_from_hex(options_.arguments[1]);

  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    return log_and_display_error("Error opening file", filename);
  }

  if (!integrity::verify_shard_root(file, expected)) {
    return log_and_display_error("Shard root mismatch", filename);
  }
  out_ << "Shard root matches: " << filename << std::endl;
  return 0;
}

int CLI::handle_params_command() {
  integrity::RedundancyConfig config = client::Client(make_provider()).get_redundancy_params();
  config.validate();
  out_ << config::JsonParamsProvider::render(config) << std::flush;
  return 0;
}

int CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  err_ << message << ": " << error << std::endl;
  return 1;
}

} // namespace cli
} // namespace shardroot
