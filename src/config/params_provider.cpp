#include "config/params_provider.hpp"
#include "integrity/integrity_error.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <boost/property_tree/json_parser.hpp>
#include <boost/log/trivial.hpp>

namespace shardroot {
namespace config {

namespace pt = boost::property_tree;

JsonParamsProvider::JsonParamsProvider(const std::string& filename)
  : filename_(filename) {}

integrity::RedundancyConfig JsonParamsProvider::fetch() {
  BOOST_LOG_TRIVIAL(info) << "Params provider: Loading redundancy parameters from " << filename_;

  if (!std::filesystem::exists(filename_)) {
    BOOST_LOG_TRIVIAL(error) << "Params provider: File not found: " << filename_;
    throw integrity::ConfigUnavailableError("parameter file not found: " + filename_);
  }

  std::ifstream file(filename_);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Params provider: Failed to open file: " << filename_;
    throw integrity::ConfigUnavailableError("cannot open parameter file: " + filename_);
  }
  return parse(file);
}

integrity::RedundancyConfig JsonParamsProvider::parse(std::istream& input) {
  pt::ptree tree;
  try {
    pt::read_json(input, tree);
  } catch (const pt::json_parser::json_parser_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Params provider: JSON parse error: " << e.what();
    throw integrity::ConfigUnavailableError(std::string("malformed parameter document: ") + e.what());
  }
  return from_tree(tree);
}

integrity::RedundancyConfig JsonParamsProvider::from_tree(const pt::ptree& tree) {
  // Chain query responses nest the values under "params"
  const pt::ptree& params = tree.get_child("params", tree);

  integrity::RedundancyConfig config;
  try {
    config.data_shards = params.get<uint32_t>(DATA_CHUNK_KEY);
    config.parity_shards = params.get<uint32_t>(PARITY_CHUNK_KEY);
    config.segment_size = params.get<uint64_t>(SEGMENT_SIZE_KEY);
  } catch (const pt::ptree_bad_path& e) {
    BOOST_LOG_TRIVIAL(error) << "Params provider: Missing parameter: " << e.what();
    throw integrity::ConfigUnavailableError(std::string("missing parameter: ") + e.what());
  } catch (const pt::ptree_bad_data& e) {
    BOOST_LOG_TRIVIAL(error) << "Params provider: Malformed parameter: " << e.what();
    throw integrity::ConfigUnavailableError(std::string("malformed parameter: ") + e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Params provider: Loaded " << config.to_string();
  return config;
}

std::string JsonParamsProvider::render(const integrity::RedundancyConfig& config) {
  pt::ptree params;
  params.put(DATA_CHUNK_KEY, config.data_shards);
  params.put(PARITY_CHUNK_KEY, config.parity_shards);
  params.put(SEGMENT_SIZE_KEY, config.segment_size);

  pt::ptree root;
  root.add_child("params", params);

  std::stringstream ss;
  pt::write_json(ss, root);
  return ss.str();
}

} // namespace config
} // namespace shardroot
