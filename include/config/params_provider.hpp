#pragma once

#include <istream>
#include <string>
#include <boost/property_tree/ptree.hpp>
#include "integrity/redundancy_config.hpp"

namespace shardroot {
namespace config {

/**
 * @brief Source of the chain-wide redundancy parameters
 */
class RedundancyParamsProvider {
public:
  virtual ~RedundancyParamsProvider() = default;

  /**
   * @brief Read the current parameters
   * @return segment size, data shard count and parity shard count
   * @throws integrity::ConfigUnavailableError when the parameters cannot be obtained
   */
  virtual integrity::RedundancyConfig fetch() = 0;
};

// Fixed parameters, handed out unchanged on every fetch
class StaticParamsProvider : public RedundancyParamsProvider {
public:
  explicit StaticParamsProvider(const integrity::RedundancyConfig& config) : config_(config) {}

  integrity::RedundancyConfig fetch() override { return config_; }

private:
  integrity::RedundancyConfig config_;
};

/**
 * @brief Storage module parameters read from a JSON document
 *
 * Expected keys, either at the top level or under "params":
 *   redundant_data_chunk_num, redundant_parity_chunk_num, max_segment_size
 */
class JsonParamsProvider : public RedundancyParamsProvider {
public:
  static constexpr const char* DATA_CHUNK_KEY = "redundant_data_chunk_num";
  static constexpr const char* PARITY_CHUNK_KEY = "redundant_parity_chunk_num";
  static constexpr const char* SEGMENT_SIZE_KEY = "max_segment_size";

  // Parameters are read from the file on every fetch
  explicit JsonParamsProvider(const std::string& filename);

  integrity::RedundancyConfig fetch() override;

  // Parses an already opened document
  static integrity::RedundancyConfig parse(std::istream& input);
  // Renders the parameters in the same layout that parse accepts
  static std::string render(const integrity::RedundancyConfig& config);

private:
  std::string filename_;

  static integrity::RedundancyConfig from_tree(const boost::property_tree::ptree& tree);
};

} // namespace config
} // namespace shardroot
