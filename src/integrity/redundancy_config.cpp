#include "integrity/redundancy_config.hpp"
#include "integrity/integrity_error.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace shardroot::integrity {

const char* redundancy_type_to_string(RedundancyType type) {
  switch (type) {
    case RedundancyType::ErasureCoded: return "REDUNDANCY_EC_TYPE";
    case RedundancyType::Replicated:   return "REDUNDANCY_REPLICA_TYPE";
    default:                           return "REDUNDANCY_UNKNOWN";
  }
}

void RedundancyConfig::validate() const {
  if (data_shards == 0) {
    BOOST_LOG_TRIVIAL(error) << "Redundancy config: data shard count must be positive";
    throw InvalidConfigError("data shard count must be at least 1");
  }

  // Compare in 64 bits so a huge parity count cannot wrap the sum
  if (static_cast<uint64_t>(data_shards) + parity_shards > MAX_TOTAL_SHARDS) {
    BOOST_LOG_TRIVIAL(error) << "Redundancy config: too many shards: " << to_string();
    throw InvalidConfigError("data + parity shards exceeds " + std::to_string(MAX_TOTAL_SHARDS));
  }

  if (segment_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "Redundancy config: segment size must be positive";
    throw InvalidConfigError("segment size must be positive");
  }

  if (segment_size > MAX_SEGMENT_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Redundancy config: segment size too large: " << segment_size;
    throw InvalidConfigError("segment size exceeds " + std::to_string(MAX_SEGMENT_SIZE));
  }
}

std::string RedundancyConfig::to_string() const {
  std::stringstream ss;
  ss << "{segment_size=" << segment_size
     << ", data_shards=" << data_shards
     << ", parity_shards=" << parity_shards << "}";
  return ss.str();
}

bool operator==(const RedundancyConfig& lhs, const RedundancyConfig& rhs) {
  return lhs.segment_size == rhs.segment_size
      && lhs.data_shards == rhs.data_shards
      && lhs.parity_shards == rhs.parity_shards;
}

} // namespace shardroot::integrity
