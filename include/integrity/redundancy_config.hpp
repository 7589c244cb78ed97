#ifndef SHARDROOT_REDUNDANCY_CONFIG_HPP
#define SHARDROOT_REDUNDANCY_CONFIG_HPP

#include <cstdint>
#include <cstddef>
#include <string>

namespace shardroot::integrity {

// Encoder path chosen by the caller for an object
enum class RedundancyType {
  ErasureCoded,
  Replicated
};

const char* redundancy_type_to_string(RedundancyType type);

struct RedundancyConfig {
  static constexpr uint32_t MAX_TOTAL_SHARDS = 256;              // single-byte shard index
  static constexpr uint64_t MAX_SEGMENT_SIZE = 1ULL << 30;       // 1 GiB per in-memory segment

  uint64_t segment_size{0};
  uint32_t data_shards{0};
  uint32_t parity_shards{0};

  uint32_t total_shards() const { return data_shards + parity_shards; }

  // Throws InvalidConfigError when any parameter is out of the supported range
  void validate() const;

  std::string to_string() const;
};

bool operator==(const RedundancyConfig& lhs, const RedundancyConfig& rhs);

} // namespace shardroot::integrity

#endif // SHARDROOT_REDUNDANCY_CONFIG_HPP
