#ifndef SHARDROOT_REED_SOLOMON_HPP
#define SHARDROOT_REED_SOLOMON_HPP

#include <cstdint>
#include <vector>
#include "integrity/matrix.hpp"
#include "integrity/redundancy_config.hpp"
#include "integrity/integrity_error.hpp"

namespace shardroot::integrity {

using Shard = std::vector<uint8_t>;
using ShardSet = std::vector<Shard>;

// Systematic Reed-Solomon code over GF(2^8).
//
// The generator is vandermonde(total, data) multiplied by the inverse of its top
// data x data block, so its first data rows form the identity and data shards are
// a plain split of the segment. Any data_shards of the total pieces rebuild the rest.
class ReedSolomon {
public:

  // ---- CONSTRUCTOR ----
  // Throws InvalidConfigError on zero data shards or more than 256 shards in total
  ReedSolomon(uint32_t data_shards, uint32_t parity_shards);


  // ---- ENCODING ----
  // Length of every piece produced for a segment of the given length
  static size_t shard_size_for(size_t segment_length, uint32_t data_shards);

  // Splits the segment into data shards (zero padded) followed by zeroed parity shards
  ShardSet split(const uint8_t* data, size_t length) const;
  // Computes the parity shards in place from the data shards
  void encode_parity(ShardSet& shards) const;
  // split + encode_parity
  ShardSet encode(const std::vector<uint8_t>& segment) const;


  // ---- VERIFICATION AND RECOVERY ----
  // True when the parity shards match the data shards
  bool verify(const ShardSet& shards) const;
  // Rebuilds every missing (empty) shard in place from any data_shards present ones.
  // Throws TooFewShardsError or ShardSizeMismatchError.
  void reconstruct(ShardSet& shards) const;
  // Concatenates the data shards and drops the padding beyond original_size
  std::vector<uint8_t> join(const ShardSet& shards, size_t original_size) const;


  // ---- GETTERS ----
  uint32_t data_shards() const { return data_shards_; }
  uint32_t parity_shards() const { return parity_shards_; }
  uint32_t total_shards() const { return data_shards_ + parity_shards_; }
  const Matrix& generator() const { return generator_; }

private:
  // ---- PARAMETERS ----
  uint32_t data_shards_;
  uint32_t parity_shards_;
  Matrix generator_;

  static Matrix build_generator(uint32_t data_shards, uint32_t total_shards);
  // Computes output rows from inputs using the given coefficient rows
  static void code_rows(const std::vector<const uint8_t*>& coefficient_rows,
                        const std::vector<const uint8_t*>& inputs,
                        const std::vector<uint8_t*>& outputs,
                        size_t shard_size);
  size_t check_shards(const ShardSet& shards, bool allow_missing) const;
};

// Applies the redundancy type chosen by the caller: the linear code for
// erasure-coded objects, verbatim copies for replicated ones. Copies cost
// total_shards times the segment; hashing uses RootHasher::absorb_replicated instead.
class RedundancyEncoder {
public:
  RedundancyEncoder(const RedundancyConfig& config, RedundancyType type);

  ShardSet encode(const std::vector<uint8_t>& segment) const;

  uint32_t total_shards() const { return codec_.total_shards(); }
  RedundancyType type() const { return type_; }

private:
  ReedSolomon codec_;
  RedundancyType type_;
};

} // namespace shardroot::integrity

#endif // SHARDROOT_REED_SOLOMON_HPP
