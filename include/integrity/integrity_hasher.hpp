#ifndef SHARDROOT_INTEGRITY_HASHER_HPP
#define SHARDROOT_INTEGRITY_HASHER_HPP

#include <atomic>
#include <cstdint>
#include <istream>
#include <vector>
#include "integrity/integrity_error.hpp"
#include "integrity/redundancy_config.hpp"
#include "integrity/root_hasher.hpp"

namespace shardroot::integrity {

struct IntegrityResult {
  std::vector<HashRoot> hash_roots;   // ordered by shard index
  int64_t total_size{0};
};

struct HashOptions {
  RedundancyType redundancy_type{RedundancyType::ErasureCoded};
  // Above 1, shard accumulators of a segment are updated on a worker pool
  size_t worker_threads{0};
  // Checked before every segment read; when set the call fails with CancelledError
  const std::atomic<bool>* cancel{nullptr};
};

// Segmenter -> RedundancyEncoder -> RootHasher over a single pass of the stream.
// Each call owns its accumulators, so concurrent calls need no coordination.
class IntegrityHasher {
public:

  // ---- CONSTRUCTOR ----
  // Throws InvalidConfigError before any stream is touched
  explicit IntegrityHasher(const RedundancyConfig& config, const HashOptions& options = {});


  // ---- HASHING ----
  // Throws MissingInputError for a null stream, ReadError or CancelledError mid-stream.
  // No partial result is ever returned.
  IntegrityResult compute(std::istream* input) const;


  // ---- GETTERS ----
  const RedundancyConfig& config() const { return config_; }
  const HashOptions& options() const { return options_; }

private:
  // ---- PARAMETERS ----
  RedundancyConfig config_;
  HashOptions options_;
  RedundancyEncoder encoder_;

  void check_cancelled(uint64_t segment_index) const;
};

// Convenience wrapper; validates input presence before the config
IntegrityResult compute_integrity_hash(std::istream* input,
                                       const RedundancyConfig& config,
                                       const HashOptions& options = {});

// Root of one shard as a storage provider derives it from the concatenated pieces it holds
HashRoot compute_shard_root(std::istream& shard_pieces);
bool verify_shard_root(std::istream& shard_pieces, const HashRoot& expected);

} // namespace shardroot::integrity

#endif // SHARDROOT_INTEGRITY_HASHER_HPP
