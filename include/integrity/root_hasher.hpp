#ifndef SHARDROOT_ROOT_HASHER_HPP
#define SHARDROOT_ROOT_HASHER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "crypto/sha256.hpp"
#include "integrity/reed_solomon.hpp"

namespace shardroot::integrity {

using HashRoot = crypto::Digest;

// One running SHA-256 per shard index. Pieces of a segment are absorbed as a unit,
// segments strictly in stream order.
class RootHasher {
public:

  // ---- CONSTRUCTOR ----
  // With a pool, the accumulators of one segment are updated concurrently
  explicit RootHasher(uint32_t shard_count, boost::asio::thread_pool* pool = nullptr);


  // ---- ACCUMULATION ----
  // Feeds pieces[i] into accumulator i. Requires exactly shard_count pieces.
  void absorb(const ShardSet& pieces);
  // Feeds the same segment into every accumulator, for replicated objects
  void absorb_replicated(const std::vector<uint8_t>& segment);
  // Finalizes every accumulator, ordered by shard index. May only be called once.
  std::vector<HashRoot> finalize();


  // ---- GETTERS ----
  uint32_t shard_count() const { return static_cast<uint32_t>(accumulators_.size()); }
  uint64_t segments_absorbed() const { return segments_absorbed_; }

private:
  // ---- PARAMETERS ----
  std::vector<crypto::Sha256> accumulators_;
  boost::asio::thread_pool* pool_;
  uint64_t segments_absorbed_{0};
  bool finalized_{false};

  void check_open() const;
  // Updates accumulator i with piece_for(i) for every shard index
  void update_all(const std::function<const Shard&(size_t)>& piece_for);
};

} // namespace shardroot::integrity

#endif // SHARDROOT_ROOT_HASHER_HPP
