#include "integrity/integrity_hasher.hpp"
#include "integrity/segmenter.hpp"
#include <memory>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>

namespace shardroot::integrity {

namespace {

// Validates before the encoder member builds its generator matrix
const RedundancyConfig& validated(const RedundancyConfig& config) {
  config.validate();
  return config;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

IntegrityHasher::IntegrityHasher(const RedundancyConfig& config, const HashOptions& options)
  : config_(validated(config))
  , options_(options)
  , encoder_(config_, options.redundancy_type) {
  BOOST_LOG_TRIVIAL(debug) << "Integrity hasher: Configured with " << config_.to_string()
                           << " type " << redundancy_type_to_string(options_.redundancy_type);
}


//==============================================
// HASHING
//==============================================

IntegrityResult IntegrityHasher::compute(std::istream* input) const {
  if (input == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "Integrity hasher: No input stream supplied";
    throw MissingInputError("content stream is null");
  }

  BOOST_LOG_TRIVIAL(info) << "Integrity hasher: Computing hash roots with " << config_.to_string();

  std::unique_ptr<boost::asio::thread_pool> pool;
  if (options_.worker_threads > 1) {
    pool = std::make_unique<boost::asio::thread_pool>(options_.worker_threads);
  }

  Segmenter segmenter(*input, config_.segment_size);
  RootHasher hasher(encoder_.total_shards(), pool.get());
  std::vector<uint8_t> segment;

  while (true) {
    check_cancelled(segmenter.segments_produced());
    if (!segmenter.next(segment)) {
      break;
    }
    if (encoder_.type() == RedundancyType::Replicated) {
      hasher.absorb_replicated(segment);
    } else {
      hasher.absorb(encoder_.encode(segment));
    }
  }

  IntegrityResult result;
  result.hash_roots = hasher.finalize();
  result.total_size = static_cast<int64_t>(segmenter.bytes_consumed());

  if (pool) {
    pool->join();
  }

  BOOST_LOG_TRIVIAL(info) << "Integrity hasher: Completed " << result.hash_roots.size()
                          << " hash roots over " << segmenter.segments_produced()
                          << " segments, total size " << result.total_size << " bytes";
  return result;
}

void IntegrityHasher::check_cancelled(uint64_t segment_index) const {
  if (options_.cancel && options_.cancel->load()) {
    BOOST_LOG_TRIVIAL(warning) << "Integrity hasher: Cancelled before segment " << segment_index;
    throw CancelledError("hashing cancelled before segment " + std::to_string(segment_index));
  }
}


//==============================================
// FREE FUNCTIONS
//==============================================

IntegrityResult compute_integrity_hash(std::istream* input,
                                       const RedundancyConfig& config,
                                       const HashOptions& options) {
  if (input == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "Integrity hasher: No input stream supplied";
    throw MissingInputError("content stream is null");
  }
  return IntegrityHasher(config, options).compute(input);
}

HashRoot compute_shard_root(std::istream& shard_pieces) {
  crypto::Sha256 hasher;
  std::vector<char> buffer(64 * 1024);

  try {
    size_t bytes_read = 0;
    do {
      bytes_read = read_block(shard_pieces, buffer.data(), buffer.size());
      hasher.update(reinterpret_cast<const uint8_t*>(buffer.data()), bytes_read);
    } while (bytes_read == buffer.size());
  } catch (const ReadError& e) {
    BOOST_LOG_TRIVIAL(error) << "Integrity hasher: Shard stream read failed after "
                             << hasher.bytes_absorbed() << " bytes: " << e.what();
    throw;
  }
  return hasher.finalize();
}

bool verify_shard_root(std::istream& shard_pieces, const HashRoot& expected) {
  HashRoot actual = compute_shard_root(shard_pieces);
  bool match = actual == expected;
  if (!match) {
    BOOST_LOG_TRIVIAL(warning) << "Integrity hasher: Shard root mismatch, expected "
                               << crypto::to_hex(expected) << " got " << crypto::to_hex(actual);
  }
  return match;
}

} // namespace shardroot::integrity
