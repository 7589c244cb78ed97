#include "integrity/root_hasher.hpp"
#include "integrity/integrity_error.hpp"
#include <future>
#include <stdexcept>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace shardroot::integrity {

//==============================================
// CONSTRUCTOR
//==============================================

RootHasher::RootHasher(uint32_t shard_count, boost::asio::thread_pool* pool)
  : pool_(pool) {
  if (shard_count == 0) {
    throw InvalidConfigError("root hasher needs at least one shard");
  }
  accumulators_.reserve(shard_count);
  for (uint32_t i = 0; i < shard_count; ++i) {
    accumulators_.emplace_back();
  }
  BOOST_LOG_TRIVIAL(debug) << "Root hasher: " << shard_count << " accumulators initialized"
                           << (pool_ ? " (parallel)" : "");
}


//==============================================
// ACCUMULATION
//==============================================

void RootHasher::absorb(const ShardSet& pieces) {
  check_open();
  if (pieces.size() != accumulators_.size()) {
    throw std::invalid_argument("Root hasher: got " + std::to_string(pieces.size()) +
                                " pieces for " + std::to_string(accumulators_.size()) + " shards");
  }

  update_all([&pieces](size_t i) -> const Shard& { return pieces[i]; });
  segments_absorbed_++;
}

void RootHasher::absorb_replicated(const std::vector<uint8_t>& segment) {
  check_open();
  update_all([&segment](size_t) -> const Shard& { return segment; });
  segments_absorbed_++;
}

void RootHasher::check_open() const {
  if (finalized_) {
    throw std::logic_error("Root hasher: absorb after finalize");
  }
}

void RootHasher::update_all(const std::function<const Shard&(size_t)>& piece_for) {
  if (!pool_ || accumulators_.size() == 1) {
    for (size_t i = 0; i < accumulators_.size(); ++i) {
      accumulators_[i].update(piece_for(i));
    }
    return;
  }

  std::vector<std::future<void>> pending;
  pending.reserve(accumulators_.size());

  for (size_t i = 0; i < accumulators_.size(); ++i) {
    auto task = std::make_shared<std::packaged_task<void()>>([this, &piece_for, i]() {
      accumulators_[i].update(piece_for(i));
    });
    pending.push_back(task->get_future());
    boost::asio::post(*pool_, [task]() { (*task)(); });
  }

  // The next segment may only start once every accumulator has taken this one.
  // Wait for all tasks before surfacing the first failure so none outlives the pieces.
  for (auto& f : pending) {
    f.wait();
  }
  for (auto& f : pending) {
    f.get();
  }
}

std::vector<HashRoot> RootHasher::finalize() {
  if (finalized_) {
    throw std::logic_error("Root hasher: already finalized");
  }

  std::vector<HashRoot> roots;
  roots.reserve(accumulators_.size());
  for (auto& accumulator : accumulators_) {
    roots.push_back(accumulator.finalize());
  }
  finalized_ = true;

  BOOST_LOG_TRIVIAL(debug) << "Root hasher: Finalized " << roots.size() << " roots over "
                           << segments_absorbed_ << " segments";
  return roots;
}

} // namespace shardroot::integrity
