#include "integrity/reed_solomon.hpp"
#include "integrity/galois_field.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace shardroot::integrity {

//==============================================
// CONSTRUCTOR
//==============================================

ReedSolomon::ReedSolomon(uint32_t data_shards, uint32_t parity_shards)
  : data_shards_(data_shards)
  , parity_shards_(parity_shards) {
  if (data_shards == 0) {
    BOOST_LOG_TRIVIAL(error) << "Reed-Solomon: data shard count must be positive";
    throw InvalidConfigError("data shard count must be at least 1");
  }
  if (static_cast<uint64_t>(data_shards) + parity_shards > RedundancyConfig::MAX_TOTAL_SHARDS) {
    BOOST_LOG_TRIVIAL(error) << "Reed-Solomon: too many shards: " << data_shards << "+" << parity_shards;
    throw InvalidConfigError("data + parity shards exceeds " +
                             std::to_string(RedundancyConfig::MAX_TOTAL_SHARDS));
  }

  generator_ = build_generator(data_shards, data_shards + parity_shards);
  BOOST_LOG_TRIVIAL(debug) << "Reed-Solomon: codec v" << GaloisField::CODEC_VERSION
                           << " ready for " << data_shards << "+" << parity_shards << " shards";
}

Matrix ReedSolomon::build_generator(uint32_t data_shards, uint32_t total_shards) {
  Matrix vm = Matrix::vandermonde(total_shards, data_shards);
  Matrix top = vm.sub_matrix(0, 0, data_shards, data_shards);
  return vm.multiply(top.invert());
}


//==============================================
// ENCODING
//==============================================

size_t ReedSolomon::shard_size_for(size_t segment_length, uint32_t data_shards) {
  return (segment_length + data_shards - 1) / data_shards;
}

ShardSet ReedSolomon::split(const uint8_t* data, size_t length) const {
  size_t shard_size = shard_size_for(length, data_shards_);
  ShardSet shards(total_shards(), Shard(shard_size, 0));

  size_t offset = 0;
  for (uint32_t i = 0; i < data_shards_ && offset < length; ++i) {
    size_t n = std::min(shard_size, length - offset);
    std::memcpy(shards[i].data(), data + offset, n);
    offset += n;
  }
  return shards;
}

void ReedSolomon::encode_parity(ShardSet& shards) const {
  size_t shard_size = check_shards(shards, false);
  if (parity_shards_ == 0) {
    return;
  }

  std::vector<const uint8_t*> coefficients;
  std::vector<const uint8_t*> inputs;
  std::vector<uint8_t*> outputs;
  for (uint32_t i = 0; i < data_shards_; ++i) {
    inputs.push_back(shards[i].data());
  }
  for (uint32_t p = 0; p < parity_shards_; ++p) {
    coefficients.push_back(generator_.row(data_shards_ + p));
    outputs.push_back(shards[data_shards_ + p].data());
  }
  code_rows(coefficients, inputs, outputs, shard_size);
}

ShardSet ReedSolomon::encode(const std::vector<uint8_t>& segment) const {
  if (segment.empty()) {
    return ShardSet(total_shards());
  }
  ShardSet shards = split(segment.data(), segment.size());
  encode_parity(shards);
  return shards;
}

void ReedSolomon::code_rows(const std::vector<const uint8_t*>& coefficient_rows,
                            const std::vector<const uint8_t*>& inputs,
                            const std::vector<uint8_t*>& outputs,
                            size_t shard_size) {
  for (size_t out = 0; out < outputs.size(); ++out) {
    std::memset(outputs[out], 0, shard_size);
    for (size_t in = 0; in < inputs.size(); ++in) {
      GaloisField::mul_add_slice(coefficient_rows[out][in], inputs[in], outputs[out], shard_size);
    }
  }
}


//==============================================
// VERIFICATION AND RECOVERY
//==============================================

bool ReedSolomon::verify(const ShardSet& shards) const {
  size_t shard_size = check_shards(shards, false);

  ShardSet expected(shards.begin(), shards.begin() + data_shards_);
  expected.resize(total_shards(), Shard(shard_size, 0));
  encode_parity(expected);

  for (uint32_t p = data_shards_; p < total_shards(); ++p) {
    if (expected[p] != shards[p]) {
      BOOST_LOG_TRIVIAL(debug) << "Reed-Solomon: parity shard " << p << " does not match";
      return false;
    }
  }
  return true;
}

void ReedSolomon::reconstruct(ShardSet& shards) const {
  size_t shard_size = check_shards(shards, true);

  std::vector<uint32_t> present;
  bool data_complete = true;
  for (uint32_t i = 0; i < total_shards(); ++i) {
    if (!shards[i].empty()) {
      present.push_back(i);
    } else if (i < data_shards_) {
      data_complete = false;
    }
  }

  if (present.size() == total_shards()) {
    return;
  }

  if (present.size() < data_shards_) {
    BOOST_LOG_TRIVIAL(error) << "Reed-Solomon: only " << present.size() << " of "
                             << data_shards_ << " required shards present";
    throw TooFewShardsError(std::to_string(present.size()) + " shards present, " +
                            std::to_string(data_shards_) + " required");
  }

  BOOST_LOG_TRIVIAL(debug) << "Reed-Solomon: reconstructing " << (total_shards() - present.size())
                           << " missing shards of " << shard_size << " bytes";

  if (!data_complete) {
    // Rows of the generator for the first data_shards present pieces map data to those pieces
    Matrix sub(data_shards_, data_shards_);
    std::vector<const uint8_t*> inputs;
    for (uint32_t r = 0; r < data_shards_; ++r) {
      for (uint32_t c = 0; c < data_shards_; ++c) {
        sub.at(r, c) = generator_.at(present[r], c);
      }
      inputs.push_back(shards[present[r]].data());
    }
    Matrix decode = sub.invert();

    std::vector<const uint8_t*> coefficients;
    std::vector<uint8_t*> outputs;
    for (uint32_t i = 0; i < data_shards_; ++i) {
      if (shards[i].empty()) {
        shards[i].assign(shard_size, 0);
        coefficients.push_back(decode.row(i));
        outputs.push_back(shards[i].data());
      }
    }
    code_rows(coefficients, inputs, outputs, shard_size);
  }

  std::vector<const uint8_t*> coefficients;
  std::vector<const uint8_t*> inputs;
  std::vector<uint8_t*> outputs;
  for (uint32_t i = 0; i < data_shards_; ++i) {
    inputs.push_back(shards[i].data());
  }
  for (uint32_t p = data_shards_; p < total_shards(); ++p) {
    if (shards[p].empty()) {
      shards[p].assign(shard_size, 0);
      coefficients.push_back(generator_.row(p));
      outputs.push_back(shards[p].data());
    }
  }
  code_rows(coefficients, inputs, outputs, shard_size);
}

std::vector<uint8_t> ReedSolomon::join(const ShardSet& shards, size_t original_size) const {
  if (shards.size() < data_shards_) {
    throw TooFewShardsError("join needs all " + std::to_string(data_shards_) + " data shards");
  }

  std::vector<uint8_t> out;
  out.reserve(original_size);
  for (uint32_t i = 0; i < data_shards_ && out.size() < original_size; ++i) {
    if (shards[i].empty()) {
      throw TooFewShardsError("data shard " + std::to_string(i) + " is missing");
    }
    size_t n = std::min(shards[i].size(), original_size - out.size());
    out.insert(out.end(), shards[i].begin(), shards[i].begin() + n);
  }

  if (out.size() < original_size) {
    throw ShardSizeMismatchError("data shards hold fewer than " + std::to_string(original_size) + " bytes");
  }
  return out;
}

size_t ReedSolomon::check_shards(const ShardSet& shards, bool allow_missing) const {
  if (shards.size() != total_shards()) {
    throw std::invalid_argument("Reed-Solomon: expected " + std::to_string(total_shards()) +
                                " shards, got " + std::to_string(shards.size()));
  }

  size_t shard_size = 0;
  for (const auto& shard : shards) {
    if (shard.empty()) {
      if (!allow_missing) {
        throw ShardSizeMismatchError("empty shard in a complete shard set");
      }
      continue;
    }
    if (shard_size == 0) {
      shard_size = shard.size();
    } else if (shard.size() != shard_size) {
      throw ShardSizeMismatchError("shard of " + std::to_string(shard.size()) +
                                   " bytes, expected " + std::to_string(shard_size));
    }
  }

  if (shard_size == 0) {
    throw TooFewShardsError("no shards present");
  }
  return shard_size;
}


//==============================================
// REDUNDANCY ENCODER
//==============================================

RedundancyEncoder::RedundancyEncoder(const RedundancyConfig& config, RedundancyType type)
  : codec_(config.data_shards, config.parity_shards)
  , type_(type) {}

ShardSet RedundancyEncoder::encode(const std::vector<uint8_t>& segment) const {
  if (type_ == RedundancyType::Replicated) {
    return ShardSet(codec_.total_shards(), segment);
  }
  return codec_.encode(segment);
}

} // namespace shardroot::integrity
