#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

namespace shardroot {
namespace integrity {

// Splits a stream into fixed-size segments in a single forward pass.
// Every segment is segment_size bytes long except possibly the last one.
class Segmenter {
public:

  // ---- CONSTRUCTOR ----
  Segmenter(std::istream& input, uint64_t segment_size);


  // ---- SEGMENT ITERATION ----
  // Fills segment with the next slice of the stream. Returns false once the stream
  // is exhausted. Throws ReadError if the stream fails, discarding the partial segment.
  bool next(std::vector<uint8_t>& segment);


  // ---- GETTERS ----
  uint64_t bytes_consumed() const { return bytes_consumed_; }
  uint64_t segments_produced() const { return segments_produced_; }
  bool exhausted() const { return exhausted_; }

private:
  // ---- PARAMETERS ----
  std::istream& input_;
  uint64_t segment_size_;
  uint64_t bytes_consumed_{0};
  uint64_t segments_produced_{0};
  bool exhausted_{false};
};

// Reads up to length bytes and returns the count read; a short count means end of stream.
// Throws ReadError on a stream failure, whichever exception mask the caller set on input.
size_t read_block(std::istream& input, char* buffer, size_t length);

} // namespace integrity
} // namespace shardroot
