#include "integrity/segmenter.hpp"
#include "integrity/integrity_error.hpp"
#include <string>
#include <boost/log/trivial.hpp>

namespace shardroot {
namespace integrity {

Segmenter::Segmenter(std::istream& input, uint64_t segment_size)
  : input_(input)
  , segment_size_(segment_size) {
  if (segment_size_ == 0) {
    throw InvalidConfigError("segment size must be positive");
  }
}

bool Segmenter::next(std::vector<uint8_t>& segment) {
  segment.clear();
  if (exhausted_) {
    return false;
  }

  segment.resize(segment_size_);
  size_t bytes_read = 0;
  try {
    bytes_read = read_block(input_, reinterpret_cast<char*>(segment.data()), segment_size_);
  } catch (const ReadError& e) {
    segment.clear();
    exhausted_ = true;
    BOOST_LOG_TRIVIAL(error) << "Segmenter: Read failed in segment " << segments_produced_
                             << " after " << bytes_consumed_ << " bytes: " << e.what();
    throw;
  }

  // A short read is only legitimate at the end of the stream
  if (bytes_read < segment_size_) {
    exhausted_ = true;
  }

  if (bytes_read == 0) {
    segment.clear();
    return false;
  }

  segment.resize(bytes_read);
  bytes_consumed_ += bytes_read;
  segments_produced_++;

  BOOST_LOG_TRIVIAL(trace) << "Segmenter: Segment " << (segments_produced_ - 1)
                           << " holds " << bytes_read << " bytes";
  return true;
}


//==============================================
// STREAM READS
//==============================================

size_t read_block(std::istream& input, char* buffer, size_t length) {
  if (input.bad() || (input.fail() && !input.eof())) {
    throw ReadError("input stream is in a failed state");
  }

  try {
    input.read(buffer, static_cast<std::streamsize>(length));
  } catch (const std::ios_base::failure& e) {
    // With failbit in the exception mask the end of stream arrives as an exception
    if (input.bad() || !input.eof()) {
      throw ReadError(std::string("stream read failed: ") + e.what());
    }
  } catch (const std::exception& e) {
    // Rethrown from the stream buffer when badbit is in the exception mask
    throw ReadError(std::string("stream read failed: ") + e.what());
  }

  if (input.bad() || (input.fail() && !input.eof())) {
    throw ReadError("stream read failed after " + std::to_string(input.gcount()) + " bytes");
  }
  return static_cast<size_t>(input.gcount());
}

} // namespace integrity
} // namespace shardroot
