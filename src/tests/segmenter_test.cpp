#include <gtest/gtest.h>
#include <sstream>
#include <vector>
#include "integrity/integrity_error.hpp"
#include "integrity/segmenter.hpp"
#include "test_utils.hpp"

using namespace shardroot::integrity;

class SegmenterTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
  }

  static std::vector<std::vector<uint8_t>> collect(std::istream& input, uint64_t segment_size) {
    Segmenter segmenter(input, segment_size);
    std::vector<std::vector<uint8_t>> segments;
    std::vector<uint8_t> segment;
    while (segmenter.next(segment)) {
      segments.push_back(segment);
    }
    return segments;
  }
};

TEST_F(SegmenterTest, EmptyStreamYieldsNoSegments) {
  std::stringstream input;
  Segmenter segmenter(input, 16);
  std::vector<uint8_t> segment;
  EXPECT_FALSE(segmenter.next(segment));
  EXPECT_TRUE(segment.empty());
  EXPECT_EQ(segmenter.bytes_consumed(), 0u);
  EXPECT_EQ(segmenter.segments_produced(), 0u);
  EXPECT_TRUE(segmenter.exhausted());
}

TEST_F(SegmenterTest, LastSegmentMayBeShort) {
  auto payload = make_payload(2500);
  std::stringstream input(to_string(payload));
  auto segments = collect(input, 1024);

  ASSERT_EQ(segments.size(), 3u);
  EXPECT_EQ(segments[0].size(), 1024u);
  EXPECT_EQ(segments[1].size(), 1024u);
  EXPECT_EQ(segments[2].size(), 452u);
  EXPECT_EQ(segments[2], std::vector<uint8_t>(payload.begin() + 2048, payload.end()));
}

TEST_F(SegmenterTest, ExactMultipleHasNoTrailingSegment) {
  std::stringstream input(to_string(make_payload(2048)));
  Segmenter segmenter(input, 1024);
  std::vector<uint8_t> segment;

  EXPECT_TRUE(segmenter.next(segment));
  EXPECT_TRUE(segmenter.next(segment));
  EXPECT_EQ(segment.size(), 1024u);
  EXPECT_FALSE(segmenter.next(segment));
  EXPECT_FALSE(segmenter.next(segment));
  EXPECT_EQ(segmenter.bytes_consumed(), 2048u);
  EXPECT_EQ(segmenter.segments_produced(), 2u);
}

TEST_F(SegmenterTest, SegmentsPreserveStreamOrder) {
  auto payload = make_payload(100);
  std::stringstream input(to_string(payload));
  auto segments = collect(input, 7);

  std::vector<uint8_t> joined;
  for (const auto& s : segments) {
    joined.insert(joined.end(), s.begin(), s.end());
  }
  EXPECT_EQ(joined, payload);
  EXPECT_EQ(segments.size(), 15u);
}

TEST_F(SegmenterTest, ReadFailureMidStreamRaisesReadError) {
  FailingStreamBuf buffer(to_string(make_payload(4096)), 1500);
  std::istream input(&buffer);
  Segmenter segmenter(input, 1024);
  std::vector<uint8_t> segment;

  EXPECT_TRUE(segmenter.next(segment));
  try {
    segmenter.next(segment);
    FAIL() << "expected ReadError";
  } catch (const ReadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::READ_ERROR);
  }
  // The partial segment is discarded
  EXPECT_TRUE(segment.empty());
  EXPECT_EQ(segmenter.segments_produced(), 1u);
}

TEST_F(SegmenterTest, BadStreamIsRejected) {
  std::stringstream input("data");
  input.setstate(std::ios::badbit);
  Segmenter segmenter(input, 4);
  std::vector<uint8_t> segment;
  EXPECT_THROW(segmenter.next(segment), ReadError);
}

TEST_F(SegmenterTest, ZeroSegmentSizeIsInvalid) {
  std::stringstream input("data");
  EXPECT_THROW(Segmenter(input, 0), InvalidConfigError);
}

TEST_F(SegmenterTest, ExceptionMaskDoesNotBreakEndOfStream) {
  auto payload = make_payload(1500);
  std::stringstream input(to_string(payload));
  input.exceptions(std::ios::failbit | std::ios::badbit);

  std::vector<std::vector<uint8_t>> segments;
  ASSERT_NO_THROW(segments = collect(input, 1024));
  ASSERT_EQ(segments.size(), 2u);
  EXPECT_EQ(segments[0].size(), 1024u);
  EXPECT_EQ(segments[1].size(), 476u);

  // Exact multiple: the final empty read also ends cleanly
  std::stringstream exact(to_string(make_payload(2048)));
  exact.exceptions(std::ios::failbit | std::ios::badbit);
  ASSERT_NO_THROW(segments = collect(exact, 1024));
  EXPECT_EQ(segments.size(), 2u);
}

TEST_F(SegmenterTest, ExceptionMaskStillReportsReadError) {
  FailingStreamBuf buffer(to_string(make_payload(4096)), 1500);
  std::istream input(&buffer);
  input.exceptions(std::ios::failbit | std::ios::badbit);
  Segmenter segmenter(input, 1024);
  std::vector<uint8_t> segment;

  EXPECT_TRUE(segmenter.next(segment));
  EXPECT_THROW(segmenter.next(segment), ReadError);
  EXPECT_TRUE(segmenter.exhausted());
}
