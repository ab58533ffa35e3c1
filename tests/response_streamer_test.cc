#include "response_streamer.hh"

#include <gtest/gtest.h>

#include <cstddef>
#include <vector>

#include "test_util.hh"

namespace EdgeStream {
namespace {

using Testing::make_payload;

TEST(ResponseStreamerTest, EmptyOutputYieldsNoFrames) {
  ResponseStreamer streamer(Bytes{});
  canny_edge::DetectEdgesResponse r;
  EXPECT_EQ(streamer.chunk_count(), 0u);
  EXPECT_FALSE(streamer.next(&r));
}

TEST(ResponseStreamerTest, SplitsInOrderWithShortTail) {
  Bytes output = make_payload(2 * kMaxChunkSize + 5);
  ResponseStreamer streamer(output);
  EXPECT_EQ(streamer.chunk_count(), 3u);

  Bytes joined;
  std::vector<std::size_t> sizes;
  canny_edge::DetectEdgesResponse r;
  while (streamer.next(&r)) {
    sizes.push_back(r.image_chunk().size());
    joined.insert(joined.end(), r.image_chunk().begin(), r.image_chunk().end());
  }
  EXPECT_EQ(sizes, (std::vector<std::size_t>{kMaxChunkSize, kMaxChunkSize, 5}));
  EXPECT_EQ(joined, output);
}

TEST(ResponseStreamerTest, ExactMultipleHasNoEmptyTail) {
  ResponseStreamer streamer(make_payload(kMaxChunkSize));
  canny_edge::DetectEdgesResponse r;
  ASSERT_TRUE(streamer.next(&r));
  EXPECT_EQ(r.image_chunk().size(), kMaxChunkSize);
  EXPECT_FALSE(streamer.next(&r));
}

}  // namespace
}  // namespace EdgeStream
