#include "stream_assembler.hh"

#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "request_encoder.hh"
#include "test_util.hh"

namespace EdgeStream {
namespace {

using Testing::chunk_frame;
using Testing::make_payload;
using Testing::parameters_frame;

TEST(StreamAssemblerTest, ReassemblesEncodedPayload) {
  Bytes payload = make_payload(4 * kMaxChunkSize + 99);
  RequestEncoder encoder({30, 90}, payload);
  StreamAssembler assembler;
  canny_edge::DetectEdgesRequest r;
  while (encoder.next(&r)) {
    assembler.feed(r);
    r.Clear();
  }
  EXPECT_EQ(assembler.chunk_frames(), 5u);

  AssembledImage out = std::move(assembler).finish();
  EXPECT_EQ(out.thresholds.min_threshold, 30);
  EXPECT_EQ(out.thresholds.max_threshold, 90);
  EXPECT_EQ(out.image, payload);
}

TEST(StreamAssemblerTest, MissingParametersIsProtocolError) {
  StreamAssembler assembler;
  assembler.feed(chunk_frame("abc"));
  assembler.feed(chunk_frame("def"));
  try {
    static_cast<void>(std::move(assembler).finish());
    FAIL() << "expected ProtocolError";
  } catch (const ProtocolError &e) {
    EXPECT_STREQ(e.what(), "missing parameters");
  }
}

TEST(StreamAssemblerTest, EmptyStreamIsMissingParameters) {
  StreamAssembler assembler;
  EXPECT_THROW(static_cast<void>(std::move(assembler).finish()), ProtocolError);
}

TEST(StreamAssemblerTest, ParametersWithoutChunksGiveEmptyImage) {
  StreamAssembler assembler;
  assembler.feed(parameters_frame(1, 2));
  AssembledImage out = std::move(assembler).finish();
  EXPECT_TRUE(out.image.empty());
  EXPECT_EQ(out.thresholds.max_threshold, 2);
}

TEST(StreamAssemblerTest, ParametersMayFollowChunks) {
  StreamAssembler assembler;
  assembler.feed(chunk_frame("ab"));
  assembler.feed(parameters_frame(3, 4));
  assembler.feed(chunk_frame("cd"));
  AssembledImage out = std::move(assembler).finish();
  EXPECT_EQ(std::string(out.image.begin(), out.image.end()), "abcd");
  EXPECT_EQ(out.thresholds.min_threshold, 3);
}

TEST(StreamAssemblerTest, LastParametersFrameWins) {
  StreamAssembler assembler;
  assembler.feed(parameters_frame(1, 2));
  assembler.feed(chunk_frame("x"));
  assembler.feed(parameters_frame(50, 150));
  EXPECT_EQ(assembler.parameter_frames(), 2u);
  AssembledImage out = std::move(assembler).finish();
  EXPECT_EQ(out.thresholds.min_threshold, 50);
  EXPECT_EQ(out.thresholds.max_threshold, 150);
}

// No sequence numbers on the wire: the assembler keeps receipt order and a
// scrambled delivery produces a scrambled image.
TEST(StreamAssemblerTest, TrustsReceiptOrder) {
  StreamAssembler assembler;
  assembler.feed(parameters_frame(1, 2));
  assembler.feed(chunk_frame("CC"));
  assembler.feed(chunk_frame("AA"));
  assembler.feed(chunk_frame("BB"));
  AssembledImage out = std::move(assembler).finish();
  EXPECT_EQ(std::string(out.image.begin(), out.image.end()), "CCAABB");
}

TEST(StreamAssemblerTest, RejectsEmptyFrame) {
  StreamAssembler assembler;
  EXPECT_THROW(assembler.feed(canny_edge::DetectEdgesRequest{}), ProtocolError);
}

TEST(StreamAssemblerTest, RejectsOversizedChunk) {
  StreamAssembler assembler;
  assembler.feed(chunk_frame(std::string(kMaxChunkSize, 'a')));
  EXPECT_THROW(assembler.feed(chunk_frame(std::string(kMaxChunkSize + 1, 'a'))), ProtocolError);
  EXPECT_EQ(assembler.buffered_bytes(), kMaxChunkSize);
}

TEST(StreamAssemblerTest, EmptyChunkIsAccepted) {
  StreamAssembler assembler;
  assembler.feed(parameters_frame(1, 2));
  assembler.feed(chunk_frame(""));
  EXPECT_EQ(assembler.chunk_frames(), 1u);
  EXPECT_TRUE(std::move(assembler).finish().image.empty());
}

}  // namespace
}  // namespace EdgeStream
