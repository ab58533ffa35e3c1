#pragma once

#include <cstddef>
#include <utility>

#include "canny_edge.pb.h"
#include "frames.hh"

namespace EdgeStream {

// Splits a finished result into response chunks. An empty result yields no
// frames at all; completion is signalled by the status, not by a frame.
class ResponseStreamer {
 public:
  explicit ResponseStreamer(Bytes output) : output_(std::move(output)) {}

  auto next(canny_edge::DetectEdgesResponse *response) -> bool;

  [[nodiscard]] auto chunk_count() const -> std::size_t {
    return (output_.size() + kMaxChunkSize - 1) / kMaxChunkSize;
  }

 private:
  Bytes output_;
  std::size_t offset_ = 0;
};

}  // namespace EdgeStream
