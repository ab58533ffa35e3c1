#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "canny_edge.pb.h"
#include "frames.hh"

namespace EdgeStream {

// Produces the request side of one DetectEdges call, one frame per next():
// the thresholds first, then the image in kMaxChunkSize slices.
// The payload is borrowed and must outlive the encoder. Single pass.
class RequestEncoder {
 public:
  RequestEncoder(const Thresholds &thresholds, std::span<const std::uint8_t> payload);

  // Fills `request` with the next frame. Returns false once exhausted.
  auto next(canny_edge::DetectEdgesRequest *request) -> bool;

  [[nodiscard]] auto chunk_count() const -> std::size_t;

 private:
  Thresholds thresholds_;
  std::span<const std::uint8_t> payload_;
  bool parameters_sent_ = false;
  std::size_t offset_ = 0;
};

}  // namespace EdgeStream
