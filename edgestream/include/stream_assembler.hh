#pragma once

#include <cstddef>
#include <optional>

#include "canny_edge.pb.h"
#include "frames.hh"

namespace EdgeStream {

struct AssembledImage {
  Thresholds thresholds;
  Bytes image;
};

// Server-side state of one call. Chunks are appended in receipt order; there
// is no sequence number on the wire, so no reordering is attempted.
class StreamAssembler {
 public:
  // Throws ProtocolError for a frame with no payload or an oversized chunk.
  auto feed(const canny_edge::DetectEdgesRequest &request) -> void;

  // Call once the inbound stream has closed.
  // Throws ProtocolError("missing parameters") if no thresholds arrived.
  [[nodiscard]] auto finish() && -> AssembledImage;

  [[nodiscard]] auto parameter_frames() const -> std::size_t { return parameter_frames_; }
  [[nodiscard]] auto chunk_frames() const -> std::size_t { return chunk_frames_; }
  [[nodiscard]] auto buffered_bytes() const -> std::size_t { return buffer_.size(); }

 private:
  std::optional<Thresholds> thresholds_;
  Bytes buffer_;
  std::size_t parameter_frames_ = 0;
  std::size_t chunk_frames_ = 0;
};

}  // namespace EdgeStream
