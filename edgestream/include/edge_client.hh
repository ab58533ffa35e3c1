#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

#include <grpcpp/grpcpp.h>

#include "canny_edge.grpc.pb.h"
#include "frames.hh"

namespace EdgeStream {

//---------------------------------------------------------------------
//  gRPC edge-detection client (blocking)
//---------------------------------------------------------------------
class EdgeDetectorClient {
 public:
  explicit EdgeDetectorClient(std::shared_ptr<::grpc::Channel> channel,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // Streams the thresholds and the image, returns the reassembled result.
  // Throws RpcError when the call ends with a non-OK status.
  [[nodiscard]] auto detect_edges(const Thresholds &thresholds,
                                  std::span<const std::uint8_t> image) -> Bytes;

 private:
  std::unique_ptr<canny_edge::CannyEdgeDetector::Stub> stub_;
  std::optional<std::chrono::milliseconds> timeout_;
};

}  // namespace EdgeStream
