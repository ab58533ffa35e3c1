#pragma once

#include <atomic>
#include <cstdint>

#include <grpcpp/grpcpp.h>

#include "canny_edge.grpc.pb.h"
#include "frames.hh"

namespace EdgeStream {

// gRPC binding of handle_detect_edges(). Holds no per-call state; every
// invocation runs on its own assembler, so calls proceed concurrently.
class CannyEdgeDetectorImpl final : public canny_edge::CannyEdgeDetector::Service {
 public:
  CannyEdgeDetectorImpl();
  explicit CannyEdgeDetectorImpl(Transformation transform);

  ::grpc::Status DetectEdges(
      ::grpc::ServerContext *context,
      ::grpc::ServerReaderWriter<canny_edge::DetectEdgesResponse,
                                 canny_edge::DetectEdgesRequest> *stream) override;

 private:
  Transformation transform_;
  std::atomic<std::uint64_t> next_call_id_{1};
};

}  // namespace EdgeStream
