#include "edge_service.hh"

#include <iostream>
#include <utility>

#include "call_handler.hh"
#include "canny.hh"

namespace EdgeStream {

CannyEdgeDetectorImpl::CannyEdgeDetectorImpl() : transform_(detect_edges) {}

CannyEdgeDetectorImpl::CannyEdgeDetectorImpl(Transformation transform)
    : transform_(std::move(transform)) {}

::grpc::Status CannyEdgeDetectorImpl::DetectEdges(
    ::grpc::ServerContext *context,
    ::grpc::ServerReaderWriter<canny_edge::DetectEdgesResponse, canny_edge::DetectEdgesRequest>
        *stream) {
  const std::uint64_t id = next_call_id_.fetch_add(1, std::memory_order_relaxed);

  CallSummary summary;
  ::grpc::Status status = handle_detect_edges(
      *stream, [context] { return context->IsCancelled(); }, transform_, &summary);

  if (status.ok()) {
    std::cout << "[call " << id << "] " << context->peer() << ": " << summary.bytes_in
              << " bytes in " << summary.chunks_in << " chunks -> " << summary.bytes_out
              << " bytes in " << summary.chunks_out << " chunks" << std::endl;
  } else {
    std::cerr << "[call " << id << "] " << context->peer() << ": failed ("
              << status.error_code() << "): " << status.error_message() << std::endl;
  }
  return status;
}

}  // namespace EdgeStream
