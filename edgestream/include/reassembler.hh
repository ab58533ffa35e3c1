#pragma once

#include <cstddef>

#include <grpcpp/grpcpp.h>

#include "canny_edge.pb.h"
#include "frames.hh"

namespace EdgeStream {

// Client-side mirror of StreamAssembler for the response stream.
class Reassembler {
 public:
  auto feed(const canny_edge::DetectEdgesResponse &response) -> void;

  // Takes the final status of the call. A non-OK status throws RpcError and
  // the bytes gathered so far are dropped.
  [[nodiscard]] auto finish(const ::grpc::Status &status) && -> Bytes;

  [[nodiscard]] auto buffered_bytes() const -> std::size_t { return buffer_.size(); }

 private:
  Bytes buffer_;
};

}  // namespace EdgeStream
