#include "reassembler.hh"

#include <string>
#include <utility>

namespace EdgeStream {

auto Reassembler::feed(const canny_edge::DetectEdgesResponse &response) -> void {
  const std::string &chunk = response.image_chunk();
  buffer_.insert(buffer_.end(), chunk.begin(), chunk.end());
}

auto Reassembler::finish(const ::grpc::Status &status) && -> Bytes {
  if (!status.ok()) {
    buffer_.clear();
    throw RpcError(status);
  }
  return std::move(buffer_);
}

}  // namespace EdgeStream
