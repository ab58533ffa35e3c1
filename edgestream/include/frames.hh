#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

namespace EdgeStream {

using Bytes = std::vector<std::uint8_t>;

// Upper bound for a single image chunk, both directions.
constexpr std::size_t kMaxChunkSize = 2048;

// Thresholds as sent in the first frame of a call.
struct Thresholds {
  int min_threshold = 0;
  int max_threshold = 0;
};

// bytes-in, thresholds, bytes-out. Throws ProcessingError on bad input.
using Transformation = std::function<Bytes(const Bytes &, int, int)>;

// Malformed or incomplete request frame sequence.
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string &what) : std::runtime_error(what) {}
};

// The transformation rejected the image or its thresholds.
class ProcessingError : public std::runtime_error {
 public:
  explicit ProcessingError(const std::string &what) : std::runtime_error(what) {}
};

// Non-OK status seen by the client at the end of a call.
class RpcError : public std::runtime_error {
 public:
  explicit RpcError(const ::grpc::Status &status)
      : std::runtime_error("gRPC failed: " + status.error_message()),
        code_(status.error_code()),
        detail_(status.error_message()) {}

  [[nodiscard]] auto code() const -> ::grpc::StatusCode { return code_; }
  [[nodiscard]] auto detail() const -> const std::string & { return detail_; }

 private:
  ::grpc::StatusCode code_;
  std::string detail_;
};

}  // namespace EdgeStream
