#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <utility>

#include <grpcpp/grpcpp.h>

#include "canny_edge.pb.h"
#include "frames.hh"
#include "response_streamer.hh"
#include "stream_assembler.hh"

namespace EdgeStream {

// What happened to one call, for logging.
struct CallSummary {
  std::size_t chunks_in = 0;
  std::size_t bytes_in = 0;
  std::size_t chunks_out = 0;
  std::size_t bytes_out = 0;
  bool transformed = false;
};

// Runs one DetectEdges call over `stream`:
//   drain requests -> transform once -> write response chunks.
// `Stream` needs `bool Read(DetectEdgesRequest *)` and
// `bool Write(const DetectEdgesResponse &)` (grpc::ServerReaderWriter fits).
// `is_cancelled` is polled after the inbound side closes and after the
// transformation returns. Nothing is written unless the whole call succeeds
// up to the first Write.
template <typename Stream, typename CancelCheck>
auto handle_detect_edges(Stream &stream, CancelCheck &&is_cancelled,
                         const Transformation &transform, CallSummary *summary = nullptr)
    -> ::grpc::Status {
  CallSummary local;
  CallSummary &s = summary != nullptr ? *summary : local;

  try {
    StreamAssembler assembler;
    canny_edge::DetectEdgesRequest request;
    while (stream.Read(&request)) {
      assembler.feed(request);
      request.Clear();
    }
    s.chunks_in = assembler.chunk_frames();
    s.bytes_in = assembler.buffered_bytes();

    // Read() also returns false when the client goes away.
    if (is_cancelled()) {
      return ::grpc::Status(::grpc::StatusCode::CANCELLED,
                            "call cancelled before the image was complete");
    }

    AssembledImage input = std::move(assembler).finish();
    Bytes output = transform(input.image, input.thresholds.min_threshold,
                             input.thresholds.max_threshold);
    s.transformed = true;

    if (is_cancelled()) {
      return ::grpc::Status(::grpc::StatusCode::CANCELLED,
                            "call cancelled during processing");
    }

    ResponseStreamer streamer(std::move(output));
    canny_edge::DetectEdgesResponse response;
    while (streamer.next(&response)) {
      if (!stream.Write(response)) {
        return ::grpc::Status(::grpc::StatusCode::CANCELLED,
                              "client stopped reading the result");
      }
      ++s.chunks_out;
      s.bytes_out += response.image_chunk().size();
    }
  } catch (const ProtocolError &e) {
    return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT,
                          std::string("Protocol error: ") + e.what());
  } catch (const std::exception &e) {
    // ProcessingError, or whatever else the transformation threw.
    return ::grpc::Status(::grpc::StatusCode::INTERNAL,
                          std::string("Error occurred: ") + e.what());
  }
  return ::grpc::Status::OK;
}

}  // namespace EdgeStream
