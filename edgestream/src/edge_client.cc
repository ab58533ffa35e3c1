#include "edge_client.hh"

#include <utility>

#include "reassembler.hh"
#include "request_encoder.hh"

namespace EdgeStream {

EdgeDetectorClient::EdgeDetectorClient(std::shared_ptr<::grpc::Channel> channel,
                                       std::optional<std::chrono::milliseconds> timeout)
    : stub_(canny_edge::CannyEdgeDetector::NewStub(std::move(channel))), timeout_(timeout) {}

auto EdgeDetectorClient::detect_edges(const Thresholds &thresholds,
                                      std::span<const std::uint8_t> image) -> Bytes {
  ::grpc::ClientContext ctx;
  if (timeout_) {
    ctx.set_deadline(std::chrono::system_clock::now() + *timeout_);
  }

  auto stream = stub_->DetectEdges(&ctx);

  // The server answers only after the request side is closed, so write
  // everything first and then read.
  RequestEncoder encoder(thresholds, image);
  canny_edge::DetectEdgesRequest request;
  while (encoder.next(&request)) {
    if (!stream->Write(request)) {
      // Server already finished; Finish() below reports why.
      break;
    }
    request.Clear();
  }
  // A refused half-close also shows up in Finish().
  static_cast<void>(stream->WritesDone());

  Reassembler reassembler;
  canny_edge::DetectEdgesResponse response;
  while (stream->Read(&response)) {
    reassembler.feed(response);
  }
  return std::move(reassembler).finish(stream->Finish());
}

}  // namespace EdgeStream
