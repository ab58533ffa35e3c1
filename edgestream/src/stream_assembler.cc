#include "stream_assembler.hh"

#include <string>
#include <utility>

namespace EdgeStream {

auto StreamAssembler::feed(const canny_edge::DetectEdgesRequest &request) -> void {
  switch (request.payload_case()) {
    case canny_edge::DetectEdgesRequest::kParameters: {
      // A repeated parameters frame replaces the earlier one.
      const auto &p = request.parameters();
      thresholds_ = Thresholds{p.minthreshold(), p.maxthreshold()};
      ++parameter_frames_;
      return;
    }
    case canny_edge::DetectEdgesRequest::kImageChunk: {
      const std::string &content = request.image_chunk().content();
      if (content.size() > kMaxChunkSize) {
        throw ProtocolError("image chunk of " + std::to_string(content.size()) +
                            " bytes exceeds the " + std::to_string(kMaxChunkSize) +
                            " byte limit");
      }
      buffer_.insert(buffer_.end(), content.begin(), content.end());
      ++chunk_frames_;
      return;
    }
    case canny_edge::DetectEdgesRequest::PAYLOAD_NOT_SET:
      break;
  }
  throw ProtocolError("request frame carries neither parameters nor an image chunk");
}

auto StreamAssembler::finish() && -> AssembledImage {
  if (!thresholds_) {
    throw ProtocolError("missing parameters");
  }
  return AssembledImage{*thresholds_, std::move(buffer_)};
}

}  // namespace EdgeStream
