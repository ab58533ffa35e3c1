#include "response_streamer.hh"

#include <algorithm>

namespace EdgeStream {

auto ResponseStreamer::next(canny_edge::DetectEdgesResponse *response) -> bool {
  if (offset_ >= output_.size()) {
    return false;
  }
  const std::size_t len = std::min(kMaxChunkSize, output_.size() - offset_);
  response->set_image_chunk(output_.data() + offset_, len);
  offset_ += len;
  return true;
}

}  // namespace EdgeStream
