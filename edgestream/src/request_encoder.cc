#include "request_encoder.hh"

#include <algorithm>

namespace EdgeStream {

RequestEncoder::RequestEncoder(const Thresholds &thresholds,
                               std::span<const std::uint8_t> payload)
    : thresholds_(thresholds), payload_(payload) {}

auto RequestEncoder::next(canny_edge::DetectEdgesRequest *request) -> bool {
  if (!parameters_sent_) {
    auto *parameters = request->mutable_parameters();
    parameters->set_minthreshold(thresholds_.min_threshold);
    parameters->set_maxthreshold(thresholds_.max_threshold);
    parameters_sent_ = true;
    return true;
  }

  if (offset_ >= payload_.size()) {
    return false;
  }

  const std::size_t len = std::min(kMaxChunkSize, payload_.size() - offset_);
  const auto *begin = payload_.data() + offset_;
  request->mutable_image_chunk()->set_content(begin, len);
  offset_ += len;
  return true;
}

auto RequestEncoder::chunk_count() const -> std::size_t {
  return (payload_.size() + kMaxChunkSize - 1) / kMaxChunkSize;
}

}  // namespace EdgeStream
