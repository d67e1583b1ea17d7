#include "dsmr/frame_extractor.hpp"

#include <algorithm>

namespace dsmr {

void FrameExtractor::push_bytes(const uint8_t* data, size_t n) {
  if (n == 0) return;
  buf_.insert(buf_.end(), data, data + n);
}

FrameStatus FrameExtractor::pop(std::vector<uint8_t>& out_frame, size_t& out_len) {
  out_len = 0;
  if (available_bytes() == 0) return FrameStatus::NeedMoreData;

  const uint8_t* begin = buf_.data() + read_pos_;
  const uint8_t* end = buf_.data() + buf_.size();

  const uint8_t* start = std::find(begin, end, kStartMarker);
  if (start == end) {
    // No telegram has started. Keep the bytes, but never more than a frame's worth.
    return (available_bytes() > kMaxFrameSize) ? FrameStatus::Oversize : FrameStatus::NeedMoreData;
  }

  if (start != begin) {
    const size_t skip = static_cast<size_t>(start - begin);
    discarded_ += skip;
    consume(skip);
    begin = buf_.data() + read_pos_;
    end = buf_.data() + buf_.size();
    start = begin;
  }

  const uint8_t* bang = std::find(start, end, kEndMarker);
  if (bang == end) {
    return (available_bytes() > kMaxFrameSize) ? FrameStatus::Oversize : FrameStatus::NeedMoreData;
  }

  const size_t frame_len = static_cast<size_t>(bang - start) + kTrailerSize;
  if (frame_len > kMaxFrameSize) return FrameStatus::Oversize;
  if (available_bytes() < frame_len) return FrameStatus::NeedMoreData;

  out_frame.assign(start, start + frame_len);
  out_frame.resize(kMaxFrameSize, 0);
  out_len = frame_len;

  consume(frame_len);
  return FrameStatus::Complete;
}

void FrameExtractor::consume(size_t n) {
  read_pos_ += n;

  if (read_pos_ >= buf_.size()) {
    clear();
    return;
  }

  if (read_pos_ > (buf_.size() / 2)) {
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
    read_pos_ = 0;
  }
}

} // namespace dsmr
