#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dsmr
{

  // P1 telegram framing:
  //   /ISK5\2M550T-1012\r\n ... \r\n!ABCD\r\n
  // The frame runs from '/' to 7 bytes past '!' (the marker, 4 hex CRC digits, CRLF).
  constexpr uint8_t kStartMarker = '/';
  constexpr uint8_t kEndMarker = '!';
  constexpr size_t kTrailerSize = 7;
  constexpr size_t kMaxFrameSize = 2048;

  enum class FrameStatus
  {
    NeedMoreData,
    Complete,
    Oversize // protocol violation: drop the connection, not just the buffer
  };

  /**
   * @brief Stream splitter for P1 telegrams.
   *
   * Bytes are appended with push_bytes() and frames taken out with pop().
   * Consumed bytes are tracked by a read cursor and the buffer is compacted once the
   * cursor passes half of it, so a frame is never copied twice.
   *
   * Anything before a start marker is dropped (resync). The number of dropped bytes is
   * kept for diagnostics.
   */
  class FrameExtractor
  {
  public:
    FrameExtractor() { buf_.reserve(kMaxFrameSize); }

    void push_bytes(const uint8_t *data, size_t n);

    /**
     * @brief Try to take the next complete frame out of the buffer.
     *
     * On Complete, @p out_frame holds the frame zero-padded to kMaxFrameSize and
     * @p out_len the number of meaningful bytes in it.
     * On Oversize the buffer content is left as is; the owner is expected to clear()
     * it together with the connection.
     */
    FrameStatus pop(std::vector<uint8_t> &out_frame, size_t &out_len);

    void clear() noexcept
    {
      buf_.clear();
      read_pos_ = 0;
    }

    size_t available_bytes() const noexcept
    {
      return (read_pos_ <= buf_.size()) ? (buf_.size() - read_pos_) : 0;
    }

    // Total bytes dropped while searching for a start marker
    uint64_t discarded_bytes() const noexcept { return discarded_; }

  private:
    void consume(size_t n);

    std::vector<uint8_t> buf_;
    size_t read_pos_{0};
    uint64_t discarded_{0};
  };

} // namespace dsmr
