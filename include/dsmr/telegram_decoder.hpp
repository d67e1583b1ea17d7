#pragma once
#include "dsmr/frame_extractor.hpp"
#include "dsmr/snapshot.hpp"
#include "dsmr/telegram_parser.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dsmr {

enum class DecodeStatus {
  NeedMoreData,
  Telegram,
  Malformed,         // frame dropped, stream still usable
  ProtocolViolation  // frame too large, reconnect
};

const char* to_string(DecodeStatus s) noexcept;

/**
 * @brief FrameExtractor + parser for one connection attempt.
 *
 * The parser is borrowed and must outlive the decoder.
 */
class TelegramDecoder {
public:
  explicit TelegramDecoder(const ITelegramParser& parser) : parser_(parser) {
    frame_.reserve(kMaxFrameSize);
  }

  void push_bytes(const uint8_t* data, size_t n) { rx_.push_bytes(data, n); }

  /**
   * @brief Decode the next telegram from buffered bytes.
   *
   * Call repeatedly after each push_bytes() until it returns NeedMoreData.
   * On Malformed or ProtocolViolation, @p error describes the problem.
   */
  DecodeStatus decode(Snapshot& out, std::string& error);

  // Drop all buffered bytes (new connection).
  void reset() noexcept { rx_.clear(); }

  uint64_t discarded_bytes() const noexcept { return rx_.discarded_bytes(); }

private:
  const ITelegramParser& parser_;
  FrameExtractor rx_;
  std::vector<uint8_t> frame_;
};

} // namespace dsmr
