#include "dsmr/telegram_decoder.hpp"

#include <span>

namespace dsmr {

const char* to_string(DecodeStatus s) noexcept {
  switch (s) {
    case DecodeStatus::NeedMoreData:      return "need-more-data";
    case DecodeStatus::Telegram:          return "telegram";
    case DecodeStatus::Malformed:         return "malformed-telegram";
    case DecodeStatus::ProtocolViolation: return "protocol-violation";
  }
  return "unknown";
}

DecodeStatus TelegramDecoder::decode(Snapshot& out, std::string& error) {
  size_t len = 0;
  switch (rx_.pop(frame_, len)) {
    case FrameStatus::NeedMoreData:
      return DecodeStatus::NeedMoreData;
    case FrameStatus::Oversize:
      error = "received frame longer than " + std::to_string(kMaxFrameSize) + " bytes (" +
              std::to_string(rx_.available_bytes()) + " buffered)";
      return DecodeStatus::ProtocolViolation;
    case FrameStatus::Complete:
      break;
  }

  if (!parser_.parse(std::span<const uint8_t>(frame_), out, error)) {
    error = "failed to decode telegram: " + error;
    return DecodeStatus::Malformed;
  }
  return DecodeStatus::Telegram;
}

} // namespace dsmr
