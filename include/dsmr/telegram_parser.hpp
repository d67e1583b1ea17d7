#pragma once
#include "dsmr/snapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace dsmr {

/**
 * @brief Turns one complete frame into a Snapshot.
 *
 * Implementations must be pure and deterministic: the same frame always gives the same
 * result, and any frame handed over by FrameExtractor yields either a Snapshot or an
 * error text (never an exception).
 */
class ITelegramParser {
public:
  virtual ~ITelegramParser() noexcept = default;

  virtual bool parse(std::span<const uint8_t> frame, Snapshot& out, std::string& error) const = 0;
};

/**
 * @brief DSMR 5.0.2 P1 telegram parser.
 *
 * Checks the CRC16 footer, then walks the OBIS lines. Unknown OBIS references are
 * skipped; a known reference with a malformed value fails the whole telegram.
 */
class Dsmr5Parser final : public ITelegramParser {
public:
  bool parse(std::span<const uint8_t> frame, Snapshot& out, std::string& error) const override;
};

// CRC16/ARC (poly 0xA001 reflected, init 0), as used by the P1 footer.
[[nodiscard]] uint16_t crc16(std::span<const uint8_t> data) noexcept;

} // namespace dsmr
